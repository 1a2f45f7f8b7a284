#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <unistd.h>

namespace platform {

void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0); // parent exits

    if (setsid() < 0) {
        std::println(stderr, "setsid() failed: {}", std::strerror(errno));
        _exit(1);
    }

    // Fork again so the session leader's child can never reacquire a terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Redirect stdio to /dev/null
    if (!std::freopen("/dev/null", "r", stdin) ||
        !std::freopen("/dev/null", "w", stdout) ||
        !std::freopen("/dev/null", "w", stderr)) {
        _exit(1);
    }
}

} // namespace platform
