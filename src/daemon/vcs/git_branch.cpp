#include "vcs/git_branch.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

void reap(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }
}

} // namespace

std::expected<CommandResult, std::string> run_command(const std::vector<std::string>& argv,
                                                      std::chrono::milliseconds timeout) {
    if (argv.empty()) return std::unexpected(std::string("empty command"));

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(pipefd[0]);
        ::close(pipefd[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout to pipe, stderr discarded, daemon's signal mask dropped
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::dup2(pipefd[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) ::dup2(devnull, STDERR_FILENO);
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    ::close(pipefd[1]);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string output;
    bool timed_out = false;

    pollfd pfd{.fd = pipefd[0], .events = POLLIN, .revents = 0};
    while (true) {
        int ret = ::poll(&pfd, 1, remaining_ms(deadline));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            timed_out = true;
            break;
        }

        char buf[512];
        ssize_t n = ::read(pipefd[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(pipefd[0]);

    if (timed_out) {
        ::kill(pid, SIGKILL);
    }

    int status = 0;
    reap(pid, status);

    if (timed_out) {
        return std::unexpected(argv[0] + " timed out");
    }

    CommandResult result;
    result.output = std::move(output);
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

std::optional<std::string> git_branch(const std::string& dir, std::chrono::milliseconds timeout) {
    if (dir.empty()) return std::nullopt;

    auto res = run_command({"git", "-C", dir, "symbolic-ref", "--short", "HEAD"}, timeout);
    if (!res || res->exit_code != 0) return std::nullopt;

    auto& out = res->output;
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r' || out.back() == ' ')) {
        out.pop_back();
    }
    if (out.empty()) return std::nullopt;
    return out;
}
