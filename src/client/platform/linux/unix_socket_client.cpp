#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient() = default;

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    close();

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const nlohmann::json& cmd) {
    if (fd_ < 0) return false;
    std::string msg = cmd.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = ::send(fd_, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

bool UnixSocketClient::recv(nlohmann::json& response, int timeout_ms) {
    if (fd_ < 0) return false;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};

    auto pos = buf_.find('\n');
    while (pos == std::string::npos) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) return false;

        int ret = ::poll(&pfd, 1, static_cast<int>(left));
        if (ret < 0 && errno == EINTR) continue;
        if (ret <= 0) return false;

        char tmp[4096];
        ssize_t n = ::recv(fd_, tmp, sizeof(tmp), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;

        buf_.append(tmp, static_cast<size_t>(n));
        pos = buf_.find('\n');
    }

    std::string line = buf_.substr(0, pos);
    buf_.erase(0, pos + 1);
    try {
        response = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return false;
    }
    return true;
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    buf_.clear();
}
