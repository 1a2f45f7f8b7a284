#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace {

// A client that sends this much without a newline is not speaking our protocol.
constexpr size_t kMaxLineBytes = 64 * 1024;
constexpr int kSendTimeoutMs = 1000;

} // namespace

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    socket_path_ = endpoint;

    // Remove stale socket
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long");
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (::listen(server_fd_, 16) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

ReadResult UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadResult::Closed;

    // Serve requests already buffered before touching the socket again.
    if (client->buf.find('\n') == std::string::npos) {
        char buf[4096];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            return ReadResult::Pending;
        }
        if (n <= 0) return ReadResult::Closed;
        client->buf.append(buf, static_cast<size_t>(n));
    }

    auto pos = client->buf.find('\n');
    if (pos == std::string::npos) {
        return client->buf.size() > kMaxLineBytes ? ReadResult::Closed : ReadResult::Pending;
    }

    std::string line = client->buf.substr(0, pos);
    client->buf.erase(0, pos + 1);

    try {
        cmd = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        return ReadResult::Closed;
    }
    if (!cmd.is_object()) return ReadResult::Closed;
    return ReadResult::Message;
}

bool UnixSocketServer::has_buffered_command(int client_fd) const {
    auto* client = find_client(client_fd);
    return client && client->buf.find('\n') != std::string::npos;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    // Paths are raw bytes; invalid UTF-8 is replaced rather than thrown on.
    std::string msg =
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    size_t sent = 0;
    while (sent < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + sent, msg.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                // Slow reader with a full socket buffer: give it a moment.
                pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
                if (::poll(&pfd, 1, kSendTimeoutMs) > 0) continue;
            }
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}

const UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) const {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
