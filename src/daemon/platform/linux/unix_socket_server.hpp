#pragma once

#include "platform/ipc_server.hpp"

#include <string>
#include <vector>

// Newline-delimited JSON over a non-blocking AF_UNIX stream socket.
class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadResult read_command(int client_fd, nlohmann::json& cmd) override;
    bool has_buffered_command(int client_fd) const override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    int server_fd_ = -1;
    std::string socket_path_;

    struct ClientBuffer {
        int fd;
        std::string buf;
    };
    std::vector<ClientBuffer> clients_;

    ClientBuffer* find_client(int fd);
    const ClientBuffer* find_client(int fd) const;
};
