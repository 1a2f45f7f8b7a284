#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadResult {
    Message,  // cmd holds one complete request
    Pending,  // partial line buffered, wait for more data
    Closed,   // peer hung up or sent something unusable
};

class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadResult read_command(int client_fd, nlohmann::json& cmd) = 0;
    // True when a complete request is already buffered for client_fd.
    virtual bool has_buffered_command(int client_fd) const = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
