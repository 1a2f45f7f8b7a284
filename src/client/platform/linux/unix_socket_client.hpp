#pragma once

#include "platform/ipc_client.hpp"

#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = 5000) override;
    void close() override;

private:
    int fd_ = -1;
    std::string buf_; // bytes past the last consumed newline
};
