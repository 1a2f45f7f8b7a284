#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    virtual bool recv(nlohmann::json& response, int timeout_ms = 5000) = 0;
    virtual void close() = 0;

    // One request/response exchange on the open connection.
    std::expected<nlohmann::json, std::string> call(const nlohmann::json& cmd,
                                                    int timeout_ms = 5000) {
        if (!send(cmd)) return std::unexpected("failed to send command");
        nlohmann::json response;
        if (!recv(response, timeout_ms)) return std::unexpected("no response from daemon");
        return response;
    }
};
