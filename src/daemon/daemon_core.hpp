#pragma once

#include "config.hpp"
#include "platform/process_tree.hpp"
#include "session_registry.hpp"
#include "storage/history_db.hpp"
#include "storage/recent_dirs.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Portable daemon logic: the IPC command handlers, startup discovery and
// archiving of finished sessions. Owns no threads; the platform event loop
// drives it.
class DaemonCore {
public:
    DaemonCore(Config config, bool verbose, SessionRegistry& registry, ProcessTree& tree);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Opens history, loads recent directories and runs discovery when enabled.
    bool init(int self_pid);

    // Dispatches on the request's "cmd" field; a missing or non-string
    // field is answered as an unknown command.
    nlohmann::json handle_request(const nlohmann::json& request);

    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Stores finished sessions in the history database.
    void archive(const std::vector<Session>& sessions);

    // Archives every finished session still held by the registry.
    void shutdown();

    const Config& config() const { return config_; }
    RecentDirs& recent_dirs() { return recent_dirs_; }

private:
    nlohmann::json handle_create(const nlohmann::json& cmd);
    nlohmann::json handle_update(const nlohmann::json& cmd);
    nlohmann::json handle_list(const nlohmann::json& cmd);
    nlohmann::json handle_kill(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_recent(const nlohmann::json& cmd);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    int self_pid_ = 0;

    SessionRegistry& registry_;
    ProcessTree& tree_;

    HistoryDb history_db_;
    RecentDirs recent_dirs_;
};
