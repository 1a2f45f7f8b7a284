#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"
#include "session_discovery.hpp"
#include "vcs/git_branch.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <optional>
#include <print>

namespace {

std::optional<std::string> opt_string(const nlohmann::json& cmd, const char* key) {
    if (!cmd.contains(key) || !cmd[key].is_string()) return std::nullopt;
    return cmd[key].get<std::string>();
}

// Non-integer values read as absent; integers that do not fit an int are an error.
std::expected<std::optional<int>, std::string> opt_int(const nlohmann::json& cmd,
                                                       const char* key) {
    if (!cmd.contains(key) || !cmd[key].is_number_integer()) return std::optional<int>{};

    const auto& v = cmd[key];
    constexpr auto kMax = std::numeric_limits<int>::max();
    constexpr auto kMin = std::numeric_limits<int>::min();
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(kMax)) {
            return std::unexpected(std::format("{} out of range", key));
        }
        return std::optional<int>(static_cast<int>(u));
    }
    auto i = v.get<std::int64_t>();
    if (i < kMin || i > kMax) return std::unexpected(std::format("{} out of range", key));
    return std::optional<int>(static_cast<int>(i));
}

nlohmann::json error(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose, SessionRegistry& registry, ProcessTree& tree)
    : config_(std::move(config)), verbose_(verbose),
      registry_(registry), tree_(tree),
      recent_dirs_(config_.recent.max_entries) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init(int self_pid) {
    self_pid_ = self_pid;

    auto data = platform::data_dir();
    if (data.empty()) data = "/tmp/agent-board";

    std::string db_path = !config_.storage.history_db.empty()
        ? config_.storage.history_db : data + "/history.db";
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    std::string recent_path = !config_.storage.recent_file.empty()
        ? config_.storage.recent_file : data + "/recent_dirs";
    if (!recent_dirs_.load(recent_path)) {
        std::println(stderr, "Warning: recent directories unreadable, starting empty");
    }

    if (config_.discovery.enabled) {
        auto timeout = std::chrono::milliseconds(config_.monitor.query_timeout_ms);
        SessionDiscovery discovery(registry_, tree_, recent_dirs_, config_.discovery,
                                   [timeout](const std::string& dir) { return git_branch(dir, timeout); },
                                   verbose_);
        int found = discovery.run(self_pid);
        log(std::format("discovery registered {} session(s)", found));
    }

    return true;
}

nlohmann::json DaemonCore::handle_request(const nlohmann::json& request) {
    return handle_command(opt_string(request, "cmd").value_or(""), request);
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "create") return handle_create(cmd);
    if (cmd_str == "update") return handle_update(cmd);
    if (cmd_str == "list") return handle_list(cmd);
    if (cmd_str == "kill") return handle_kill(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "recent") return handle_recent(cmd);
    return error("unknown command");
}

nlohmann::json DaemonCore::handle_create(const nlohmann::json& cmd) {
    auto id = opt_string(cmd, "id");
    if (!id || id->empty()) return error("missing id");

    auto shell_pid = opt_int(cmd, "shell_pid");
    if (!shell_pid) return error(shell_pid.error());
    if (*shell_pid && **shell_pid <= 0) return error("invalid shell_pid");

    NewSession fresh{
        .id = *id,
        .name = opt_string(cmd, "name").value_or(*id),
        .shell_pid = *shell_pid,
        .agent_pid = std::nullopt,
        .working_dir = opt_string(cmd, "cwd"),
    };
    auto cwd = fresh.working_dir;

    if (registry_.register_session(std::move(fresh))) {
        log(std::format("session {} re-registered, previous record replaced", *id));
    } else {
        log(std::format("session {} registered", *id));
    }

    if (cwd && !cwd->empty()) recent_dirs_.promote(*cwd);

    return {{"status", "ok"}};
}

nlohmann::json DaemonCore::handle_update(const nlohmann::json& cmd) {
    auto id = opt_string(cmd, "id");
    if (!id || id->empty()) return error("missing id");

    auto status_str = opt_string(cmd, "status");
    auto status = status_str ? parse_status(*status_str) : std::nullopt;
    if (!status) return error("invalid status");

    auto exit_code = opt_int(cmd, "exit_code");
    if (!exit_code) return error(exit_code.error());

    auto res = registry_.update_status(*id, *status, *exit_code);
    if (!res) return error("not found");

    log(std::format("session {} reported {}", *id, to_string(*status)));
    return {{"status", "ok"}};
}

nlohmann::json DaemonCore::handle_list(const nlohmann::json& /*cmd*/) {
    auto sessions = registry_.snapshot();

    nlohmann::json resp = {
        {"status", "ok"},
        {"total_sessions", registry_.total_created()},
        {"sessions", nlohmann::json::array()},
    };
    for (const auto& s : sessions) {
        resp["sessions"].push_back(to_json(s));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_kill(const nlohmann::json& cmd) {
    auto id = opt_string(cmd, "id");
    if (!id || id->empty()) return error("missing id");

    auto session = registry_.get(*id);
    if (!session) return error("not found");
    if (!is_active(session->status)) return error("session not active");

    KillReport total;
    auto kill = [&](std::optional<int> pid) {
        if (!pid || *pid <= 1 || *pid == self_pid_) return;
        // The daemon may itself run under the session's shell.
        auto r = tree_.kill_tree(*pid, self_pid_);
        total.attempted += r.attempted;
        total.failed += r.failed;
        for (auto& e : r.errors) total.errors.push_back(std::move(e));
    };

    // Agent first so the shell does not get a chance to report it as exited.
    kill(session->agent_pid);
    kill(session->shell_pid);

    for (const auto& e : total.errors) log(std::format("kill {}: {}", *id, e));

    // The session counts as killed even when part of the tree resisted.
    if (!registry_.update_status(*id, SessionStatus::Killed, kKilledExitCode)) {
        return error("not found");
    }

    log(std::format("session {} killed ({} signalled, {} failed)", *id,
                    total.attempted - total.failed, total.failed));
    return {{"status", "ok"}, {"attempted", total.attempted}, {"failed", total.failed}};
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    auto limit_field = opt_int(cmd, "limit");
    if (!limit_field) return error(limit_field.error());
    // SQLite treats a negative LIMIT as unbounded.
    int limit = std::max(0, limit_field->value_or(10));
    auto entries = history_db_.recent(limit);

    auto opt = [](const auto& v) -> nlohmann::json {
        if (!v) return nullptr;
        return *v;
    };

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.session_id},
            {"name", e.name},
            {"status", e.status},
            {"exit_code", opt(e.exit_code)},
            {"cwd", e.working_dir},
            {"group", e.group},
            {"created_at", e.created_at},
            {"work_started_at", opt(e.work_started_at)},
            {"finished_at", opt(e.finished_at)},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_recent(const nlohmann::json& /*cmd*/) {
    return {{"status", "ok"}, {"directories", recent_dirs_.entries()}};
}

void DaemonCore::archive(const std::vector<Session>& sessions) {
    for (const auto& s : sessions) {
        if (!history_db_.insert(s)) {
            log(std::format("could not archive session {}", s.id));
        }
    }
}

void DaemonCore::shutdown() {
    // Far-future cutoff: everything already finished.
    auto finished = registry_.prune_finished(TimePoint::max());
    if (!finished.empty()) {
        log(std::format("archiving {} finished session(s)", finished.size()));
        archive(finished);
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[agent-board] {}", msg);
    }
}
