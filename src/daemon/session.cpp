#include "session.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle: return "IDLE";
        case SessionStatus::Running: return "RUNNING";
        case SessionStatus::Done: return "DONE";
        case SessionStatus::Failed: return "FAILED";
        case SessionStatus::Killed: return "KILLED";
    }
    return "IDLE";
}

std::optional<SessionStatus> parse_status(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "IDLE") return SessionStatus::Idle;
    if (upper == "RUNNING") return SessionStatus::Running;
    if (upper == "DONE") return SessionStatus::Done;
    if (upper == "FAILED") return SessionStatus::Failed;
    if (upper == "KILLED") return SessionStatus::Killed;
    return std::nullopt;
}

bool is_terminal(SessionStatus status) {
    return status == SessionStatus::Done ||
           status == SessionStatus::Failed ||
           status == SessionStatus::Killed;
}

std::string group_for(const std::optional<std::string>& working_dir) {
    if (!working_dir) return kDefaultGroup;

    auto first = working_dir->find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return kDefaultGroup;
    auto last = working_dir->find_last_not_of(" \t\r\n");
    std::string trimmed = working_dir->substr(first, last - first + 1);
    if (trimmed == "/") return kDefaultGroup;

    fs::path p = fs::path(trimmed).lexically_normal();
    // "/home/u/proj/" normalizes with an empty filename.
    if (p.filename().empty()) p = p.parent_path();

    auto name = p.filename().string();
    if (name.empty() || name == "." || name == "/") return kDefaultGroup;
    return name;
}

double to_epoch_seconds(TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

nlohmann::json to_json(const Session& s) {
    auto opt_time = [](const std::optional<TimePoint>& tp) -> nlohmann::json {
        if (!tp) return nullptr;
        return to_epoch_seconds(*tp);
    };
    auto opt_int = [](const std::optional<int>& v) -> nlohmann::json {
        if (!v) return nullptr;
        return *v;
    };

    return {
        {"id", s.id},
        {"name", s.name},
        {"status", to_string(s.status)},
        {"shell_pid", opt_int(s.shell_pid)},
        {"agent_pid", opt_int(s.agent_pid)},
        {"cwd", s.working_dir ? nlohmann::json(*s.working_dir) : nlohmann::json(nullptr)},
        {"group", s.group},
        {"created_at", to_epoch_seconds(s.created_at)},
        {"work_started_at", opt_time(s.work_started_at)},
        {"finished_at", opt_time(s.finished_at)},
        {"exit_code", opt_int(s.exit_code)},
        {"cpu_percent", s.last_cpu_percent},
        {"status_changed_at", to_epoch_seconds(s.status_changed_at)},
    };
}
