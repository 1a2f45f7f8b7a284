#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class SessionStatus { Idle, Running, Done, Failed, Killed };

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr const char* kDefaultGroup = "General";

// exit_code recorded for a session terminated from the board (-SIGTERM).
inline constexpr int kKilledExitCode = -15;

struct Session {
    std::string id;
    std::string name;
    SessionStatus status = SessionStatus::Idle;

    std::optional<int> shell_pid;
    std::optional<int> agent_pid;
    std::optional<std::string> working_dir;
    std::string group = kDefaultGroup;

    TimePoint created_at{};
    std::optional<TimePoint> work_started_at;
    std::optional<TimePoint> finished_at;
    std::optional<int> exit_code;
    TimePoint status_changed_at{};

    int cpu_high_streak = 0;
    int cpu_low_streak = 0;
    double last_cpu_percent = 0.0;
};

// A requested status change. Applied by the registry, which owns the timestamps.
struct Transition {
    SessionStatus status;
    std::optional<int> exit_code;
};

const char* to_string(SessionStatus status);
std::optional<SessionStatus> parse_status(std::string_view text);

bool is_terminal(SessionStatus status);
inline bool is_active(SessionStatus status) { return !is_terminal(status); }

// Display bucket for a working directory: its base name, or the default group
// when the directory is unknown, blank or the filesystem root.
std::string group_for(const std::optional<std::string>& working_dir);

double to_epoch_seconds(TimePoint tp);

nlohmann::json to_json(const Session& session);
