#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

// Client-side copy of one entry of the daemon's `list` response.
struct SessionView {
    std::string id;
    std::string name;
    std::string status;
    std::string group = "General";
    double created_at = 0.0;
    std::optional<double> work_started_at;
    std::optional<double> finished_at;
    std::optional<int> exit_code;

    static SessionView from_json(const nlohmann::json& j);
};

struct BoardGroup {
    std::string name;
    std::vector<SessionView> sessions;
};

// Position in the board's row order; unknown statuses sort last.
int status_rank(const std::string& status);

bool is_finished(const std::string& status);

// Active sessions plus finished ones younger than ttl_s, grouped and sorted.
std::vector<BoardGroup> arrange_board(const std::vector<SessionView>& sessions, double now,
                                      double ttl_s);

// "42s", "3m07s" or "2h05m".
std::string format_elapsed(double seconds);

// Elapsed time shown for a row: running time since work started, waiting
// time since registration, or total lifetime once finished.
double row_elapsed(const SessionView& s, double now);

// First max_chars code points of a UTF-8 string; never splits a sequence.
std::string clip_utf8(const std::string& s, size_t max_chars);

std::string status_label(const SessionView& s);

std::string render_board(const std::vector<BoardGroup>& groups, double now,
                         int total_sessions);
