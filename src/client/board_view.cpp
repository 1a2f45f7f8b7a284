#include "board_view.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <map>

namespace {

std::optional<double> opt_double(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) return std::nullopt;
    return j[key].get<double>();
}

std::string lower(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

// Names are clipped so the status column stays aligned.
constexpr size_t kNameWidth = 26;

} // namespace

SessionView SessionView::from_json(const nlohmann::json& j) {
    SessionView v;
    v.id = j.value("id", "");
    v.name = j.value("name", "");
    v.status = j.value("status", "");
    if (j.contains("group") && j["group"].is_string()) v.group = j["group"].get<std::string>();
    v.created_at = opt_double(j, "created_at").value_or(0.0);
    v.work_started_at = opt_double(j, "work_started_at");
    v.finished_at = opt_double(j, "finished_at");
    if (j.contains("exit_code") && j["exit_code"].is_number_integer()) {
        v.exit_code = j["exit_code"].get<int>();
    }
    return v;
}

int status_rank(const std::string& status) {
    static const std::map<std::string, int> order = {
        {"RUNNING", 0}, {"IDLE", 1}, {"DONE", 2}, {"KILLED", 3}, {"FAILED", 4},
    };
    auto it = order.find(status);
    return it != order.end() ? it->second : 99;
}

bool is_finished(const std::string& status) {
    return status == "DONE" || status == "FAILED" || status == "KILLED";
}

std::vector<BoardGroup> arrange_board(const std::vector<SessionView>& sessions, double now,
                                      double ttl_s) {
    std::vector<BoardGroup> groups;
    for (const auto& s : sessions) {
        if (is_finished(s.status)) {
            if (!s.finished_at || now - *s.finished_at >= ttl_s) continue;
        } else if (s.status != "IDLE" && s.status != "RUNNING") {
            continue;
        }

        auto it = std::ranges::find(groups, s.group, &BoardGroup::name);
        if (it == groups.end()) {
            groups.push_back({s.group, {}});
            it = std::prev(groups.end());
        }
        it->sessions.push_back(s);
    }

    for (auto& g : groups) {
        std::ranges::stable_sort(g.sessions, {}, [](const SessionView& s) {
            return status_rank(s.status);
        });
    }

    auto best = [](const BoardGroup& g) {
        return g.sessions.empty() ? 99 : status_rank(g.sessions.front().status);
    };
    std::ranges::sort(groups, [&](const BoardGroup& a, const BoardGroup& b) {
        int ra = best(a), rb = best(b);
        if (ra != rb) return ra < rb;
        return lower(a.name) < lower(b.name);
    });
    return groups;
}

std::string format_elapsed(double seconds) {
    long total = seconds > 0 ? static_cast<long>(seconds) : 0;
    long s = total % 60;
    long m = (total / 60) % 60;
    long h = total / 3600;
    if (h > 0) return std::format("{}h{:02}m", h, m);
    if (m > 0) return std::format("{}m{:02}s", m, s);
    return std::format("{}s", s);
}

double row_elapsed(const SessionView& s, double now) {
    if (s.status == "RUNNING") return now - s.work_started_at.value_or(s.created_at);
    if (is_finished(s.status) && s.finished_at) return *s.finished_at - s.created_at;
    return now - s.created_at;
}

std::string clip_utf8(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        // Continuation bytes belong to the character already counted.
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (chars == max_chars) return s.substr(0, i);
        ++chars;
    }
    return s;
}

std::string status_label(const SessionView& s) {
    if (s.status == "RUNNING") return "Running";
    if (s.status == "IDLE") return "Waiting";
    if (s.status == "DONE") return "Complete";
    if (s.status == "KILLED") return "Killed";
    if (s.status == "FAILED") {
        return s.exit_code ? std::format("Failed ({})", *s.exit_code) : "Failed";
    }
    return s.status;
}

std::string render_board(const std::vector<BoardGroup>& groups, double now,
                         int total_sessions) {
    std::string out;
    out += std::format("  {:<{}}  {:<14}  {}\n", "SESSION", kNameWidth, "STATUS", "TIME");

    int running = 0;
    int waiting = 0;
    if (groups.empty()) {
        out += "  Waiting for sessions\n";
    }
    for (const auto& g : groups) {
        out += std::format("-- {} ({}) --\n", g.name, g.sessions.size());
        for (const auto& s : g.sessions) {
            if (s.status == "RUNNING") running++;
            if (s.status == "IDLE") waiting++;
            out += std::format("  {:<{}}  {:<14}  {}\n", clip_utf8(s.name, kNameWidth),
                               kNameWidth, status_label(s),
                               format_elapsed(row_elapsed(s, now)));
        }
    }

    std::vector<std::string> parts;
    if (running) parts.push_back(std::format("{} running", running));
    if (waiting) parts.push_back(std::format("{} waiting", waiting));
    if (parts.empty()) parts.push_back("All quiet");

    std::string summary;
    for (const auto& p : parts) {
        if (!summary.empty()) summary += "  ";
        summary += p;
    }
    if (total_sessions > 0) summary += std::format("  ({} total sessions)", total_sessions);
    out += "> " + summary + "\n";
    return out;
}
