#pragma once

#include "platform/process_tree.hpp"
#include "session_registry.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Consecutive agreeing samples required before IDLE <-> RUNNING flips.
inline constexpr int kHysteresisSamples = 2;

// Records one CPU sample on s and returns the transition it triggers, if any.
// A sample strictly above threshold counts as busy.
std::optional<Transition> apply_cpu_sample(Session& s, double cpu_percent, double threshold);

// True when comm contains any of names, ignoring case.
bool matches_agent_name(const std::string& comm, const std::vector<std::string>& names);

class ActivityMonitor {
public:
    struct Options {
        std::chrono::milliseconds interval{2000};
        double cpu_threshold = 5.0;
        std::vector<std::string> agent_names = {"claude", "node"};
        std::chrono::seconds retention{3600}; // zero disables pruning
    };

    using PrunedCallback = std::function<void(const std::vector<Session>&)>;

    ActivityMonitor(SessionRegistry& registry, ProcessTree& tree, Options options,
                    bool verbose = false, PrunedCallback on_pruned = {});
    ~ActivityMonitor();

    ActivityMonitor(const ActivityMonitor&) = delete;
    ActivityMonitor& operator=(const ActivityMonitor&) = delete;

    void start();
    void stop();
    bool running() const { return thread_.joinable(); }

    // One classification pass over every active session. Called by the
    // background thread; exposed for deterministic driving.
    void tick();

private:
    void run(std::stop_token st);
    void check(const MonitorTarget& target);
    void mark_done(const std::string& id, const char* reason);
    void prune();

    void log(const std::string& msg);

    SessionRegistry& registry_;
    ProcessTree& tree_;
    Options options_;
    bool verbose_;
    PrunedCallback on_pruned_;

    std::mutex wait_mutex_;
    std::condition_variable_any wake_;
    std::jthread thread_;
};
