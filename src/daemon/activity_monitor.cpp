#include "activity_monitor.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <print>

std::optional<Transition> apply_cpu_sample(Session& s, double cpu_percent, double threshold) {
    if (!is_active(s.status)) return std::nullopt;

    s.last_cpu_percent = cpu_percent;
    if (cpu_percent > threshold) {
        s.cpu_high_streak++;
        s.cpu_low_streak = 0;
    } else {
        s.cpu_low_streak++;
        s.cpu_high_streak = 0;
    }

    if (s.cpu_high_streak >= kHysteresisSamples && s.status != SessionStatus::Running) {
        return Transition{SessionStatus::Running, s.exit_code};
    }
    if (s.cpu_low_streak >= kHysteresisSamples && s.status != SessionStatus::Idle) {
        return Transition{SessionStatus::Idle, s.exit_code};
    }
    return std::nullopt;
}

bool matches_agent_name(const std::string& comm, const std::vector<std::string>& names) {
    std::string lower = comm;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return std::ranges::any_of(names, [&](const std::string& name) {
        std::string n = name;
        std::transform(n.begin(), n.end(), n.begin(), ::tolower);
        return !n.empty() && lower.find(n) != std::string::npos;
    });
}

ActivityMonitor::ActivityMonitor(SessionRegistry& registry, ProcessTree& tree, Options options,
                                 bool verbose, PrunedCallback on_pruned)
    : registry_(registry), tree_(tree), options_(std::move(options)),
      verbose_(verbose), on_pruned_(std::move(on_pruned)) {}

ActivityMonitor::~ActivityMonitor() {
    stop();
}

void ActivityMonitor::start() {
    if (thread_.joinable()) return;
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
}

void ActivityMonitor::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    wake_.notify_all();
    thread_.join();
}

void ActivityMonitor::run(std::stop_token st) {
    log(std::format("monitor started, interval {}ms, threshold {:.1f}%",
                    options_.interval.count(), options_.cpu_threshold));

    while (!st.stop_requested()) {
        tick();

        std::unique_lock lock(wait_mutex_);
        wake_.wait_for(lock, st, options_.interval, [] { return false; });
    }

    log("monitor stopped");
}

void ActivityMonitor::tick() {
    for (const auto& target : registry_.active_targets()) {
        check(target);
    }
    prune();
}

void ActivityMonitor::check(const MonitorTarget& target) {
    if (!tree_.is_alive(target.shell_pid)) {
        mark_done(target.id, "shell exited");
        return;
    }

    auto agent_pid = target.agent_pid;

    // Supervisors can outlive the process doing the actual work.
    if (agent_pid && !tree_.is_alive(*agent_pid)) {
        mark_done(target.id, "agent exited");
        return;
    }

    if (!agent_pid) {
        auto children = tree_.direct_children(target.shell_pid, [this](const std::string& comm) {
            return matches_agent_name(comm, options_.agent_names);
        });
        if (!children) {
            log(std::format("{}: child lookup failed: {}", target.id, children.error()));
            return;
        }
        if (children->empty()) return;

        agent_pid = children->front();
        if (registry_.adopt_agent(target.id, *agent_pid)) {
            log(std::format("{}: adopted agent pid {}", target.id, *agent_pid));
        }
    }

    auto cpu = tree_.aggregate_cpu(*agent_pid);
    if (!cpu) {
        log(std::format("{}: cpu sample failed: {}", target.id, cpu.error()));
        return;
    }

    std::optional<Transition> flipped;
    registry_.modify(target.id, [&](Session& s) {
        flipped = apply_cpu_sample(s, *cpu, options_.cpu_threshold);
        return flipped;
    });
    if (flipped) {
        log(std::format("{}: now {} ({:.1f}% cpu)", target.id, to_string(flipped->status), *cpu));
    }
}

void ActivityMonitor::mark_done(const std::string& id, const char* reason) {
    bool changed = false;
    registry_.modify(id, [&](Session& s) -> std::optional<Transition> {
        if (!is_active(s.status)) return std::nullopt;
        changed = true;
        return Transition{SessionStatus::Done, 0};
    });
    if (changed) log(std::format("{}: done ({})", id, reason));
}

void ActivityMonitor::prune() {
    if (options_.retention.count() <= 0) return;

    auto cutoff = Clock::now() - options_.retention;
    auto pruned = registry_.prune_finished(cutoff);
    if (pruned.empty()) return;

    log(std::format("pruned {} finished session(s)", pruned.size()));
    if (on_pruned_) on_pruned_(pruned);
}

void ActivityMonitor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[agent-board] {}", msg);
    }
}
