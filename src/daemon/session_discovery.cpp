#include "session_discovery.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>
#include <unordered_set>

namespace fs = std::filesystem;

SessionDiscovery::SessionDiscovery(SessionRegistry& registry, ProcessTree& tree,
                                   RecentDirs& recent, Config::Discovery options,
                                   BranchLookup branch_lookup, bool verbose)
    : registry_(registry), tree_(tree), recent_(recent),
      options_(std::move(options)), branch_lookup_(std::move(branch_lookup)),
      verbose_(verbose) {}

int SessionDiscovery::run(int self_pid) {
    auto procs = tree_.list_processes();
    if (!procs) {
        log("discovery skipped: " + procs.error());
        return 0;
    }

    std::vector<ProcessInfo> candidates;
    for (const auto& p : *procs) {
        if (is_candidate(p, self_pid)) candidates.push_back(p);
    }

    // An agent whose parent is also an agent is a helper, not a session root.
    std::unordered_set<int> candidate_pids;
    for (const auto& c : candidates) candidate_pids.insert(c.pid);
    std::erase_if(candidates, [&](const ProcessInfo& c) { return candidate_pids.contains(c.ppid); });

    int registered = 0;
    for (const auto& c : candidates) {
        if (registry_.is_tracked_shell(c.ppid)) continue;

        std::optional<std::string> cwd;
        if (auto dir = tree_.working_directory(c.pid)) {
            cwd = std::move(*dir);
        } else {
            log(std::format("pid {}: no working directory ({})", c.pid, dir.error()));
        }

        std::optional<std::string> branch;
        if (cwd && branch_lookup_) branch = branch_lookup_(*cwd);

        std::string name = cwd ? display_name(*cwd, branch)
                               : std::format("{} [{}]", c.comm, c.pid);

        NewSession fresh{
            .id = std::format("discovered-{}", c.pid),
            .name = name,
            .shell_pid = c.ppid,
            .agent_pid = c.pid,
            .working_dir = cwd,
        };
        if (!registry_.register_unless_tracked(std::move(fresh))) continue;

        ++registered;
        log(std::format("discovered {} (pid {}, shell {})", name, c.pid, c.ppid));
        if (cwd) recent_.promote(*cwd);
    }

    return registered;
}

std::string SessionDiscovery::display_name(const std::string& dir,
                                           const std::optional<std::string>& branch) {
    fs::path p = fs::path(dir).lexically_normal();
    if (p.filename().empty()) p = p.parent_path();
    std::string base = p.filename().string();
    if (base.empty()) base = dir;

    if (branch && !branch->empty()) return std::format("{} ({})", base, *branch);
    return base;
}

bool SessionDiscovery::is_candidate(const ProcessInfo& p, int self_pid) const {
    if (p.comm != options_.command) return false;
    if (std::ranges::find(options_.exclude, p.comm) != options_.exclude.end()) return false;
    if (p.ppid <= 1) return false;
    if (p.pid == self_pid || p.ppid == self_pid) return false;
    return true;
}

void SessionDiscovery::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[agent-board] {}", msg);
    }
}
