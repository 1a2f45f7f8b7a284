#pragma once

#include "config.hpp"
#include "platform/process_tree.hpp"
#include "session_registry.hpp"
#include "storage/recent_dirs.hpp"

#include <functional>
#include <optional>
#include <string>

// One-shot startup scan that registers agent processes which were already
// running before the daemon came up.
class SessionDiscovery {
public:
    using BranchLookup = std::function<std::optional<std::string>(const std::string& dir)>;

    SessionDiscovery(SessionRegistry& registry, ProcessTree& tree, RecentDirs& recent,
                     Config::Discovery options, BranchLookup branch_lookup,
                     bool verbose = false);

    // Returns the number of sessions registered. self_pid is never adopted,
    // as an agent or as a shell.
    int run(int self_pid);

    static std::string display_name(const std::string& dir,
                                    const std::optional<std::string>& branch);

private:
    bool is_candidate(const ProcessInfo& p, int self_pid) const;

    void log(const std::string& msg);

    SessionRegistry& registry_;
    ProcessTree& tree_;
    RecentDirs& recent_;
    Config::Discovery options_;
    BranchLookup branch_lookup_;
    bool verbose_;
};
