#pragma once

#include <expected>
#include <functional>
#include <string>
#include <vector>

struct ProcessInfo {
    int pid = 0;
    int ppid = 0;
    std::string comm;
};

struct KillReport {
    int attempted = 0;
    int failed = 0;
    std::vector<std::string> errors;

    bool ok() const { return failed == 0; }
};

// OS process queries. Implementations override the primitives; the composite
// operations below are built on them and never throw.
class ProcessTree {
public:
    using NamePredicate = std::function<bool(const std::string&)>;

    virtual ~ProcessTree() = default;

    // False only when the process does not exist.
    virtual bool is_alive(int pid) const = 0;

    // One pass over the full process table.
    virtual std::expected<std::vector<ProcessInfo>, std::string> list_processes() const = 0;

    // Instantaneous CPU usage of a single process, 100.0 == one full core.
    virtual std::expected<double, std::string> process_cpu(int pid) = 0;

    // Sends a termination request to a single process.
    virtual std::expected<void, std::string> terminate(int pid) = 0;

    virtual std::expected<std::string, std::string> working_directory(int pid) const = 0;

    // Children of pid whose command name satisfies pred, ordered by pid.
    std::expected<std::vector<int>, std::string> direct_children(int pid,
                                                                 const NamePredicate& pred) const;

    // CPU of pid plus its direct children (one level, not the whole subtree).
    std::expected<double, std::string> aggregate_cpu(int pid);

    // Depth-first termination: each child's subtree, then pid itself.
    // spare_pid and everything below it are left untouched.
    KillReport kill_tree(int pid, int spare_pid = 0);
};
