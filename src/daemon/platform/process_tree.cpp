#include "platform/process_tree.hpp"

#include <algorithm>
#include <format>
#include <unordered_map>
#include <unordered_set>

std::expected<std::vector<int>, std::string> ProcessTree::direct_children(
        int pid, const NamePredicate& pred) const {
    auto procs = list_processes();
    if (!procs) return std::unexpected(procs.error());

    std::vector<int> children;
    for (const auto& p : *procs) {
        if (p.ppid != pid) continue;
        if (pred && !pred(p.comm)) continue;
        children.push_back(p.pid);
    }
    std::ranges::sort(children);
    return children;
}

std::expected<double, std::string> ProcessTree::aggregate_cpu(int pid) {
    auto own = process_cpu(pid);
    if (!own) return own;

    double total = *own;

    auto children = direct_children(pid, nullptr);
    if (!children) return total;

    for (int child : *children) {
        // A helper exiting between listing and sampling just drops out.
        if (auto cpu = process_cpu(child)) total += *cpu;
    }
    return total;
}

KillReport ProcessTree::kill_tree(int pid, int spare_pid) {
    KillReport report;

    std::unordered_map<int, std::vector<int>> children_of;
    if (auto procs = list_processes()) {
        for (const auto& p : *procs) {
            children_of[p.ppid].push_back(p.pid);
        }
        for (auto& [parent, kids] : children_of) std::ranges::sort(kids);
    } else {
        report.errors.push_back("process listing failed: " + procs.error());
    }

    std::unordered_set<int> visited;

    std::function<void(int)> kill_subtree = [&](int target) {
        if (target == spare_pid || !visited.insert(target).second) return;

        if (auto it = children_of.find(target); it != children_of.end()) {
            for (int child : it->second) kill_subtree(child);
        }

        ++report.attempted;
        auto res = terminate(target);
        if (!res) {
            ++report.failed;
            report.errors.push_back(std::format("pid {}: {}", target, res.error()));
        }
    };

    kill_subtree(pid);
    return report;
}
