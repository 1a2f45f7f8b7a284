#pragma once

#include "platform/process_tree.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

class ProcfsProcessTree : public ProcessTree {
public:
    ProcfsProcessTree();

    bool is_alive(int pid) const override;
    std::expected<std::vector<ProcessInfo>, std::string> list_processes() const override;
    std::expected<double, std::string> process_cpu(int pid) override;
    std::expected<void, std::string> terminate(int pid) override;
    std::expected<std::string, std::string> working_directory(int pid) const override;

private:
    struct StatFields {
        int ppid = 0;
        std::string comm;
        uint64_t cpu_ticks = 0;   // utime + stime
        uint64_t start_ticks = 0; // since boot
    };

    static std::optional<StatFields> read_stat(int pid);
    static std::optional<double> read_uptime();

    void evict_stale(std::chrono::steady_clock::time_point now);

    struct CpuSample {
        uint64_t cpu_ticks = 0;
        uint64_t start_ticks = 0;
        std::chrono::steady_clock::time_point taken;
    };

    double ticks_per_second_;

    // Previous sample per pid, for delta-based percentages.
    std::mutex samples_mutex_;
    std::unordered_map<int, CpuSample> samples_;
};
