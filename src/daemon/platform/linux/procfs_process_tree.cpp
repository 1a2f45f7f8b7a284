#include "platform/linux/procfs_process_tree.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Samples older than this belong to processes we stopped looking at.
constexpr auto kSampleTtl = std::chrono::seconds(60);

bool parse_pid(const std::string& name, int& pid) {
    if (name.empty()) return false;
    int value = 0;
    for (char c : name) {
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    pid = value;
    return true;
}

} // namespace

ProcfsProcessTree::ProcfsProcessTree() {
    long hz = ::sysconf(_SC_CLK_TCK);
    ticks_per_second_ = hz > 0 ? static_cast<double>(hz) : 100.0;
}

bool ProcfsProcessTree::is_alive(int pid) const {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    // EPERM: it exists, we just may not signal it.
    return errno != ESRCH;
}

std::expected<std::vector<ProcessInfo>, std::string> ProcfsProcessTree::list_processes() const {
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec) {
        return std::unexpected("cannot read /proc: " + ec.message());
    }

    std::vector<ProcessInfo> procs;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        int pid = 0;
        if (!parse_pid(it->path().filename().string(), pid)) continue;

        // Processes exit while we scan; skip the ones that are already gone.
        auto stat = read_stat(pid);
        if (!stat) continue;
        procs.push_back({.pid = pid, .ppid = stat->ppid, .comm = std::move(stat->comm)});
    }
    if (ec) {
        return std::unexpected("scan of /proc failed: " + ec.message());
    }
    return procs;
}

std::expected<double, std::string> ProcfsProcessTree::process_cpu(int pid) {
    auto stat = read_stat(pid);
    if (!stat) {
        return std::unexpected(std::format("pid {}: stat unavailable", pid));
    }

    auto now = std::chrono::steady_clock::now();
    std::lock_guard lock(samples_mutex_);
    evict_stale(now);

    auto it = samples_.find(pid);
    // A recycled pid has a different start time and starts over.
    if (it != samples_.end() && it->second.start_ticks == stat->start_ticks &&
        stat->cpu_ticks >= it->second.cpu_ticks) {
        double wall = std::chrono::duration<double>(now - it->second.taken).count();
        double busy = static_cast<double>(stat->cpu_ticks - it->second.cpu_ticks) / ticks_per_second_;
        it->second = {stat->cpu_ticks, stat->start_ticks, now};
        if (wall <= 0.0) return 0.0;
        return 100.0 * busy / wall;
    }

    samples_[pid] = {stat->cpu_ticks, stat->start_ticks, now};

    // First look at this pid: lifetime average, as ps reports %cpu.
    auto uptime = read_uptime();
    if (!uptime) return 0.0;
    double elapsed = *uptime - static_cast<double>(stat->start_ticks) / ticks_per_second_;
    if (elapsed <= 0.0) return 0.0;
    return 100.0 * (static_cast<double>(stat->cpu_ticks) / ticks_per_second_) / elapsed;
}

std::expected<void, std::string> ProcfsProcessTree::terminate(int pid) {
    if (pid <= 1) {
        return std::unexpected(std::format("refusing to signal pid {}", pid));
    }
    if (::kill(pid, SIGTERM) < 0) {
        return std::unexpected(std::format("kill({}) failed: {}", pid, std::strerror(errno)));
    }
    return {};
}

std::expected<std::string, std::string> ProcfsProcessTree::working_directory(int pid) const {
    std::error_code ec;
    auto path = fs::read_symlink(std::format("/proc/{}/cwd", pid), ec);
    if (ec) {
        return std::unexpected(std::format("pid {}: {}", pid, ec.message()));
    }
    return path.string();
}

std::optional<ProcfsProcessTree::StatFields> ProcfsProcessTree::read_stat(int pid) {
    std::ifstream f(std::format("/proc/{}/stat", pid));
    if (!f.is_open()) return std::nullopt;

    std::string content;
    std::getline(f, content);

    // comm may itself contain spaces or parentheses; it ends at the last ')'.
    auto lp = content.find('(');
    auto rp = content.rfind(')');
    if (lp == std::string::npos || rp == std::string::npos || rp < lp || rp + 2 > content.size()) {
        return std::nullopt;
    }

    StatFields out;
    out.comm = content.substr(lp + 1, rp - lp - 1);

    std::istringstream ss(content.substr(rp + 2));
    char state = 0;
    ss >> state >> out.ppid;

    // pgrp session tty_nr tpgid flags minflt cminflt majflt cmajflt
    std::string skip;
    for (int i = 0; i < 9; i++) ss >> skip;

    uint64_t utime = 0, stime = 0;
    ss >> utime >> stime;
    out.cpu_ticks = utime + stime;

    // cutime cstime priority nice num_threads itrealvalue
    for (int i = 0; i < 6; i++) ss >> skip;
    ss >> out.start_ticks;

    if (ss.fail()) return std::nullopt;
    return out;
}

std::optional<double> ProcfsProcessTree::read_uptime() {
    std::ifstream f("/proc/uptime");
    double uptime = 0.0;
    if (!(f >> uptime)) return std::nullopt;
    return uptime;
}

void ProcfsProcessTree::evict_stale(std::chrono::steady_clock::time_point now) {
    std::erase_if(samples_, [now](const auto& kv) {
        return now - kv.second.taken > kSampleTtl;
    });
}
