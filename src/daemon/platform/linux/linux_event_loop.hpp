#pragma once

#include "activity_monitor.hpp"
#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/procfs_process_tree.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "session_registry.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void serve_client(int fd);
    void log(const std::string& msg);

    static ActivityMonitor::Options monitor_options(const Config& config);

    Config config_;
    bool verbose_;

    // Shared state and platform implementations (constructed before core_)
    SessionRegistry registry_;
    ProcfsProcessTree process_tree_;
    UnixSocketServer ipc_server_;

    DaemonCore core_;
    ActivityMonitor monitor_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;

    std::atomic<bool> running_{false};
};
