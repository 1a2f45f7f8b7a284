#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Monitor {
        uint32_t interval_ms = 2000;
        double cpu_threshold = 5.0;
        uint32_t query_timeout_ms = 5000;
    } monitor;

    struct Discovery {
        bool enabled = true;
        std::string command = "claude";
        std::vector<std::string> exclude = {"Claude"}; // desktop app shares the name
    } discovery;

    struct Registry {
        uint32_t retention_s = 3600; // 0 keeps finished sessions forever
    } registry;

    struct Recent {
        uint32_t max_entries = 10;
    } recent;

    struct Board {
        uint32_t done_ttl_s = 30;
    } board;

    struct Storage {
        std::string history_db;  // empty: <data_dir>/history.db
        std::string recent_file; // empty: <data_dir>/recent_dirs
    } storage;

    // Child process names (substring, case-insensitive) adopted as the agent.
    std::vector<std::string> agents = {"claude", "node"};

    static Config load(const std::string& path);
    static Config load_default();
};
