#pragma once

#include "session.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string session_id;
    std::string name;
    std::string status;
    std::optional<int> exit_code;
    std::string working_dir;
    std::string group;
    double created_at;
    std::optional<double> work_started_at;
    std::optional<double> finished_at;
};

// Archive of finished sessions. Safe to call from the monitor thread and the
// IPC thread concurrently.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    bool insert(const Session& session);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
