#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO sessions (session_id, name, status, exit_code, working_dir, "
        "group_name, created_at, work_started_at, finished_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, session_id, name, status, exit_code, working_dir, group_name, "
        "created_at, work_started_at, finished_at "
        "FROM sessions ORDER BY finished_at DESC, id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void HistoryDb::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::is_open() const {
    std::lock_guard lock(mutex_);
    return insert_stmt_ != nullptr;
}

bool HistoryDb::insert(const Session& s) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, s.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, s.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, to_string(s.status), -1, SQLITE_STATIC);

    if (s.exit_code) sqlite3_bind_int(insert_stmt_, 4, *s.exit_code);
    else sqlite3_bind_null(insert_stmt_, 4);

    if (s.working_dir) sqlite3_bind_text(insert_stmt_, 5, s.working_dir->c_str(), -1, SQLITE_TRANSIENT);
    else sqlite3_bind_null(insert_stmt_, 5);

    sqlite3_bind_text(insert_stmt_, 6, s.group.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 7, to_epoch_seconds(s.created_at));

    auto bind_time = [this](int idx, const std::optional<TimePoint>& tp) {
        if (tp) sqlite3_bind_double(insert_stmt_, idx, to_epoch_seconds(*tp));
        else sqlite3_bind_null(insert_stmt_, idx);
    };
    bind_time(8, s.work_started_at);
    bind_time(9, s.finished_at);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    std::lock_guard lock(mutex_);
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };
    auto get_opt_double = [](sqlite3_stmt* stmt, int col) -> std::optional<double> {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
        return sqlite3_column_double(stmt, col);
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.session_id = get_text(recent_stmt_, 1);
        e.name = get_text(recent_stmt_, 2);
        e.status = get_text(recent_stmt_, 3);
        if (sqlite3_column_type(recent_stmt_, 4) != SQLITE_NULL) {
            e.exit_code = sqlite3_column_int(recent_stmt_, 4);
        }
        e.working_dir = get_text(recent_stmt_, 5);
        e.group = get_text(recent_stmt_, 6);
        e.created_at = sqlite3_column_double(recent_stmt_, 7);
        e.work_started_at = get_opt_double(recent_stmt_, 8);
        e.finished_at = get_opt_double(recent_stmt_, 9);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS sessions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            name TEXT NOT NULL,
            status TEXT NOT NULL,
            exit_code INTEGER,
            working_dir TEXT,
            group_name TEXT NOT NULL,
            created_at REAL NOT NULL,
            work_started_at REAL,
            finished_at REAL,
            archived_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now'))
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
