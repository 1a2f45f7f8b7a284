#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

// Most-recently-used working directories, one absolute path per line on disk,
// newest first. Every promotion rewrites the file.
class RecentDirs {
public:
    explicit RecentDirs(size_t max_entries = 10);

    RecentDirs(const RecentDirs&) = delete;
    RecentDirs& operator=(const RecentDirs&) = delete;

    // Missing file loads as an empty list; entries that are no longer
    // directories are dropped. Returns false only on a read error.
    bool load(const std::string& path);

    // Moves (or inserts) path to the front, trims to max_entries and saves.
    // Returns false when the file could not be written; memory is updated regardless.
    bool promote(const std::string& path);

    std::vector<std::string> entries() const;

private:
    bool save_locked() const;

    size_t max_entries_;
    std::string path_;
    mutable std::mutex mutex_;
    std::vector<std::string> entries_;
};
