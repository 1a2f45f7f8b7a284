#include "storage/recent_dirs.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <print>

namespace fs = std::filesystem;

RecentDirs::RecentDirs(size_t max_entries)
    : max_entries_(max_entries > 0 ? max_entries : 1) {}

bool RecentDirs::load(const std::string& path) {
    std::vector<std::string> loaded;

    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::println(stderr, "recent: could not open {}", path);
            std::lock_guard lock(mutex_);
            path_ = path;
            return false;
        }

        std::string line;
        while (std::getline(f, line) && loaded.size() < max_entries_) {
            if (line.empty()) continue;
            if (!fs::is_directory(line, ec)) continue;
            if (std::ranges::find(loaded, line) != loaded.end()) continue;
            loaded.push_back(line);
        }
    }

    std::lock_guard lock(mutex_);
    path_ = path;
    entries_ = std::move(loaded);
    return true;
}

bool RecentDirs::promote(const std::string& path) {
    if (path.empty()) return false;

    std::lock_guard lock(mutex_);
    std::erase(entries_, path);
    entries_.insert(entries_.begin(), path);
    if (entries_.size() > max_entries_) entries_.resize(max_entries_);
    return save_locked();
}

std::vector<std::string> RecentDirs::entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

bool RecentDirs::save_locked() const {
    if (path_.empty()) return false;

    fs::path p(path_);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    std::ofstream f(path_, std::ios::trunc);
    if (!f.is_open()) {
        std::println(stderr, "recent: could not write {}", path_);
        return false;
    }
    for (const auto& e : entries_) f << e << '\n';
    return static_cast<bool>(f);
}
