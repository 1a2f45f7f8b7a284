#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("monitor")) {
            auto& m = j["monitor"];
            if (m.contains("interval_ms")) cfg.monitor.interval_ms = m["interval_ms"].get<uint32_t>();
            if (m.contains("cpu_threshold")) cfg.monitor.cpu_threshold = m["cpu_threshold"].get<double>();
            if (m.contains("query_timeout_ms")) cfg.monitor.query_timeout_ms = m["query_timeout_ms"].get<uint32_t>();
        }

        if (j.contains("discovery")) {
            auto& d = j["discovery"];
            if (d.contains("enabled")) cfg.discovery.enabled = d["enabled"].get<bool>();
            if (d.contains("command")) cfg.discovery.command = d["command"].get<std::string>();
            if (d.contains("exclude")) cfg.discovery.exclude = d["exclude"].get<std::vector<std::string>>();
        }

        if (j.contains("registry")) {
            auto& r = j["registry"];
            if (r.contains("retention_s")) cfg.registry.retention_s = r["retention_s"].get<uint32_t>();
        }

        if (j.contains("recent")) {
            auto& r = j["recent"];
            if (r.contains("max_entries")) cfg.recent.max_entries = r["max_entries"].get<uint32_t>();
        }

        if (j.contains("board")) {
            auto& b = j["board"];
            if (b.contains("done_ttl_s")) cfg.board.done_ttl_s = b["done_ttl_s"].get<uint32_t>();
        }

        if (j.contains("storage")) {
            auto& s = j["storage"];
            if (s.contains("history_db")) cfg.storage.history_db = s["history_db"].get<std::string>();
            if (s.contains("recent_file")) cfg.storage.recent_file = s["recent_file"].get<std::string>();
        }

        if (j.contains("agents")) {
            cfg.agents = j["agents"].get<std::vector<std::string>>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
