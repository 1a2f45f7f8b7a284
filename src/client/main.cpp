#include "board_view.hpp"
#include "config.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_sigint(int) { g_interrupted = 1; }

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  create --id ID --name NAME [--shell-pid N] [--cwd DIR]");
    std::println(stderr, "                                    Register a session");
    std::println(stderr, "  update ID STATUS [--exit-code N]  Report a session status");
    std::println(stderr, "  list                              Dump all sessions as JSON");
    std::println(stderr, "  board [--watch] [--ttl S] [--interval MS]");
    std::println(stderr, "                                    Show the session board");
    std::println(stderr, "  kill ID                           Terminate a session's processes");
    std::println(stderr, "  history [--limit N]               Show archived sessions");
    std::println(stderr, "  recent                            Show recently used directories");
}

double now_seconds() {
    return std::chrono::duration<double>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool parse_int(const char* text, int& out) {
    char* end = nullptr;
    long v = std::strtol(text, &end, 10);
    if (end == text || *end != '\0') return false;
    out = static_cast<int>(v);
    return true;
}

struct Args {
    std::vector<std::string> positional;
    std::string id;
    std::string name;
    std::string cwd;
    std::optional<int> shell_pid;
    std::optional<int> exit_code;
    int limit = 10;
    int ttl_s = 30;
    int interval_ms = 2000;
    bool watch = false;
};

std::optional<Args> parse_args(int argc, char* argv[], const Config& config) {
    Args a;
    a.ttl_s = static_cast<int>(config.board.done_ttl_s);
    a.interval_ms = static_cast<int>(config.monitor.interval_ms);
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        int n = 0;
        if (arg == "--id" && has_value) {
            a.id = argv[++i];
        } else if (arg == "--name" && has_value) {
            a.name = argv[++i];
        } else if (arg == "--cwd" && has_value) {
            a.cwd = argv[++i];
        } else if (arg == "--shell-pid" && has_value) {
            if (!parse_int(argv[++i], n)) return std::nullopt;
            a.shell_pid = n;
        } else if (arg == "--exit-code" && has_value) {
            if (!parse_int(argv[++i], n)) return std::nullopt;
            a.exit_code = n;
        } else if (arg == "--limit" && has_value) {
            if (!parse_int(argv[++i], a.limit)) return std::nullopt;
        } else if (arg == "--ttl" && has_value) {
            if (!parse_int(argv[++i], a.ttl_s)) return std::nullopt;
        } else if (arg == "--interval" && has_value) {
            if (!parse_int(argv[++i], a.interval_ms)) return std::nullopt;
        } else if (arg == "--watch") {
            a.watch = true;
        } else if (arg.starts_with("--")) {
            return std::nullopt;
        } else {
            a.positional.push_back(arg);
        }
    }
    return a;
}

int print_board(const json& response, int ttl_s) {
    std::vector<SessionView> sessions;
    for (const auto& j : response.value("sessions", json::array())) {
        sessions.push_back(SessionView::from_json(j));
    }
    double now = now_seconds();
    auto groups = arrange_board(sessions, now, ttl_s);
    std::print("{}", render_board(groups, now, response.value("total_sessions", 0)));
    return 0;
}

int watch_board(UnixSocketClient& client, const Args& args) {
    std::signal(SIGINT, on_sigint);
    while (!g_interrupted) {
        auto response = client.call({{"cmd", "list"}});
        if (!response) {
            std::println(stderr, "Error: {}", response.error());
            return 1;
        }
        std::print("\x1b[H\x1b[2J");
        print_board(*response, args.ttl_s);
        std::fflush(stdout);

        // Sleep in short slices so Ctrl-C exits promptly.
        auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(args.interval_ms);
        while (!g_interrupted && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    auto parsed = parse_args(argc, argv, Config::load_default());
    if (!parsed) {
        std::println(stderr, "Invalid arguments for {}", command);
        usage(argv[0]);
        return 1;
    }
    const Args& args = *parsed;

    json cmd;
    if (command == "create") {
        if (args.id.empty() || args.name.empty()) {
            std::println(stderr, "create requires --id and --name");
            return 1;
        }
        cmd = {{"cmd", "create"}, {"id", args.id}, {"name", args.name}};
        if (args.shell_pid) cmd["shell_pid"] = *args.shell_pid;
        if (!args.cwd.empty()) cmd["cwd"] = args.cwd;
    } else if (command == "update") {
        if (args.positional.size() != 2) {
            std::println(stderr, "update requires ID and STATUS");
            return 1;
        }
        cmd = {{"cmd", "update"}, {"id", args.positional[0]}, {"status", args.positional[1]}};
        if (args.exit_code) cmd["exit_code"] = *args.exit_code;
    } else if (command == "list" || command == "board") {
        cmd = {{"cmd", "list"}};
    } else if (command == "kill") {
        if (args.positional.size() != 1) {
            std::println(stderr, "kill requires ID");
            return 1;
        }
        cmd = {{"cmd", "kill"}, {"id", args.positional[0]}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", args.limit}};
    } else if (command == "recent") {
        cmd = {{"cmd", "recent"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is agent-board running?");
        return 1;
    }

    if (command == "board" && args.watch) {
        return watch_board(client, args);
    }

    auto response = client.call(cmd);
    if (!response) {
        std::println(stderr, "Error: {}", response.error());
        return 1;
    }

    if (response->value("status", "") == "error") {
        std::println(stderr, "Error: {}", response->value("message", "unknown error"));
        return 1;
    }

    if (command == "list") {
        std::println("{}", response->dump(2));
    } else if (command == "board") {
        return print_board(*response, args.ttl_s);
    } else if (command == "kill") {
        std::println("Killed {} ({} process(es) signalled, {} failed)", args.positional[0],
                     response->value("attempted", 0), response->value("failed", 0));
    } else if (command == "history") {
        for (const auto& e : response->value("entries", json::array())) {
            std::string status = e.value("status", "");
            if (e.contains("exit_code") && e["exit_code"].is_number_integer()) {
                status += std::format(" ({})", e["exit_code"].get<int>());
            }
            double started = e.value("created_at", 0.0);
            double finished = e.contains("finished_at") && e["finished_at"].is_number()
                ? e["finished_at"].get<double>() : started;
            std::println("[{}] {}  {}  {}", e.value("group", ""), e.value("name", ""), status,
                         format_elapsed(finished - started));
        }
    } else if (command == "recent") {
        for (const auto& dir : response->value("directories", json::array())) {
            std::println("{}", dir.get<std::string>());
        }
    } else {
        std::println("OK");
    }

    return 0;
}
