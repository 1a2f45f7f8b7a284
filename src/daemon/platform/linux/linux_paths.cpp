#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/agent-board";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/agent-board";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/agent-board";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/agent-board";
}

std::string ipc_endpoint() {
    const char* override_path = std::getenv("AGENT_BOARD_SOCKET");
    if (override_path && *override_path) return override_path;
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/agent-board.sock";
    return "/tmp/agent-board.sock";
}

} // namespace platform
