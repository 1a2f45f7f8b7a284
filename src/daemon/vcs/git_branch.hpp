#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// Runs argv (argv[0] looked up in PATH) and captures stdout. The child is
// killed if it has not exited within timeout.
struct CommandResult {
    int exit_code = -1;
    std::string output;
};

std::expected<CommandResult, std::string> run_command(const std::vector<std::string>& argv,
                                                      std::chrono::milliseconds timeout);

// Current branch of the git checkout containing dir, or nullopt when dir is
// not in a repository, HEAD is detached, or git is unavailable or too slow.
std::optional<std::string> git_branch(const std::string& dir, std::chrono::milliseconds timeout);
