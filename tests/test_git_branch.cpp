#include <catch2/catch_test_macros.hpp>

#include "vcs/git_branch.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <unistd.h>

using namespace std::chrono_literals;

TEST_CASE("run_command", "[vcs]") {

    SECTION("CapturesStdout") {
        auto res = run_command({"sh", "-c", "echo hello; echo ignored >&2"}, 2000ms);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->output == "hello\n");
    }

    SECTION("ReportsExitCode") {
        auto res = run_command({"sh", "-c", "exit 3"}, 2000ms);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 3);
    }

    SECTION("MissingBinary") {
        auto res = run_command({"ab-test-no-such-binary"}, 2000ms);
        REQUIRE(res.has_value());
        REQUIRE(res->exit_code == 127);
    }

    SECTION("TimeoutKillsChild") {
        auto start = std::chrono::steady_clock::now();
        auto res = run_command({"sleep", "10"}, 100ms);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    }

    SECTION("EmptyCommand") {
        REQUIRE_FALSE(run_command({}, 100ms).has_value());
    }
}

TEST_CASE("git_branch", "[vcs]") {
    auto dir = std::filesystem::temp_directory_path() /
               ("ab_test_nogit_" + std::to_string(getpid()));
    std::filesystem::create_directories(dir);

    // Not a checkout (or git is not installed): no branch either way.
    REQUIRE_FALSE(git_branch(dir.string(), 2000ms).has_value());
    REQUIRE_FALSE(git_branch("", 2000ms).has_value());

    std::filesystem::remove_all(dir);
}
