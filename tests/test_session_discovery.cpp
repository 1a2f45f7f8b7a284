#include <catch2/catch_test_macros.hpp>

#include "fake_process_tree.hpp"
#include "session_discovery.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kSelf = 5000;

// Real directories, since RecentDirs only keeps paths that exist.
struct TmpDirs {
    fs::path root;

    TmpDirs() {
        root = fs::temp_directory_path() / ("ab_test_discovery_" + std::to_string(getpid()));
        fs::create_directories(root / "alpha");
        fs::create_directories(root / "beta");
    }

    ~TmpDirs() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string dir(const char* name) const { return (root / name).string(); }
};

} // namespace

TEST_CASE("Display names", "[discovery]") {
    REQUIRE(SessionDiscovery::display_name("/home/u/proj", std::string("main")) == "proj (main)");
    REQUIRE(SessionDiscovery::display_name("/home/u/proj/", std::nullopt) == "proj");
    REQUIRE(SessionDiscovery::display_name("/home/u/proj", std::string("")) == "proj");
}

TEST_CASE("SessionDiscovery", "[discovery]") {
    TmpDirs dirs;
    SessionRegistry reg;
    FakeProcessTree tree;
    RecentDirs recent(10);

    std::map<std::string, std::string> branches = {{dirs.dir("alpha"), "main"}};
    auto lookup = [&branches](const std::string& dir) -> std::optional<std::string> {
        auto it = branches.find(dir);
        if (it == branches.end()) return std::nullopt;
        return it->second;
    };

    Config::Discovery options;
    SessionDiscovery discovery(reg, tree, recent, options, lookup);

    SECTION("RegistersRunningAgents") {
        tree.add(100, 1, "bash");
        tree.add(101, 100, "claude");
        tree.set_cwd(101, dirs.dir("alpha"));
        tree.add(200, 1, "zsh");
        tree.add(201, 200, "claude");
        tree.set_cwd(201, dirs.dir("beta"));

        REQUIRE(discovery.run(kSelf) == 2);

        auto a = reg.get("discovered-101");
        REQUIRE(a.has_value());
        REQUIRE(a->name == "alpha (main)");
        REQUIRE(a->shell_pid == 100);
        REQUIRE(a->agent_pid == 101);
        REQUIRE(a->status == SessionStatus::Idle);
        REQUIRE(a->group == "alpha");

        auto b = reg.get("discovered-201");
        REQUIRE(b.has_value());
        REQUIRE(b->name == "beta");

        auto rec = recent.entries();
        REQUIRE(rec.size() == 2);
    }

    SECTION("SkipsNonCandidates") {
        tree.add(100, 1, "bash");
        tree.add(101, 100, "node");           // wrong name
        tree.add(102, 1, "claude");           // parented by init
        tree.add(103, 100, "Claude");         // desktop app
        tree.add(104, kSelf, "claude");       // our own child
        tree.add(kSelf, 100, "claude");       // ourselves

        REQUIRE(discovery.run(kSelf) == 0);
        REQUIRE(reg.size() == 0);
    }

    SECTION("HelperOfAgentIsNotASession") {
        tree.add(100, 1, "bash");
        tree.add(101, 100, "claude");
        tree.add(102, 101, "claude");

        REQUIRE(discovery.run(kSelf) == 1);
        REQUIRE(reg.get("discovered-101").has_value());
        REQUIRE_FALSE(reg.get("discovered-102").has_value());
    }

    SECTION("AlreadyTrackedShellIsSkipped") {
        reg.register_session({.id = "wrapped", .name = "wrapped", .shell_pid = 100,
                              .agent_pid = std::nullopt, .working_dir = std::nullopt});
        tree.add(100, 1, "bash");
        tree.add(101, 100, "claude");

        REQUIRE(discovery.run(kSelf) == 0);
        REQUIRE(reg.size() == 1);
        REQUIRE(reg.get("wrapped").has_value());
    }

    SECTION("MissingWorkingDirectory") {
        tree.add(100, 1, "bash");
        tree.add(101, 100, "claude");

        REQUIRE(discovery.run(kSelf) == 1);
        auto s = reg.get("discovered-101");
        REQUIRE(s->name == "claude [101]");
        REQUIRE(s->group == kDefaultGroup);
        REQUIRE(recent.entries().empty());
    }

    SECTION("ListingFailureFindsNothing") {
        tree.add(100, 1, "bash");
        tree.add(101, 100, "claude");
        tree.fail_listing(true);

        REQUIRE(discovery.run(kSelf) == 0);
        REQUIRE(reg.size() == 0);
    }
}

TEST_CASE("SessionDiscovery custom command", "[discovery]") {
    SessionRegistry reg;
    FakeProcessTree tree;
    RecentDirs recent;

    Config::Discovery options{.enabled = true, .command = "aider", .exclude = {}};
    SessionDiscovery discovery(reg, tree, recent, options, nullptr);

    tree.add(100, 1, "bash");
    tree.add(101, 100, "aider");
    tree.add(102, 100, "claude");

    REQUIRE(discovery.run(kSelf) == 1);
    REQUIRE(reg.get("discovered-101").has_value());
}
