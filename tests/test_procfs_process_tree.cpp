#include <catch2/catch_test_macros.hpp>

#include "platform/linux/procfs_process_tree.hpp"

#include <algorithm>
#include <filesystem>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

// Forked child that idles until signalled. Optionally forks a grandchild of
// its own and reports its pid back through a pipe.
struct ChildProcess {
    pid_t pid = -1;
    pid_t grandchild = -1;

    explicit ChildProcess(bool with_grandchild = false) {
        int fds[2];
        if (::pipe(fds) < 0) return;

        pid = ::fork();
        if (pid == 0) {
            ::close(fds[0]);
            pid_t gc = -1;
            if (with_grandchild) {
                gc = ::fork();
                if (gc == 0) {
                    ::close(fds[1]);
                    for (;;) ::pause();
                }
            }
            if (::write(fds[1], &gc, sizeof(gc)) < 0) ::_exit(1);
            ::close(fds[1]);
            for (;;) ::pause();
        }

        ::close(fds[1]);
        if (pid > 0 && ::read(fds[0], &grandchild, sizeof(grandchild)) != sizeof(grandchild)) {
            grandchild = -1;
        }
        ::close(fds[0]);
    }

    // Returns true when the child was reaped after dying of SIGTERM.
    bool reap_terminated() {
        int status = 0;
        if (::waitpid(pid, &status, 0) != pid) return false;
        pid = -1;
        return WIFSIGNALED(status) && WTERMSIG(status) == SIGTERM;
    }

    ~ChildProcess() {
        if (grandchild > 0) ::kill(grandchild, SIGKILL);
        if (pid > 0) {
            ::kill(pid, SIGKILL);
            ::waitpid(pid, nullptr, 0);
        }
    }
};

} // namespace

TEST_CASE("ProcfsProcessTree", "[process][procfs]") {
    ProcfsProcessTree tree;
    int self = static_cast<int>(::getpid());

    SECTION("SelfIsAlive") {
        REQUIRE(tree.is_alive(self));
    }

    SECTION("BogusPidsAreDead") {
        REQUIRE_FALSE(tree.is_alive(0));
        REQUIRE_FALSE(tree.is_alive(-5));
        REQUIRE_FALSE(tree.is_alive(0x7ffffff0));
    }

    SECTION("ListIncludesSelf") {
        auto procs = tree.list_processes();
        REQUIRE(procs.has_value());
        auto it = std::ranges::find(*procs, self, &ProcessInfo::pid);
        REQUIRE(it != procs->end());
        REQUIRE(it->ppid == static_cast<int>(::getppid()));
        REQUIRE_FALSE(it->comm.empty());
    }

    SECTION("WorkingDirectoryOfSelf") {
        auto cwd = tree.working_directory(self);
        REQUIRE(cwd.has_value());
        REQUIRE(std::filesystem::equivalent(*cwd, std::filesystem::current_path()));
    }

    SECTION("WorkingDirectoryOfMissingProcess") {
        REQUIRE_FALSE(tree.working_directory(0x7ffffff0).has_value());
    }

    SECTION("CpuSamples") {
        auto first = tree.process_cpu(self);
        REQUIRE(first.has_value());
        REQUIRE(*first >= 0.0);

        auto second = tree.process_cpu(self);
        REQUIRE(second.has_value());
        REQUIRE(*second >= 0.0);

        REQUIRE_FALSE(tree.process_cpu(0x7ffffff0).has_value());
    }

    SECTION("RefusesToSignalInit") {
        REQUIRE_FALSE(tree.terminate(1).has_value());
        REQUIRE_FALSE(tree.terminate(0).has_value());
    }

    SECTION("ChildIsListedUnderSelf") {
        ChildProcess child;
        REQUIRE(child.pid > 0);

        auto kids = tree.direct_children(self, nullptr);
        REQUIRE(kids.has_value());
        REQUIRE(std::ranges::find(*kids, child.pid) != kids->end());

        auto none = tree.direct_children(self, [](const std::string&) { return false; });
        REQUIRE(none.has_value());
        REQUIRE(none->empty());

        REQUIRE(tree.aggregate_cpu(child.pid).has_value());
    }

    SECTION("TerminateChild") {
        ChildProcess child;
        REQUIRE(child.pid > 0);
        REQUIRE(tree.is_alive(child.pid));

        REQUIRE(tree.terminate(child.pid).has_value());
        REQUIRE(child.reap_terminated());
    }

    SECTION("KillTreeReachesGrandchild") {
        ChildProcess child(true);
        REQUIRE(child.pid > 0);
        REQUIRE(child.grandchild > 0);

        auto report = tree.kill_tree(child.pid);
        REQUIRE(report.ok());
        REQUIRE(report.attempted == 2);
        REQUIRE(child.reap_terminated());
        child.grandchild = -1;
    }
}
