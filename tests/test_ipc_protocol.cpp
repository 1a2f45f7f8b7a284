#include <catch2/catch_test_macros.hpp>

#include "platform/linux/unix_socket_client.hpp"
#include "platform/linux/unix_socket_server.hpp"

#include <chrono>
#include <cstring>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>

using json = nlohmann::json;

namespace {

std::string tmp_socket_path() {
    return "/tmp/ab_test_ipc_" + std::to_string(getpid()) + ".sock";
}

// Server socket is non-blocking, so poll briefly for data to arrive.
ReadResult read_with_retry(UnixSocketServer& server, int fd, json& out) {
    ReadResult res = ReadResult::Pending;
    for (int i = 0; i < 100 && res == ReadResult::Pending; ++i) {
        res = server.read_command(fd, out);
        if (res == ReadResult::Pending) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return res;
}

// Raw connected socket, for sending bytes the client class never would.
int raw_connect(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

} // namespace

TEST_CASE("IPC protocol", "[ipc]") {
    auto sock_path = tmp_socket_path();

    SECTION("ServerStartStop") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));
        REQUIRE(std::filesystem::exists(sock_path));
        server.stop();
        REQUIRE_FALSE(std::filesystem::exists(sock_path));
    }

    SECTION("ConnectWithoutServerFails") {
        UnixSocketClient client;
        REQUIRE_FALSE(client.connect(sock_path));
        REQUIRE_FALSE(client.call({{"cmd", "list"}}).has_value());
    }

    SECTION("RoundTrip") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        REQUIRE(client.send({{"cmd", "list"}}));

        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Message);
        REQUIRE(received["cmd"] == "list");

        REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"sessions", json::array()}}));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["status"] == "ok");
        REQUIRE(client_resp["sessions"].empty());

        server.close_client(client_fd);
    }

    SECTION("InvalidUtf8IsReplaced") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        // Latin-1 directory name, as read back from /proc/<pid>/cwd.
        const std::string latin1 = "/tmp/\xE9t\xE9";
        const std::string replaced = "/tmp/\xEF\xBF\xBDt\xEF\xBF\xBD";

        REQUIRE(client.send({{"cmd", "create"}, {"id", "s1"}, {"cwd", latin1}}));
        json received;
        REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Message);
        REQUIRE(received["cwd"] == replaced);

        json session = {{"id", "s1"}, {"cwd", latin1}, {"group", "\xE9t\xE9"}};
        json list = {{"status", "ok"}, {"sessions", json::array({session})}};
        REQUIRE(server.send_response(client_fd, list));

        json client_resp;
        REQUIRE(client.recv(client_resp, 1000));
        REQUIRE(client_resp["status"] == "ok");
        REQUIRE(client_resp["sessions"][0]["cwd"] == replaced);

        server.close_client(client_fd);
    }

    SECTION("RequestsOnOneConnection") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        for (int i = 0; i < 5; ++i) {
            REQUIRE(client.send({{"cmd", "list"}, {"seq", i}}));

            json received;
            REQUIRE(read_with_retry(server, client_fd, received) == ReadResult::Message);
            REQUIRE(received["seq"] == i);
            REQUIRE(server.send_response(client_fd, {{"status", "ok"}, {"seq", i}}));

            json client_resp;
            REQUIRE(client.recv(client_resp, 1000));
            REQUIRE(client_resp["seq"] == i);
        }
    }

    SECTION("PipelinedRequestsAreBuffered") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int fd = raw_connect(sock_path);
        REQUIRE(fd >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string two = R"({"cmd":"a"})" "\n" R"({"cmd":"b"})" "\n";
        REQUIRE(::send(fd, two.data(), two.size(), 0) == static_cast<ssize_t>(two.size()));

        json first;
        REQUIRE(read_with_retry(server, client_fd, first) == ReadResult::Message);
        REQUIRE(first["cmd"] == "a");
        REQUIRE(server.has_buffered_command(client_fd));

        json second;
        REQUIRE(server.read_command(client_fd, second) == ReadResult::Message);
        REQUIRE(second["cmd"] == "b");
        REQUIRE_FALSE(server.has_buffered_command(client_fd));

        ::close(fd);
    }

    SECTION("PartialLineIsPending") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int fd = raw_connect(sock_path);
        REQUIRE(fd >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string head = R"({"cmd":)";
        REQUIRE(::send(fd, head.data(), head.size(), 0) == static_cast<ssize_t>(head.size()));
        std::this_thread::sleep_for(std::chrono::milliseconds(10));

        json cmd;
        REQUIRE(server.read_command(client_fd, cmd) == ReadResult::Pending);

        std::string tail = "\"list\"}\n";
        REQUIRE(::send(fd, tail.data(), tail.size(), 0) == static_cast<ssize_t>(tail.size()));
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Message);
        REQUIRE(cmd["cmd"] == "list");

        ::close(fd);
    }

    SECTION("MalformedJsonClosesClient") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        int fd = raw_connect(sock_path);
        REQUIRE(fd >= 0);
        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        std::string junk = "not json\n";
        REQUIRE(::send(fd, junk.data(), junk.size(), 0) == static_cast<ssize_t>(junk.size()));

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Closed);
        server.close_client(client_fd);
        ::close(fd);
    }

    SECTION("ClientDisconnect") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));

        int client_fd = server.accept_client();
        REQUIRE(client_fd >= 0);

        client.close();

        json cmd;
        REQUIRE(read_with_retry(server, client_fd, cmd) == ReadResult::Closed);
        server.close_client(client_fd);
    }

    SECTION("RecvTimesOut") {
        UnixSocketServer server;
        REQUIRE(server.start(sock_path));

        UnixSocketClient client;
        REQUIRE(client.connect(sock_path));
        REQUIRE(server.accept_client() >= 0);

        json resp;
        REQUIRE_FALSE(client.recv(resp, 20));
    }
}
