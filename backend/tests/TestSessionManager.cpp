/**
 * @file TestSessionManager.cpp
 * @brief End-to-end tests for the SessionManager state machine over loopback.
 *
 * Each manager runs its own network thread, so these tests poll with
 * waitUntil() and keep callback state behind atomics or a mutex.
 */

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "session/session_manager.h"
#include "TestSupport.hpp"

using namespace test;

namespace {

struct PeerLog {
    std::mutex mutex;
    std::vector<std::vector<Peer>> updates;

    SessionEvents events()
    {
        return SessionEvents{[this](const std::vector<Peer>& peers) {
                                 std::lock_guard<std::mutex> lock(mutex);
                                 updates.push_back(peers);
                             },
                             nullptr};
    }

    size_t count()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return updates.size();
    }
};

} // namespace

TEST_CASE("New manager is idle and shutdown is idempotent", "[manager]")
{
    SessionManager manager(loopbackConfig("alice", freeUdpPort()), quietLogger());

    REQUIRE(manager.role() == SessionRole::None);
    REQUIRE(manager.peers().empty());
    REQUIRE_FALSE(manager.is_scanning());

    REQUIRE_NOTHROW(manager.shutdown());
    REQUIRE_NOTHROW(manager.shutdown());
    REQUIRE(manager.role() == SessionRole::None);
}

TEST_CASE("Hosting publishes the host as the only member", "[manager]")
{
    SessionManager manager(loopbackConfig("alice", freeUdpPort()), quietLogger());
    manager.start_host("Test");

    REQUIRE(manager.role() == SessionRole::Host);
    REQUIRE(manager.room_name() == "Test");
    REQUIRE(manager.tcp_port() != 0);
    REQUIRE(manager.host_ip() == "127.0.0.1");
    REQUIRE(manager.peers() == std::vector<Peer>{Peer{"alice (Host)", "127.0.0.1", "idle"}});

    manager.shutdown();
    REQUIRE(manager.role() == SessionRole::None);
    REQUIRE(manager.room_name().empty());
    REQUIRE(manager.tcp_port() == 0);
    REQUIRE(manager.peers().empty());
}

TEST_CASE("Host tracks a raw peer joining and leaving", "[manager]")
{
    SessionManager manager(loopbackConfig("alice", freeUdpPort()), quietLogger());
    manager.start_host("Test");
    PeerLog log;
    manager.subscribe(log.events());

    asio::io_context io;
    LinePeer peer = LinePeer::connect(io, manager.tcp_port());
    peer.send(R"({"op":"hello","name":"A"})");

    REQUIRE(runUntil(io, [&] { return !peer.lines().empty(); }));
    REQUIRE(peer.lastPeers().size() == 2);
    REQUIRE(waitUntil([&] { return manager.peers().size() == 2; }));
    REQUIRE(manager.peers()[1].name == "A");
    REQUIRE(waitUntil([&] { return log.count() == 1; }));

    peer.close();
    REQUIRE(waitUntil([&] { return manager.peers().size() == 1; }));
    REQUIRE(waitUntil([&] { return log.count() == 2; }));
    std::this_thread::sleep_for(100ms);
    REQUIRE(log.count() == 2);
}

TEST_CASE("Failed connect leaves the manager idle", "[manager]")
{
    SessionManager manager(loopbackConfig("bob", freeUdpPort()), quietLogger());

    REQUIRE_FALSE(manager.connect_to_room("127.0.0.1", closedTcpPort()));
    REQUIRE(manager.role() == SessionRole::None);
    REQUIRE_FALSE(manager.connect_to_room("bogus", 4000));
    REQUIRE(manager.role() == SessionRole::None);
}

TEST_CASE("Connect is refused while hosting", "[manager]")
{
    SessionManager host(loopbackConfig("alice", freeUdpPort()), quietLogger());
    SessionManager other(loopbackConfig("carol", freeUdpPort()), quietLogger());
    host.start_host("Test");
    other.start_host("Other");

    REQUIRE_FALSE(other.connect_to_room("127.0.0.1", host.tcp_port()));
    REQUIRE(other.role() == SessionRole::Host);
}

TEST_CASE("Client mirrors the host's membership", "[manager]")
{
    SessionManager host(loopbackConfig("alice", freeUdpPort()), quietLogger());
    SessionManager client(loopbackConfig("bob", freeUdpPort()), quietLogger());
    host.start_host("Test");

    REQUIRE(client.connect_to_room("127.0.0.1", host.tcp_port()));
    REQUIRE(client.role() == SessionRole::Client);
    REQUIRE(client.host_ip() == "127.0.0.1");
    REQUIRE(client.tcp_port() == host.tcp_port());

    REQUIRE(waitUntil([&] { return client.peers().size() == 2; }));
    REQUIRE(client.peers() == host.peers());
    REQUIRE(client.peers()[0].name == "alice (Host)");
    REQUIRE(client.peers()[1].name == "bob");

    SECTION("client leaving shrinks the host back to itself")
    {
        client.shutdown();
        REQUIRE(client.role() == SessionRole::None);
        REQUIRE(waitUntil([&] { return host.peers().size() == 1; }));
    }

    SECTION("host shutdown ends the client's session")
    {
        std::atomic<int> ended{0};
        client.subscribe(SessionEvents{nullptr, [&] { ++ended; }});

        host.shutdown();
        REQUIRE(waitUntil([&] { return ended.load() == 1; }));
        REQUIRE(client.role() == SessionRole::None);
        REQUIRE(client.peers().empty());
    }
}

TEST_CASE("A session that ended before subscribing reports the idle role", "[manager]")
{
    SessionManager host(loopbackConfig("alice", freeUdpPort()), quietLogger());
    SessionManager client(loopbackConfig("bob", freeUdpPort()), quietLogger());
    host.start_host("Test");
    REQUIRE(client.connect_to_room("127.0.0.1", host.tcp_port()));

    host.shutdown();
    REQUIRE(waitUntil([&] { return client.role() == SessionRole::None; }));

    std::atomic<int> events{0};
    client.subscribe(SessionEvents{[&](const std::vector<Peer>&) { ++events; }, [&] { ++events; }});
    std::this_thread::sleep_for(100ms);

    REQUIRE(events.load() == 0);
    REQUIRE(client.role() == SessionRole::None);
}

TEST_CASE("Restarting the host starts from a clean registry", "[manager]")
{
    SessionManager host(loopbackConfig("alice", freeUdpPort()), quietLogger());
    SessionManager client(loopbackConfig("bob", freeUdpPort()), quietLogger());
    host.start_host("First");
    REQUIRE(client.connect_to_room("127.0.0.1", host.tcp_port()));
    REQUIRE(waitUntil([&] { return host.peers().size() == 2; }));

    host.start_host("Second");

    REQUIRE(host.role() == SessionRole::Host);
    REQUIRE(host.room_name() == "Second");
    REQUIRE(host.peers().size() == 1);
    REQUIRE(waitUntil([&] { return client.role() == SessionRole::None; }));
}

TEST_CASE("Scanning finds a hosted room and connecting stops the scan", "[manager]")
{
    const uint16_t discovery = freeUdpPort();
    SessionManager host(loopbackConfig("alice", discovery), quietLogger());
    SessionManager scanner(loopbackConfig("bob", discovery), quietLogger());

    std::mutex mutex;
    std::vector<Room> rooms;
    scanner.start_client_scan([&](const Room& room) {
        std::lock_guard<std::mutex> lock(mutex);
        rooms.push_back(room);
    });
    REQUIRE(scanner.is_scanning());

    host.start_host("Test");
    REQUIRE(waitUntil([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return !rooms.empty();
    }));

    Room found;
    {
        std::lock_guard<std::mutex> lock(mutex);
        found = rooms.front();
    }
    REQUIRE(found.name == "Test");
    REQUIRE(found.host_display_name == "alice");
    REQUIRE(found.host_ip == "127.0.0.1");
    REQUIRE(found.tcp_port == host.tcp_port());

    REQUIRE(scanner.connect_to_room(found.host_ip, found.tcp_port));
    REQUIRE_FALSE(scanner.is_scanning());
    REQUIRE(waitUntil([&] { return host.peers().size() == 2; }));
}

TEST_CASE("Scanning is refused while hosting", "[manager]")
{
    SessionManager manager(loopbackConfig("alice", freeUdpPort()), quietLogger());
    manager.start_host("Test");

    manager.start_client_scan([](const Room&) {});
    REQUIRE_FALSE(manager.is_scanning());
    REQUIRE(manager.role() == SessionRole::Host);
}

TEST_CASE("Connecting from a session callback is rejected", "[manager]")
{
    const uint16_t discovery = freeUdpPort();
    SessionManager host(loopbackConfig("alice", discovery), quietLogger());
    SessionManager scanner(loopbackConfig("bob", discovery), quietLogger());

    std::atomic<bool> rejected{false};
    scanner.start_client_scan([&](const Room& room) {
        try {
            scanner.connect_to_room(room.host_ip, room.tcp_port);
        } catch (const std::logic_error&) {
            rejected = true;
        }
    });
    host.start_host("Test");

    REQUIRE(waitUntil([&] { return rejected.load(); }));
    REQUIRE(scanner.role() == SessionRole::None);
}
