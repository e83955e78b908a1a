#pragma once

#include "config/session_config.h"
#include "network/beacon_broadcaster.h"
#include "network/beacon_listener.h"
#include "network/session_client.h"
#include "network/session_server.h"
#include "protocol/message.h"

#include <asio.hpp>
#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

enum class SessionRole { None, Host, Client };

const char* to_string(SessionRole role);

/// Handlers a presentation layer registers with SessionManager::subscribe().
struct SessionEvents {
    /// Full membership list after every change (host and client side).
    std::function<void(const std::vector<Peer>& peers)> on_peers_changed;
    /// The host went away while connected as a client.
    std::function<void()> on_session_ended;
};

using SubscriptionId = uint64_t;

/**
 * Single entry point for hosting, scanning and joining a LAN session.
 *
 * Owns one io_context and the thread that runs it; every socket, timer and
 * piece of session state lives on that thread. Public methods may be called
 * from any thread: they are executed on the network thread and return once
 * it has finished. Callbacks are invoked on the network thread.
 *
 * Roles: None (idle), Host, Client. Switching between Host and Client
 * always goes through shutdown().
 */
class SessionManager {
public:
    using RoomCallback = BeaconListener::RoomCallback;

    SessionManager(SessionConfig config, std::shared_ptr<spdlog::logger> log);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// Shut down any previous session, then bind the session server and
    /// start announcing `room_name`. Throws std::system_error if the
    /// listener or beacon socket cannot be set up; the node is then idle.
    void start_host(const std::string& room_name);

    /// Listen for beacons and report each one to `on_room_found`. Calling it
    /// again while scanning replaces the callback. Refused while hosting or
    /// connected. Throws std::system_error if the discovery port is taken.
    void start_client_scan(RoomCallback on_room_found);

    /// Join the host at `ip:port`. Returns false if the connection fails or
    /// the node is not idle. Must not be called from a session callback.
    bool connect_to_room(const std::string& ip, uint16_t port);

    /// Stop everything and forget all session state and subscriptions.
    /// Safe to call in any state, any number of times.
    void shutdown();

    SubscriptionId subscribe(SessionEvents events);
    void unsubscribe(SubscriptionId id);

    [[nodiscard]] SessionRole role();
    [[nodiscard]] std::string room_name();
    [[nodiscard]] std::string host_ip();
    [[nodiscard]] uint16_t tcp_port();
    [[nodiscard]] std::vector<Peer> peers();
    [[nodiscard]] bool is_scanning();

private:
    template <typename Fn>
    auto run_on_network(Fn&& fn) -> decltype(fn());

    void run_network();
    void start_host_now(const std::string& room_name);
    void start_scan_now(RoomCallback on_room_found);
    void begin_connect(const std::string& ip, uint16_t port, std::function<void(bool)> on_done);
    void shutdown_now();
    void on_client_closed(const std::shared_ptr<SessionClient>& client);
    void publish_peers(const std::vector<Peer>& peers);

    SessionConfig config_;
    std::shared_ptr<spdlog::logger> log_;

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread thread_;

    // Network thread only.
    SessionRole role_ = SessionRole::None;
    std::string room_name_;
    std::string host_ip_;
    uint16_t tcp_port_ = 0;
    std::shared_ptr<SessionServer> server_;
    std::shared_ptr<BeaconBroadcaster> broadcaster_;
    std::shared_ptr<BeaconListener> listener_;
    std::shared_ptr<SessionClient> client_;
    std::map<SubscriptionId, SessionEvents> subscribers_;
    SubscriptionId next_subscription_ = 1;
};
