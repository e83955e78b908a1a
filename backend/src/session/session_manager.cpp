/**
 * SessionManager: owns the network thread and the session state machine.
 *
 *   Idle --start_host--> Hosting --shutdown--> Idle
 *   Idle --connect_to_room--> Connected --shutdown / host gone--> Idle
 *
 * Everything below run_on_network() executes on the network thread, so
 * session state needs no locking.
 */

#include "session/session_manager.h"

#include "network/address.h"

#include <exception>
#include <future>
#include <stdexcept>
#include <system_error>
#include <utility>

const char* to_string(SessionRole role) {
    switch (role) {
        case SessionRole::None:   return "idle";
        case SessionRole::Host:   return "hosting";
        case SessionRole::Client: return "connected";
    }
    return "unknown";
}

SessionManager::SessionManager(SessionConfig config, std::shared_ptr<spdlog::logger> log)
    : config_(std::move(config)),
      log_(std::move(log)),
      work_(asio::make_work_guard(io_)),
      thread_([this] { run_network(); }) {}

SessionManager::~SessionManager() {
    shutdown();
    work_.reset();
    io_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

template <typename Fn>
auto SessionManager::run_on_network(Fn&& fn) -> decltype(fn()) {
    if (io_.get_executor().running_in_this_thread()) {
        return fn();
    }
    std::packaged_task<decltype(fn())()> task(std::forward<Fn>(fn));
    auto result = task.get_future();
    asio::post(io_, [&task] { task(); });
    return result.get();
}

void SessionManager::run_network() {
    for (;;) {
        try {
            io_.run();
            return;
        } catch (const std::exception& e) {
            log_->error("Unhandled exception on network thread: {}", e.what());
        }
    }
}

// ── Public API ──────────────────────────────────────────────────────────────

void SessionManager::start_host(const std::string& room_name) {
    run_on_network([this, &room_name] { start_host_now(room_name); });
}

void SessionManager::start_client_scan(RoomCallback on_room_found) {
    run_on_network([this, &on_room_found] { start_scan_now(std::move(on_room_found)); });
}

bool SessionManager::connect_to_room(const std::string& ip, uint16_t port) {
    if (io_.get_executor().running_in_this_thread()) {
        throw std::logic_error("connect_to_room() cannot be called from a session callback");
    }
    std::promise<bool> connected;
    auto result = connected.get_future();
    asio::post(io_, [this, &ip, port, &connected] {
        begin_connect(ip, port, [&connected](bool ok) { connected.set_value(ok); });
    });
    return result.get();
}

void SessionManager::shutdown() {
    run_on_network([this] { shutdown_now(); });
}

SubscriptionId SessionManager::subscribe(SessionEvents events) {
    return run_on_network([this, &events] {
        const SubscriptionId id = next_subscription_++;
        subscribers_.emplace(id, std::move(events));
        return id;
    });
}

void SessionManager::unsubscribe(SubscriptionId id) {
    run_on_network([this, id] { subscribers_.erase(id); });
}

SessionRole SessionManager::role() {
    return run_on_network([this] { return role_; });
}

std::string SessionManager::room_name() {
    return run_on_network([this] { return room_name_; });
}

std::string SessionManager::host_ip() {
    return run_on_network([this] { return host_ip_; });
}

uint16_t SessionManager::tcp_port() {
    return run_on_network([this] { return tcp_port_; });
}

std::vector<Peer> SessionManager::peers() {
    return run_on_network([this] {
        if (role_ == SessionRole::Host && server_) {
            return server_->peers();
        }
        if (role_ == SessionRole::Client && client_) {
            return client_->peers();
        }
        return std::vector<Peer>();
    });
}

bool SessionManager::is_scanning() {
    return run_on_network([this] { return listener_ != nullptr && listener_->is_running(); });
}

// ── Network thread ──────────────────────────────────────────────────────────

void SessionManager::start_host_now(const std::string& room_name) {
    shutdown_now();

    const asio::ip::udp::endpoint beacon_target(
        asio::ip::make_address_v4(config_.broadcast_address), config_.discovery_port);
    const std::string ip = resolve_local_ip(config_.probe_address, config_.probe_port);

    auto server = std::make_shared<SessionServer>(io_, log_);
    auto broadcaster = std::make_shared<BeaconBroadcaster>(io_, log_, beacon_target,
                                                           config_.beacon_interval);
    server->set_on_peers_changed([this](const std::vector<Peer>& peers) { publish_peers(peers); });

    const uint16_t port = server->start(Peer{config_.display_name + " (Host)", ip, "idle"});
    try {
        broadcaster->start(BeaconMessage{room_name, port, config_.display_name});
    } catch (const std::system_error& e) {
        log_->error("Cannot open beacon socket: {}", e.what());
        server->stop();
        throw;
    }

    server_ = std::move(server);
    broadcaster_ = std::move(broadcaster);
    role_ = SessionRole::Host;
    room_name_ = room_name;
    host_ip_ = ip;
    tcp_port_ = port;
    log_->info("Hosting room '{}' on {}:{}", room_name, ip, port);
}

void SessionManager::start_scan_now(RoomCallback on_room_found) {
    if (role_ != SessionRole::None) {
        log_->warn("Not scanning: session is {}", to_string(role_));
        return;
    }
    if (listener_) {
        listener_->set_on_room_found(std::move(on_room_found));
        return;
    }
    auto listener = std::make_shared<BeaconListener>(io_, log_);
    listener->start(config_.discovery_port, std::move(on_room_found));
    listener_ = std::move(listener);
}

void SessionManager::begin_connect(const std::string& ip, uint16_t port,
                                   std::function<void(bool)> on_done) {
    if (role_ != SessionRole::None || client_) {
        log_->warn("Not connecting to {}:{}: session is {}", ip, port,
                   client_ ? "already connecting" : to_string(role_));
        on_done(false);
        return;
    }

    auto client = std::make_shared<SessionClient>(io_, log_, config_.display_name);
    std::weak_ptr<SessionClient> weak_client = client;
    client->set_on_peers([this](const std::vector<Peer>& peers) { publish_peers(peers); });
    client->set_on_closed([this, weak_client] { on_client_closed(weak_client.lock()); });
    client_ = client;

    client->async_connect(ip, port, [this, client, ip, port, on_done = std::move(on_done)](bool ok) {
        if (!ok || client != client_) {
            if (client == client_) {
                client_.reset();
            }
            on_done(false);
            return;
        }
        if (listener_) {
            listener_->stop();
            listener_.reset();
        }
        role_ = SessionRole::Client;
        host_ip_ = ip;
        tcp_port_ = port;
        log_->info("Connected to {}:{}", ip, port);
        on_done(true);
    });
}

void SessionManager::shutdown_now() {
    const bool active = role_ != SessionRole::None || listener_ || client_;

    subscribers_.clear();
    if (broadcaster_) {
        broadcaster_->stop();
        broadcaster_.reset();
    }
    if (server_) {
        server_->stop();
        server_.reset();
    }
    if (listener_) {
        listener_->stop();
        listener_.reset();
    }
    if (client_) {
        client_->stop();
        client_.reset();
    }

    role_ = SessionRole::None;
    room_name_.clear();
    host_ip_.clear();
    tcp_port_ = 0;

    if (active) {
        log_->info("Session closed");
    }
}

void SessionManager::on_client_closed(const std::shared_ptr<SessionClient>& client) {
    if (!client || client != client_) {
        return;
    }

    std::vector<std::function<void()>> handlers;
    for (const auto& entry : subscribers_) {
        if (entry.second.on_session_ended) {
            handlers.push_back(entry.second.on_session_ended);
        }
    }
    shutdown_now();
    for (const auto& handler : handlers) {
        handler();
    }
}

void SessionManager::publish_peers(const std::vector<Peer>& peers) {
    // Copies: a handler may unsubscribe or shut the session down.
    const std::vector<Peer> list = peers;
    std::vector<std::function<void(const std::vector<Peer>&)>> handlers;
    for (const auto& entry : subscribers_) {
        if (entry.second.on_peers_changed) {
            handlers.push_back(entry.second.on_peers_changed);
        }
    }
    for (const auto& handler : handlers) {
        handler(list);
    }
}
