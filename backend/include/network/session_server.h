#pragma once

#include "network/line_stream.h"
#include "network/peer_registry.h"
#include "protocol/message.h"

#include <asio.hpp>
#include <spdlog/logger.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * Host-side TCP acceptor that owns the session membership.
 *
 * Each accepted connection must open with a hello line; anything else is
 * dropped without registration. Registered peers are announced to every
 * connected peer with a full "peers" list on each join and leave.
 *
 * All methods must be called on the io_context's thread.
 */
class SessionServer : public std::enable_shared_from_this<SessionServer> {
public:
    using PeersCallback = std::function<void(const std::vector<Peer>& peers)>;

    SessionServer(asio::io_context& io, std::shared_ptr<spdlog::logger> log);

    /// Bind 0.0.0.0 on an OS-assigned port, install `self` at the head of the
    /// registry and start accepting. Returns the bound port.
    /// Throws std::system_error if the listener cannot be set up.
    uint16_t start(Peer self);

    /// Close the listener and every connection and clear the registry.
    /// No broadcast is sent and no callback fires afterwards.
    void stop();

    /// Invoked once per broadcast pass with the list that was sent.
    void set_on_peers_changed(PeersCallback cb);

    [[nodiscard]] uint16_t port() const { return port_; }
    [[nodiscard]] std::vector<Peer> peers() const { return registry_.snapshot(); }
    [[nodiscard]] std::size_t broadcast_count() const { return broadcast_count_; }

private:
    void do_accept();
    void on_accept(asio::ip::tcp::socket socket);
    void read_handshake(ConnectionId id, const std::shared_ptr<LineStream>& stream);
    void read_until_closed(ConnectionId id, const std::shared_ptr<LineStream>& stream);
    void on_connection_lost(ConnectionId id);
    void drop(ConnectionId id);
    void broadcast_peers();

    asio::ip::tcp::acceptor acceptor_;
    std::shared_ptr<spdlog::logger> log_;
    PeerRegistry registry_;
    std::unordered_map<ConnectionId, std::shared_ptr<LineStream>> connections_;
    ConnectionId next_id_ = PeerRegistry::kSelfId + 1;
    PeersCallback on_peers_changed_;
    uint16_t port_ = 0;
    std::size_t broadcast_count_ = 0;
    bool stopped_ = false;
};
