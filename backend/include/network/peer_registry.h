#pragma once

#include "protocol/message.h"

#include <cstddef>
#include <cstdint>
#include <vector>

/// Identifies one accepted connection on the host. Never sent on the wire.
using ConnectionId = uint64_t;

/**
 * Host-side membership list in join order.
 *
 * Position 0 always holds the host's own entry (kSelfId) once reset() has
 * been called. Every other entry is keyed by the connection it arrived on,
 * so one connection can register at most one peer.
 */
class PeerRegistry {
public:
    static constexpr ConnectionId kSelfId = 0;

    /// Drop all entries and install `self` at position 0.
    void reset(Peer self);

    /// Append a peer for `id`. False if `id` is kSelfId or already registered.
    bool add(ConnectionId id, Peer peer);

    /// Remove the peer registered for `id`. The self-entry cannot be removed.
    bool remove(ConnectionId id);

    [[nodiscard]] bool contains(ConnectionId id) const { return find(id) != nullptr; }

    /// Entry registered for `id`, or nullptr.
    [[nodiscard]] const Peer* find(ConnectionId id) const;

    /// Wire-safe copy of the list, self-entry first.
    [[nodiscard]] std::vector<Peer> snapshot() const;

    /// Connection ids of every remote peer, in join order.
    [[nodiscard]] std::vector<ConnectionId> connection_ids() const;

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    void clear() { entries_.clear(); }

private:
    struct Entry {
        ConnectionId id;
        Peer peer;
    };

    std::vector<Entry> entries_;
};
