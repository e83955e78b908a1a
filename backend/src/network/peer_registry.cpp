#include "network/peer_registry.h"

#include <algorithm>
#include <utility>

void PeerRegistry::reset(Peer self) {
    entries_.clear();
    entries_.push_back(Entry{kSelfId, std::move(self)});
}

bool PeerRegistry::add(ConnectionId id, Peer peer) {
    if (id == kSelfId || contains(id)) {
        return false;
    }
    entries_.push_back(Entry{id, std::move(peer)});
    return true;
}

bool PeerRegistry::remove(ConnectionId id) {
    if (id == kSelfId) {
        return false;
    }
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const Entry& e) { return e.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

const Peer* PeerRegistry::find(ConnectionId id) const {
    for (const auto& e : entries_) {
        if (e.id == id) {
            return &e.peer;
        }
    }
    return nullptr;
}

std::vector<Peer> PeerRegistry::snapshot() const {
    std::vector<Peer> peers;
    peers.reserve(entries_.size());
    for (const auto& e : entries_) {
        peers.push_back(e.peer);
    }
    return peers;
}

std::vector<ConnectionId> PeerRegistry::connection_ids() const {
    std::vector<ConnectionId> ids;
    for (const auto& e : entries_) {
        if (e.id != kSelfId) {
            ids.push_back(e.id);
        }
    }
    return ids;
}
