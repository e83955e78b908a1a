/**
 * SessionServer: accepts joining peers and keeps their list in sync.
 *
 * Each connection gets its own LineStream. The first line must be a hello;
 * after that the server only reads to notice when the peer goes away.
 */

#include "network/session_server.h"

#include <utility>
#include <variant>

SessionServer::SessionServer(asio::io_context& io, std::shared_ptr<spdlog::logger> log)
    : acceptor_(io), log_(std::move(log)) {}

uint16_t SessionServer::start(Peer self) {
    const asio::ip::tcp::endpoint endpoint(asio::ip::tcp::v4(), 0);
    acceptor_.open(endpoint.protocol());
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();

    registry_.reset(std::move(self));
    stopped_ = false;
    do_accept();
    broadcast_peers();
    return port_;
}

void SessionServer::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    on_peers_changed_ = nullptr;

    asio::error_code ignored;
    acceptor_.close(ignored);
    for (auto& entry : connections_) {
        entry.second->close();
    }
    connections_.clear();
    registry_.clear();
}

void SessionServer::set_on_peers_changed(PeersCallback cb) {
    on_peers_changed_ = std::move(cb);
}

void SessionServer::do_accept() {
    auto self = shared_from_this();
    acceptor_.async_accept([self](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (self->stopped_ || ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            self->log_->warn("Accept failed: {}", ec.message());
        } else {
            self->on_accept(std::move(socket));
        }
        self->do_accept();
    });
}

void SessionServer::on_accept(asio::ip::tcp::socket socket) {
    const ConnectionId id = next_id_++;
    auto stream = std::make_shared<LineStream>(std::move(socket), log_);
    connections_.emplace(id, stream);
    log_->debug("Connection #{} from {}", id, stream->remote_address());
    read_handshake(id, stream);
}

void SessionServer::read_handshake(ConnectionId id, const std::shared_ptr<LineStream>& stream) {
    auto self = shared_from_this();
    stream->async_read_line([self, id, stream](const asio::error_code& ec, std::string line) {
        if (self->stopped_) {
            return;
        }
        if (ec) {
            self->log_->debug("Connection #{} closed before handshake: {}", id, ec.message());
            self->drop(id);
            return;
        }

        Message message;
        try {
            message = decode_message(line);
        } catch (const ProtocolError& e) {
            self->log_->warn("Rejecting {}: bad handshake ({})", stream->remote_address(), e.what());
            self->drop(id);
            return;
        }
        const auto* hello = std::get_if<HelloMessage>(&message);
        if (hello == nullptr) {
            self->log_->warn("Rejecting {}: expected hello, got {}",
                             stream->remote_address(), message_op(message));
            self->drop(id);
            return;
        }

        if (hello->name.size() > kMaxNameLength) {
            self->log_->warn("Rejecting {}: name is {} bytes, limit is {}",
                             stream->remote_address(), hello->name.size(), kMaxNameLength);
            self->drop(id);
            return;
        }

        self->registry_.add(id, Peer{hello->name, stream->remote_address(), "idle"});
        self->log_->info("{} joined from {}", hello->name, stream->remote_address());
        self->broadcast_peers();
        self->read_until_closed(id, stream);
    });
}

void SessionServer::read_until_closed(ConnectionId id, const std::shared_ptr<LineStream>& stream) {
    auto self = shared_from_this();
    stream->async_read_line([self, id, stream](const asio::error_code& ec, std::string) {
        if (self->stopped_) {
            return;
        }
        if (ec) {
            self->on_connection_lost(id);
            return;
        }
        self->read_until_closed(id, stream);
    });
}

void SessionServer::on_connection_lost(ConnectionId id) {
    drop(id);
    const Peer* peer = registry_.find(id);
    if (peer == nullptr) {
        return;
    }
    log_->info("{} ({}) left", peer->name, peer->ip);
    registry_.remove(id);
    broadcast_peers();
}

void SessionServer::drop(ConnectionId id) {
    auto it = connections_.find(id);
    if (it == connections_.end()) {
        return;
    }
    it->second->close();
    connections_.erase(it);
}

void SessionServer::broadcast_peers() {
    const std::vector<Peer> peers = registry_.snapshot();
    const std::vector<ConnectionId> targets = registry_.connection_ids();
    const std::string payload = encode_message(PeersMessage{peers});
    ++broadcast_count_;

    for (const ConnectionId id : targets) {
        auto it = connections_.find(id);
        if (it != connections_.end()) {
            it->second->write_line(payload);
        }
    }
    if (on_peers_changed_) {
        on_peers_changed_(peers);
    }
}
