/**
 * SessionClient: joins a host, sends hello, mirrors the peer list.
 */

#include "network/session_client.h"

#include <utility>
#include <variant>

SessionClient::SessionClient(asio::io_context& io, std::shared_ptr<spdlog::logger> log,
                             std::string display_name)
    : socket_(io), log_(std::move(log)), display_name_(std::move(display_name)) {}

void SessionClient::async_connect(const std::string& ip, uint16_t port, ConnectHandler on_done) {
    asio::error_code parse_error;
    const auto address = asio::ip::make_address(ip, parse_error);
    if (parse_error) {
        log_->error("Connection failed: '{}' is not an IP address", ip);
        on_done(false);
        return;
    }

    const asio::ip::tcp::endpoint endpoint(address, port);
    auto self = shared_from_this();
    socket_.async_connect(endpoint, [self, endpoint, on_done = std::move(on_done)](const asio::error_code& ec) {
        if (self->stopped_) {
            on_done(false);
            return;
        }
        if (ec) {
            self->log_->error("Connection to {}:{} failed: {}",
                              endpoint.address().to_string(), endpoint.port(), ec.message());
            asio::error_code ignored;
            self->socket_.close(ignored);
            on_done(false);
            return;
        }

        self->stream_ = std::make_shared<LineStream>(std::move(self->socket_), self->log_,
                                                     kMaxListLineLength);
        self->stream_->write_line(encode_message(HelloMessage{self->display_name_}));
        self->read_loop();
        on_done(true);
    });
}

void SessionClient::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    on_peers_ = nullptr;
    on_closed_ = nullptr;
    peers_.clear();

    asio::error_code ignored;
    socket_.close(ignored);
    if (stream_) {
        stream_->close();
    }
}

void SessionClient::set_on_peers(PeersCallback cb) {
    on_peers_ = std::move(cb);
}

void SessionClient::set_on_closed(ClosedCallback cb) {
    on_closed_ = std::move(cb);
}

void SessionClient::read_loop() {
    auto self = shared_from_this();
    stream_->async_read_line([self](const asio::error_code& ec, std::string line) {
        if (self->stopped_) {
            return;
        }
        if (ec) {
            self->log_->info("Disconnected from server ({})", ec.message());
            self->stream_->close();
            if (auto on_closed = std::move(self->on_closed_)) {
                self->on_closed_ = nullptr;
                on_closed();
            }
            return;
        }
        self->handle_line(line);
        if (!self->stopped_) {
            self->read_loop();
        }
    });
}

void SessionClient::handle_line(const std::string& line) {
    Message message;
    try {
        message = decode_message(line);
    } catch (const ProtocolError& e) {
        log_->warn("Skipping line from server: {}", e.what());
        return;
    }

    auto* update = std::get_if<PeersMessage>(&message);
    if (update == nullptr) {
        log_->debug("Ignoring '{}' message from server", message_op(message));
        return;
    }
    peers_ = std::move(update->peers);
    if (on_peers_) {
        on_peers_(peers_);
    }
}
