#include "network/beacon_listener.h"

#include <string_view>
#include <utility>
#include <variant>

BeaconListener::BeaconListener(asio::io_context& io, std::shared_ptr<spdlog::logger> log)
    : socket_(io), log_(std::move(log)) {}

uint16_t BeaconListener::start(uint16_t port, RoomCallback on_room_found) {
    const asio::ip::udp::endpoint endpoint(asio::ip::udp::v4(), port);
    socket_.open(endpoint.protocol());
    socket_.set_option(asio::socket_base::reuse_address(true));
    socket_.bind(endpoint);

    on_room_found_ = std::move(on_room_found);
    stopped_ = false;
    const uint16_t bound = socket_.local_endpoint().port();
    log_->info("Scanning for rooms on UDP port {}", bound);
    do_receive();
    return bound;
}

void BeaconListener::stop() {
    stopped_ = true;
    on_room_found_ = nullptr;
    asio::error_code ignored;
    socket_.close(ignored);
}

void BeaconListener::set_on_room_found(RoomCallback cb) {
    on_room_found_ = std::move(cb);
}

void BeaconListener::do_receive() {
    auto self = shared_from_this();
    socket_.async_receive_from(asio::buffer(buffer_), sender_,
        [self](const asio::error_code& ec, std::size_t length) {
            if (self->stopped_ || ec == asio::error::operation_aborted) {
                return;
            }
            if (ec) {
                self->log_->debug("Discovery receive failed: {}", ec.message());
            } else {
                self->handle_datagram(length);
            }
            self->do_receive();
        });
}

void BeaconListener::handle_datagram(std::size_t length) {
    const std::string sender = sender_.address().to_string();

    Message message;
    try {
        message = decode_message(std::string_view(buffer_.data(), length));
    } catch (const ProtocolError& e) {
        log_->debug("Ignoring datagram from {}: {}", sender, e.what());
        return;
    }
    const auto* beacon = std::get_if<BeaconMessage>(&message);
    if (beacon == nullptr) {
        log_->debug("Ignoring '{}' datagram from {}", message_op(message), sender);
        return;
    }

    if (on_room_found_) {
        on_room_found_(Room{beacon->room, beacon->host, beacon->port, sender});
    }
}
