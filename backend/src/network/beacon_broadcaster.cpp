#include "network/beacon_broadcaster.h"

#include <utility>

BeaconBroadcaster::BeaconBroadcaster(asio::io_context& io, std::shared_ptr<spdlog::logger> log,
                                     asio::ip::udp::endpoint target,
                                     std::chrono::milliseconds interval)
    : socket_(io), timer_(io), log_(std::move(log)), target_(std::move(target)), interval_(interval) {}

void BeaconBroadcaster::start(const BeaconMessage& beacon) {
    socket_.open(asio::ip::udp::v4());
    socket_.set_option(asio::socket_base::broadcast(true));
    payload_ = encode_message(beacon);
    stopped_ = false;

    log_->debug("Announcing '{}' to {}:{} every {} ms", beacon.room,
                target_.address().to_string(), target_.port(), interval_.count());
    send_beacon();
}

void BeaconBroadcaster::stop() {
    stopped_ = true;
    timer_.cancel();
    asio::error_code ignored;
    socket_.close(ignored);
}

void BeaconBroadcaster::send_beacon() {
    auto self = shared_from_this();
    socket_.async_send_to(asio::buffer(payload_), target_,
        [self](const asio::error_code& ec, std::size_t) {
            if (self->stopped_) {
                return;
            }
            if (ec) {
                self->log_->warn("Beacon error: {}", ec.message());
            }
            self->schedule_next();
        });
}

void BeaconBroadcaster::schedule_next() {
    auto self = shared_from_this();
    timer_.expires_after(interval_);
    timer_.async_wait([self](const asio::error_code& ec) {
        if (ec || self->stopped_) {
            return;
        }
        self->send_beacon();
    });
}
