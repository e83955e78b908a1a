#pragma once

#include "protocol/message.h"

#include <asio.hpp>
#include <spdlog/logger.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

/**
 * Receives room beacons on the discovery port.
 *
 * Every valid beacon is reported as a Room whose host_ip is the datagram's
 * source address. Anything else is dropped. Rooms are not de-duplicated and
 * never expire.
 */
class BeaconListener : public std::enable_shared_from_this<BeaconListener> {
public:
    using RoomCallback = std::function<void(const Room& room)>;

    BeaconListener(asio::io_context& io, std::shared_ptr<spdlog::logger> log);

    /// Bind 0.0.0.0:`port` (0 picks a free port) and start receiving.
    /// Returns the bound port. Throws std::system_error if binding fails.
    uint16_t start(uint16_t port, RoomCallback on_room_found);

    void stop();

    void set_on_room_found(RoomCallback cb);

    [[nodiscard]] bool is_running() const { return socket_.is_open() && !stopped_; }

private:
    void do_receive();
    void handle_datagram(std::size_t length);

    asio::ip::udp::socket socket_;
    std::shared_ptr<spdlog::logger> log_;
    asio::ip::udp::endpoint sender_;
    std::array<char, 65536> buffer_{};
    RoomCallback on_room_found_;
    bool stopped_ = false;
};
