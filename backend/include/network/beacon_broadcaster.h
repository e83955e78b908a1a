#pragma once

#include "protocol/message.h"

#include <asio.hpp>
#include <spdlog/logger.h>

#include <chrono>
#include <memory>
#include <string>

/**
 * Periodically announces a hosted room over UDP.
 *
 * The first beacon goes out on start(), then one per interval until stop().
 * A failed send is logged and the next one is attempted on schedule.
 */
class BeaconBroadcaster : public std::enable_shared_from_this<BeaconBroadcaster> {
public:
    BeaconBroadcaster(asio::io_context& io, std::shared_ptr<spdlog::logger> log,
                      asio::ip::udp::endpoint target, std::chrono::milliseconds interval);

    /// Open the broadcast socket and start announcing `beacon`.
    /// Throws std::system_error if the socket cannot be opened.
    void start(const BeaconMessage& beacon);

    void stop();

private:
    void send_beacon();
    void schedule_next();

    asio::ip::udp::socket socket_;
    asio::steady_timer timer_;
    std::shared_ptr<spdlog::logger> log_;
    asio::ip::udp::endpoint target_;
    std::chrono::milliseconds interval_;
    std::string payload_;
    bool stopped_ = false;
};
