#pragma once

#include "network/line_stream.h"
#include "protocol/message.h"

#include <asio.hpp>
#include <spdlog/logger.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * TCP connection from a joining node to a session host.
 *
 * Sends the hello handshake and mirrors the host's peer list. All methods
 * must be called on the io_context's thread.
 */
class SessionClient : public std::enable_shared_from_this<SessionClient> {
public:
    using ConnectHandler = std::function<void(bool connected)>;
    using PeersCallback  = std::function<void(const std::vector<Peer>& peers)>;
    using ClosedCallback = std::function<void()>;

    /// A "peers" line grows with the session, so the client reads with a
    /// larger limit than the host's handshake reader.
    static constexpr std::size_t kMaxListLineLength = 4 * 1024 * 1024;

    SessionClient(asio::io_context& io, std::shared_ptr<spdlog::logger> log,
                  std::string display_name);

    /// Connect to `ip:port`. `on_done(true)` after the hello has been queued,
    /// `on_done(false)` on any failure (never throws).
    void async_connect(const std::string& ip, uint16_t port, ConnectHandler on_done);

    /// Close the connection. No callback fires afterwards.
    void stop();

    /// Called with the new list every time the host sends one.
    void set_on_peers(PeersCallback cb);

    /// Called once when the host closes the stream or it fails.
    void set_on_closed(ClosedCallback cb);

    [[nodiscard]] const std::vector<Peer>& peers() const { return peers_; }
    [[nodiscard]] bool is_connected() const { return stream_ != nullptr && stream_->is_open(); }

private:
    void read_loop();
    void handle_line(const std::string& line);

    asio::ip::tcp::socket socket_;
    std::shared_ptr<spdlog::logger> log_;
    std::string display_name_;
    std::shared_ptr<LineStream> stream_;
    std::vector<Peer> peers_;
    PeersCallback on_peers_;
    ClosedCallback on_closed_;
    bool stopped_ = false;
};
