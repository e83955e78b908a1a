#pragma once

#include <asio.hpp>
#include <spdlog/logger.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>

/**
 * Newline-framed TCP connection.
 *
 * Outgoing lines are queued and written one at a time, so a single stream
 * delivers in send order and a slow peer never blocks the caller. Write
 * failures are logged and drop the pending queue; the read side is what
 * reports connection loss.
 *
 * Must be owned by a shared_ptr: pending operations keep the stream alive.
 */
class LineStream : public std::enable_shared_from_this<LineStream> {
public:
    /// Default longest accepted incoming line, newline included.
    static constexpr std::size_t kMaxLineLength = 64 * 1024;

    using ReadHandler = std::function<void(const asio::error_code& ec, std::string line)>;

    LineStream(asio::ip::tcp::socket socket, std::shared_ptr<spdlog::logger> log,
               std::size_t max_line_length = kMaxLineLength);

    /// Read one line; `line` has the terminator stripped. Reports an error
    /// on EOF, on read failure, or when the line exceeds the stream's limit.
    void async_read_line(ReadHandler handler);

    /// Queue `line` (a '\n' is appended). No-op once closed.
    void write_line(std::string line);

    void close();

    [[nodiscard]] bool is_open() const { return socket_.is_open(); }
    [[nodiscard]] const std::string& remote_address() const { return remote_address_; }

private:
    void do_write();

    asio::ip::tcp::socket socket_;
    std::shared_ptr<spdlog::logger> log_;
    std::string remote_address_;
    asio::streambuf inbox_;
    std::deque<std::string> outbox_;
};
