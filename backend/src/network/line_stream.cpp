#include "network/line_stream.h"

#include <utility>

LineStream::LineStream(asio::ip::tcp::socket socket, std::shared_ptr<spdlog::logger> log,
                       std::size_t max_line_length)
    : socket_(std::move(socket)), log_(std::move(log)), inbox_(max_line_length) {
    asio::error_code ec;
    const auto remote = socket_.remote_endpoint(ec);
    remote_address_ = ec ? std::string("unknown") : remote.address().to_string();
}

void LineStream::async_read_line(ReadHandler handler) {
    auto self = shared_from_this();
    asio::async_read_until(socket_, inbox_, '\n',
        [self, handler = std::move(handler)](const asio::error_code& ec, std::size_t length) {
            if (ec) {
                handler(ec, std::string());
                return;
            }
            const auto data = self->inbox_.data();
            std::string line(asio::buffers_begin(data), asio::buffers_begin(data) + length);
            self->inbox_.consume(length);

            while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
                line.pop_back();
            }
            handler(ec, std::move(line));
        });
}

void LineStream::write_line(std::string line) {
    if (!socket_.is_open()) {
        return;
    }
    line.push_back('\n');
    const bool idle = outbox_.empty();
    outbox_.push_back(std::move(line));
    if (idle) {
        do_write();
    }
}

void LineStream::do_write() {
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(outbox_.front()),
        [self](const asio::error_code& ec, std::size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    self->log_->debug("Write to {} failed: {}", self->remote_address_, ec.message());
                }
                self->outbox_.clear();
                return;
            }
            self->outbox_.pop_front();
            if (!self->outbox_.empty()) {
                self->do_write();
            }
        });
}

void LineStream::close() {
    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
}
