#include "network/address.h"

#include <asio.hpp>

std::string resolve_local_ip(const std::string& probe_host, uint16_t probe_port) {
    asio::error_code ec;
    const auto probe = asio::ip::make_address_v4(probe_host, ec);
    if (ec) {
        return kLoopbackAddress;
    }

    asio::io_context io;
    asio::ip::udp::socket socket(io);
    socket.open(asio::ip::udp::v4(), ec);
    if (ec) {
        return kLoopbackAddress;
    }
    socket.connect(asio::ip::udp::endpoint(probe, probe_port), ec);
    if (ec) {
        return kLoopbackAddress;
    }
    const auto local = socket.local_endpoint(ec);
    if (ec || local.address().is_unspecified()) {
        return kLoopbackAddress;
    }
    return local.address().to_string();
}
