#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/// Longest display name a host accepts in a hello, in bytes.
inline constexpr std::size_t kMaxNameLength = 256;

/// One participant as it appears on the wire.
struct Peer {
    std::string name;
    std::string ip;
    std::string status;

    bool operator==(const Peer& other) const {
        return name == other.name && ip == other.ip && status == other.status;
    }
    bool operator!=(const Peer& other) const { return !(*this == other); }
};

/// A hosted session as seen by a scanning node.
struct Room {
    std::string name;
    std::string host_display_name;
    uint16_t    tcp_port = 0;
    std::string host_ip;
};

/// UDP announcement sent by a host.
struct BeaconMessage {
    std::string room;
    uint16_t    port = 0;
    std::string host;
};

/// First line a client sends after connecting.
struct HelloMessage {
    std::string name;
};

/// Full membership list pushed by the host.
struct PeersMessage {
    std::vector<Peer> peers;
};

using Message = std::variant<BeaconMessage, HelloMessage, PeersMessage>;

/**
 * Thrown by decode_message() for anything that is not one of the known
 * message kinds: invalid JSON, missing/unknown "op", missing or mistyped
 * fields.
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

/// Serialise to a single-line JSON object (no trailing newline).
std::string encode_message(const Message& message);

/// Parse one JSON object. Throws ProtocolError.
Message decode_message(std::string_view text);

/// Wire tag for the alternative held by `message`.
const char* message_op(const Message& message);
