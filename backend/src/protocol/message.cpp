/**
 * Message codec: the closed set of messages exchanged between nodes.
 *
 * Every message is one JSON object tagged by its "op" field. TCP messages
 * are newline-terminated by the transport; beacons travel one per datagram.
 *
 *   beacon  {"op":"beacon","room":s,"port":n,"host":s}
 *   hello   {"op":"hello","name":s}
 *   peers   {"op":"peers","data":[{"name":s,"ip":s,"status":s}, ...]}
 */

#include "protocol/message.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string require_string(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        throw ProtocolError(std::string("field '") + key + "' must be a string");
    }
    return it->get<std::string>();
}

uint16_t require_port(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        throw ProtocolError(std::string("field '") + key + "' must be an integer");
    }
    const auto value = it->get<int64_t>();
    if (value < 1 || value > 65535) {
        throw ProtocolError(std::string("field '") + key + "' out of range");
    }
    return static_cast<uint16_t>(value);
}

json peer_to_json(const Peer& peer) {
    return json{{"name", peer.name}, {"ip", peer.ip}, {"status", peer.status}};
}

Peer peer_from_json(const json& object) {
    if (!object.is_object()) {
        throw ProtocolError("peer entry must be an object");
    }
    return Peer{require_string(object, "name"),
                require_string(object, "ip"),
                require_string(object, "status")};
}

Message decode_object(const json& object) {
    if (!object.is_object()) {
        throw ProtocolError("message must be a JSON object");
    }
    const std::string op = require_string(object, "op");

    if (op == "beacon") {
        return BeaconMessage{require_string(object, "room"),
                             require_port(object, "port"),
                             require_string(object, "host")};
    }
    if (op == "hello") {
        return HelloMessage{require_string(object, "name")};
    }
    if (op == "peers") {
        auto it = object.find("data");
        if (it == object.end() || !it->is_array()) {
            throw ProtocolError("field 'data' must be an array");
        }
        PeersMessage message;
        message.peers.reserve(it->size());
        for (const auto& entry : *it) {
            message.peers.push_back(peer_from_json(entry));
        }
        return message;
    }
    throw ProtocolError("unknown op '" + op + "'");
}

} // namespace

std::string encode_message(const Message& message) {
    json out = std::visit(overloaded{
        [](const BeaconMessage& m) {
            return json{{"op", "beacon"}, {"room", m.room}, {"port", m.port}, {"host", m.host}};
        },
        [](const HelloMessage& m) {
            return json{{"op", "hello"}, {"name", m.name}};
        },
        [](const PeersMessage& m) {
            json data = json::array();
            for (const auto& peer : m.peers) {
                data.push_back(peer_to_json(peer));
            }
            return json{{"op", "peers"}, {"data", std::move(data)}};
        },
    }, message);
    return out.dump(-1, ' ', false, json::error_handler_t::replace);
}

Message decode_message(std::string_view text) {
    json object;
    try {
        object = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("invalid JSON: ") + e.what());
    }
    return decode_object(object);
}

const char* message_op(const Message& message) {
    return std::visit(overloaded{
        [](const BeaconMessage&) { return "beacon"; },
        [](const HelloMessage&)  { return "hello"; },
        [](const PeersMessage&)  { return "peers"; },
    }, message);
}
