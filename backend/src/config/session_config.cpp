/**
 * SessionConfig loading.
 *
 * Layout (all keys optional):
 *   {
 *     "node":      { "username": "alice" },
 *     "discovery": { "port": 9999, "interval_ms": 2000,
 *                    "broadcast_address": "255.255.255.255" },
 *     "network":   { "probe_address": "8.8.8.8", "probe_port": 80 },
 *     "log":       { "level": "info" }
 *   }
 */

#include "config/session_config.h"

#include "protocol/message.h"

#include <asio/ip/address_v4.hpp>

#include <cstdlib>
#include <fstream>
#include <initializer_list>

using json = nlohmann::json;

namespace {

const json* section(const json& document, const char* name) {
    auto it = document.find(name);
    if (it == document.end()) {
        return nullptr;
    }
    if (!it->is_object()) {
        throw ConfigError(std::string("'") + name + "' must be an object");
    }
    return &*it;
}

template <typename T>
bool read_value(const json* object, const char* key, T& out) {
    if (object == nullptr) {
        return false;
    }
    auto it = object->find(key);
    if (it == object->end()) {
        return false;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
    return true;
}

uint16_t read_port(const json* object, const char* key, uint16_t fallback) {
    int64_t value = fallback;
    if (read_value(object, key, value) && (value < 1 || value > 65535)) {
        throw ConfigError(std::string("'") + key + "' must be between 1 and 65535");
    }
    return static_cast<uint16_t>(value);
}

std::string read_ipv4(const json* object, const char* key, const std::string& fallback) {
    std::string value = fallback;
    if (read_value(object, key, value)) {
        asio::error_code ec;
        asio::ip::make_address_v4(value, ec);
        if (ec) {
            throw ConfigError(std::string("'") + key + "' is not an IPv4 address: " + value);
        }
    }
    return value;
}

} // namespace

std::string default_display_name() {
    for (const char* var : {"USERNAME", "USER"}) {
        const char* value = std::getenv(var);
        if (value != nullptr && *value != '\0') {
            return value;
        }
    }
    return "User";
}

SessionConfig config_from_json(const json& document) {
    if (!document.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    SessionConfig config;
    config.display_name = default_display_name();

    const json* node = section(document, "node");
    if (read_value(node, "username", config.display_name)) {
        if (config.display_name.empty()) {
            throw ConfigError("'username' must not be empty");
        }
        if (config.display_name.size() > kMaxNameLength) {
            throw ConfigError("'username' must be at most " + std::to_string(kMaxNameLength) + " bytes");
        }
    }

    const json* discovery = section(document, "discovery");
    config.discovery_port = read_port(discovery, "port", config.discovery_port);
    int64_t interval_ms = config.beacon_interval.count();
    if (read_value(discovery, "interval_ms", interval_ms) && interval_ms <= 0) {
        throw ConfigError("'interval_ms' must be positive");
    }
    config.beacon_interval = std::chrono::milliseconds(interval_ms);
    config.broadcast_address = read_ipv4(discovery, "broadcast_address", config.broadcast_address);

    const json* network = section(document, "network");
    config.probe_address = read_ipv4(network, "probe_address", config.probe_address);
    config.probe_port = read_port(network, "probe_port", config.probe_port);

    const json* log = section(document, "log");
    std::string level;
    if (read_value(log, "level", level)) {
        config.log_level = spdlog::level::from_str(level);
        if (config.log_level == spdlog::level::off && level != "off") {
            throw ConfigError("unknown log level '" + level + "'");
        }
    }
    return config;
}

SessionConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path);
    }
    json document;
    try {
        document = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    return config_from_json(document);
}
