#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

/// Default UDP port beacons are sent to and scanned on.
inline constexpr uint16_t kDefaultDiscoveryPort = 9999;

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Runtime settings for one node.
 *
 * Every field has a usable default, so an empty JSON object is a valid
 * configuration.
 */
struct SessionConfig {
    std::string display_name = "User";

    uint16_t discovery_port = kDefaultDiscoveryPort;
    std::chrono::milliseconds beacon_interval{2000};
    std::string broadcast_address = "255.255.255.255";

    /// Target used by resolve_local_ip() to pick the outward interface.
    std::string probe_address = "8.8.8.8";
    uint16_t probe_port = 80;

    spdlog::level::level_enum log_level = spdlog::level::info;
};

/// $USERNAME, then $USER, then "User".
std::string default_display_name();

/// Build a config from a parsed document. Throws ConfigError on bad values.
SessionConfig config_from_json(const nlohmann::json& document);

/// Read and parse `path`. Throws ConfigError if it cannot be read or is invalid.
SessionConfig load_config(const std::string& path);
