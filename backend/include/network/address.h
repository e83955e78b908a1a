#pragma once

#include <cstdint>
#include <string>

/// Fallback returned by resolve_local_ip() when no LAN route is found.
inline constexpr const char* kLoopbackAddress = "127.0.0.1";

/**
 * Determine the IPv4 address this node uses to reach the network.
 *
 * Connects a UDP socket toward `probe_host:probe_port` (no datagram is sent)
 * and reports the local address the OS picked for that route. Returns
 * kLoopbackAddress on any failure; never throws.
 */
std::string resolve_local_ip(const std::string& probe_host = "8.8.8.8",
                             uint16_t probe_port = 80);
