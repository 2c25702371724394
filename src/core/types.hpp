/**
 * @file types.hpp
 * @brief Fundamental types used throughout LanDiscovery.
 * @author Dimitris Kafetzis
 *
 * Defines Announcement, Peer, and the time vocabulary shared by the
 * registry and the discovery loops. All types have value semantics.
 */

#pragma once

#include <boost/asio/ip/udp.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace lan_discovery {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using PeerName = std::string;
using SteadyTime = std::chrono::steady_clock::time_point;
using Endpoint = boost::asio::ip::udp::endpoint;

/// "ip:port" form used in logs and the peer snapshot.
inline std::string endpoint_string(const Endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

// ─────────────────────────────────────────────
// Announcement
// ─────────────────────────────────────────────

/**
 * @brief "Who am I": the payload every participant multicasts.
 *
 * The name is the registry identity key. The port is the service port the
 * sender listens on elsewhere, not the source port of the datagram.
 */
struct Announcement {
    PeerName name;
    uint16_t port{0};

    bool operator==(const Announcement&) const = default;
};

// ─────────────────────────────────────────────
// Peer
// ─────────────────────────────────────────────

/**
 * @brief A participant discovered through a received announcement.
 *
 * `addr` is the datagram source (IP + ephemeral port). `last_seen` is
 * captured at receipt and never leaves the process.
 */
struct Peer {
    Endpoint addr;
    PeerName name;
    uint16_t port{0};
    SteadyTime last_seen{};

    [[nodiscard]] std::string addr_string() const { return endpoint_string(addr); }
};

}  // namespace lan_discovery
