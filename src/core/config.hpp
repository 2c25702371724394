/**
 * @file config.hpp
 * @brief Discovery configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 *
 * Every field has a compile-time default, so an absent file or table
 * yields the stock LAN discovery behaviour.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace lan_discovery {

// ─────────────────────────────────────────────
// Compile-time defaults
// ─────────────────────────────────────────────

inline constexpr const char* DEFAULT_MULTICAST_ADDRESS = "239.255.255.250";
inline constexpr uint16_t DEFAULT_MULTICAST_PORT = 9999;
inline constexpr uint32_t DEFAULT_ANNOUNCE_INTERVAL_MS = 2000;
inline constexpr uint32_t DEFAULT_PEER_TIMEOUT_MS = 2000;
inline constexpr uint32_t DEFAULT_EXPIRY_INTERVAL_MS = 3000;
inline constexpr uint32_t DEFAULT_MULTICAST_TTL = 1;
inline constexpr uint32_t DEFAULT_RECEIVE_BUFFER_BYTES = 4096;
inline constexpr uint32_t MIN_RECEIVE_BUFFER_BYTES = 512;

struct NodeConfig {
    std::string name = "Player";
    uint16_t service_port = 8080;
};

struct DiscoveryConfig {
    std::string multicast_address = DEFAULT_MULTICAST_ADDRESS;
    uint16_t multicast_port = DEFAULT_MULTICAST_PORT;
    uint32_t announce_interval_ms = DEFAULT_ANNOUNCE_INTERVAL_MS;
    uint32_t peer_timeout_ms = DEFAULT_PEER_TIMEOUT_MS;
    uint32_t expiry_interval_ms = DEFAULT_EXPIRY_INTERVAL_MS;
    uint32_t multicast_ttl = DEFAULT_MULTICAST_TTL;
    uint32_t receive_buffer_bytes = DEFAULT_RECEIVE_BUFFER_BYTES;
    std::string interface_address;      ///< Empty = pick heuristically
};

struct RuntimeConfig {
    uint32_t worker_threads = 0;        ///< 0 = hardware_concurrency
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path log_dir;      ///< Empty = console sink
    uint32_t max_file_size_mb = 10;
    uint32_t rotate_count = 3;
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    NodeConfig node;
    DiscoveryConfig discovery;
    RuntimeConfig runtime;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file and validate it.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Reject values the discovery engine cannot run with.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Discovery-table subset of validate_config().
 */
Result<void> validate_discovery_config(const DiscoveryConfig& config);

}  // namespace lan_discovery
