/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <boost/asio/ip/address_v4.hpp>
#include <toml++/toml.hpp>

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace lan_discovery {

namespace {

/// Integer field or `fallback`; throws std::out_of_range if the value does not fit T.
template <typename T>
T narrow_or(const toml::node_view<toml::node>& node, T fallback) {
    auto raw = node.value_or(static_cast<int64_t>(fallback));
    if (raw < 0 || static_cast<uint64_t>(raw) > std::numeric_limits<T>::max()) {
        throw std::out_of_range("integer out of range: " + std::to_string(raw));
    }
    return static_cast<T>(raw);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    Config config;

    try {
        auto tbl = toml::parse_file(path.string());

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            config.node.name = node["name"].value_or(std::string{config.node.name});
            config.node.service_port = narrow_or<uint16_t>(
                node["service_port"], config.node.service_port);
        }

        // [discovery]
        if (auto disc = tbl["discovery"]; disc.is_table()) {
            auto& d = config.discovery;
            d.multicast_address = disc["multicast_address"].value_or(std::string{d.multicast_address});
            d.multicast_port = narrow_or<uint16_t>(disc["multicast_port"], d.multicast_port);
            d.announce_interval_ms = narrow_or<uint32_t>(
                disc["announce_interval_ms"], d.announce_interval_ms);
            d.peer_timeout_ms = narrow_or<uint32_t>(disc["peer_timeout_ms"], d.peer_timeout_ms);
            d.expiry_interval_ms = narrow_or<uint32_t>(
                disc["expiry_interval_ms"], d.expiry_interval_ms);
            d.multicast_ttl = narrow_or<uint32_t>(disc["multicast_ttl"], d.multicast_ttl);
            d.receive_buffer_bytes = narrow_or<uint32_t>(
                disc["receive_buffer_bytes"], d.receive_buffer_bytes);
            d.interface_address = disc["interface_address"].value_or(std::string{d.interface_address});
        }

        // [runtime]
        if (auto runtime = tbl["runtime"]; runtime.is_table()) {
            config.runtime.worker_threads = narrow_or<uint32_t>(
                runtime["worker_threads"], config.runtime.worker_threads);
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.level = logging["level"].value_or(std::string{config.logging.level});
            config.logging.log_dir = logging["log_dir"].value_or(std::string{});
            config.logging.max_file_size_mb = narrow_or<uint32_t>(
                logging["max_file_size_mb"], config.logging.max_file_size_mb);
            config.logging.rotate_count = narrow_or<uint32_t>(
                logging["rotate_count"], config.logging.rotate_count);
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    } catch (const std::out_of_range& err) {
        return Error{ErrorKind::Config, std::string{"Invalid value in "} + path.string()
                     + ": " + err.what()};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_discovery_config(const DiscoveryConfig& config) {
    boost::system::error_code ec;
    auto group = boost::asio::ip::make_address_v4(config.multicast_address, ec);
    if (ec) {
        return Error{ErrorKind::Config,
                     "Invalid multicast address: " + config.multicast_address};
    }
    if (!group.is_multicast()) {
        return Error{ErrorKind::Config,
                     "Not a multicast address: " + config.multicast_address};
    }
    if (config.multicast_port == 0) {
        return Error{ErrorKind::Config, "multicast_port must be non-zero"};
    }
    if (config.announce_interval_ms == 0 || config.expiry_interval_ms == 0) {
        return Error{ErrorKind::Config, "Loop intervals must be non-zero"};
    }
    if (config.peer_timeout_ms == 0) {
        return Error{ErrorKind::Config, "peer_timeout_ms must be non-zero"};
    }
    if (config.multicast_ttl == 0 || config.multicast_ttl > 255) {
        return Error{ErrorKind::Config,
                     "multicast_ttl out of range: " + std::to_string(config.multicast_ttl)};
    }
    if (config.receive_buffer_bytes < MIN_RECEIVE_BUFFER_BYTES) {
        return Error{ErrorKind::Config,
                     "receive_buffer_bytes below " + std::to_string(MIN_RECEIVE_BUFFER_BYTES)};
    }
    if (!config.interface_address.empty()) {
        boost::asio::ip::make_address_v4(config.interface_address, ec);
        if (ec) {
            return Error{ErrorKind::Config,
                         "Invalid interface address: " + config.interface_address};
        }
    }
    return Result<void>{};
}

Result<void> validate_config(const Config& config) {
    if (auto level = parse_log_level(config.logging.level); !level) {
        return level.error();
    }
    return validate_discovery_config(config.discovery);
}

}  // namespace lan_discovery
