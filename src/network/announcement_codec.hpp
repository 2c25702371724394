/**
 * @file announcement_codec.hpp
 * @brief JSON wire encoding for announcements and peer snapshots.
 * @author Dimitris Kafetzis
 *
 * Wire format (UTF-8 JSON, no whitespace):
 *
 * Announcement datagram:
 *   {"name":"Alice","port":8080}
 *
 * Peer snapshot (boundary buffer):
 *   [{"addr":"192.168.1.20:53211","name":"Bob","port":9090}, ...]
 *
 * last_seen is internal bookkeeping and never encoded.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lan_discovery {

/**
 * @brief Strict UTF-8 check (no overlongs, surrogates or values past U+10FFFF).
 */
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

class AnnouncementCodec {
public:
    [[nodiscard]] static std::string encode(const Announcement& announcement);

    /**
     * @brief Strictly decode one datagram.
     *
     * Fails with ErrorKind::Decode unless the payload is a single JSON
     * object with a string `name` and an unsigned `port` <= 65535.
     */
    static Result<Announcement> decode(const char* data, size_t size);
    static Result<Announcement> decode(const std::string& payload);

    /**
     * @brief Serialize a registry snapshot; empty vector if encoding fails.
     */
    [[nodiscard]] static std::vector<uint8_t> encode_peers(const std::vector<Peer>& peers);
};

}  // namespace lan_discovery
