/**
 * @file peer_registry.hpp
 * @brief Thread-safe map from announced name to last-known Peer.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace lan_discovery {

/**
 * @brief Peer registry keyed by announced name.
 *
 * Written by the listener (upsert) and expiry (evict_stale) loops, read by
 * any number of snapshot callers. Thread-safe via shared_mutex: writes are
 * exclusive, snapshots share.
 */
class PeerRegistry {
public:
    /// Replace any existing entry for `name`. Returns true if it was new.
    bool upsert(const PeerName& name, Peer peer);

    /// Remove every entry with `now - last_seen >= timeout`; returns them.
    std::vector<Peer> evict_stale(SteadyTime now, std::chrono::milliseconds timeout);

    void clear();

    [[nodiscard]] std::vector<Peer> snapshot() const;
    [[nodiscard]] bool contains(const PeerName& name) const;
    [[nodiscard]] size_t size() const noexcept;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<PeerName, Peer> peers_;
};

}  // namespace lan_discovery
