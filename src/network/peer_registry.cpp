/**
 * @file peer_registry.cpp
 * @brief PeerRegistry implementation.
 * @author Dimitris Kafetzis
 */

#include "network/peer_registry.hpp"

#include <mutex>

namespace lan_discovery {

bool PeerRegistry::upsert(const PeerName& name, Peer peer) {
    std::unique_lock lock(mutex_);
    return peers_.insert_or_assign(name, std::move(peer)).second;
}

std::vector<Peer> PeerRegistry::evict_stale(SteadyTime now, std::chrono::milliseconds timeout) {
    std::vector<Peer> evicted;

    std::unique_lock lock(mutex_);
    for (auto it = peers_.begin(); it != peers_.end(); ) {
        if (now - it->second.last_seen >= timeout) {
            evicted.push_back(std::move(it->second));
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

void PeerRegistry::clear() {
    std::unique_lock lock(mutex_);
    peers_.clear();
}

std::vector<Peer> PeerRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<Peer> result;
    result.reserve(peers_.size());
    for (const auto& [name, peer] : peers_) {
        result.push_back(peer);
    }
    return result;
}

bool PeerRegistry::contains(const PeerName& name) const {
    std::shared_lock lock(mutex_);
    return peers_.count(name) > 0;
}

size_t PeerRegistry::size() const noexcept {
    std::shared_lock lock(mutex_);
    return peers_.size();
}

}  // namespace lan_discovery
