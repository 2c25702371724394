/**
 * @file shared_announcement.hpp
 * @brief Reader/writer-locked holder for the local announcement.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <shared_mutex>

namespace lan_discovery {

/**
 * @brief The local identity, read by the announcer and listener loops and
 * written by the engine owner. Storage is only reachable through copies.
 */
class SharedAnnouncement {
public:
    explicit SharedAnnouncement(Announcement initial);

    [[nodiscard]] Announcement read() const;
    [[nodiscard]] PeerName name() const;
    [[nodiscard]] bool is_self(const PeerName& name) const;

    void write(Announcement announcement);
    void set_name(PeerName name);
    void set_port(uint16_t port);

private:
    mutable std::shared_mutex mutex_;
    Announcement value_;
};

}  // namespace lan_discovery
