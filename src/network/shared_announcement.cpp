/**
 * @file shared_announcement.cpp
 * @brief SharedAnnouncement implementation.
 * @author Dimitris Kafetzis
 */

#include "network/shared_announcement.hpp"

#include <mutex>

namespace lan_discovery {

SharedAnnouncement::SharedAnnouncement(Announcement initial)
    : value_(std::move(initial)) {}

Announcement SharedAnnouncement::read() const {
    std::shared_lock lock(mutex_);
    return value_;
}

PeerName SharedAnnouncement::name() const {
    std::shared_lock lock(mutex_);
    return value_.name;
}

bool SharedAnnouncement::is_self(const PeerName& name) const {
    std::shared_lock lock(mutex_);
    return value_.name == name;
}

void SharedAnnouncement::write(Announcement announcement) {
    std::unique_lock lock(mutex_);
    value_ = std::move(announcement);
}

void SharedAnnouncement::set_name(PeerName name) {
    std::unique_lock lock(mutex_);
    value_.name = std::move(name);
}

void SharedAnnouncement::set_port(uint16_t port) {
    std::unique_lock lock(mutex_);
    value_.port = port;
}

}  // namespace lan_discovery
