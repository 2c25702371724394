/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation on Boost.Asio.
 * @author Dimitris Kafetzis
 *
 * Every handler captures a shared_ptr to the engine, so the engine lives
 * until its last outstanding operation completes. stop() flips a flag that
 * each handler checks before re-arming, then cancels the pending timer or
 * socket operation on the owning strand.
 */

#include "network/discovery_engine.hpp"
#include "network/announcement_codec.hpp"
#include "network/interface_selector.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

#include <chrono>
#include <exception>
#include <string>
#include <vector>

namespace lan_discovery {

namespace {

bool aborted(const boost::system::error_code& ec) {
    return ec == boost::asio::error::operation_aborted;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::shared_ptr<DiscoveryEngine>> DiscoveryEngine::create(
    boost::asio::io_context& io,
    uint16_t service_port,
    PeerName local_name,
    DiscoveryConfig config,
    std::shared_ptr<Logger> logger) {
    if (!logger) {
        logger = make_null_logger();
    }

    if (auto valid = validate_discovery_config(config); !valid) {
        return Error{ErrorKind::Setup, valid.error().message};
    }

    boost::system::error_code ec;
    auto group = boost::asio::ip::make_address_v4(config.multicast_address, ec);
    if (ec) {
        return Error{ErrorKind::Setup, "Bad multicast address: " + config.multicast_address};
    }

    auto local = pick_local_address(config.interface_address);
    if (!local) {
        return local.error();
    }
    logger->info("Local interface: " + local->to_string());

    auto sockets = provision_sockets(io, SocketOptions{
        .local_address = *local,
        .group = group,
        .port = config.multicast_port,
        .ttl = static_cast<int>(config.multicast_ttl)
    });
    if (!sockets) {
        return sockets.error();
    }

    auto announce_endpoint = sockets->announce.local_endpoint(ec);
    if (ec) {
        return Error{ErrorKind::Setup, "Announce socket has no local endpoint: " + ec.message()};
    }

    return std::shared_ptr<DiscoveryEngine>(new DiscoveryEngine(
        io,
        std::move(*sockets),
        *local,
        group,
        announce_endpoint,
        Announcement{.name = std::move(local_name), .port = service_port},
        std::move(config),
        std::move(logger)));
}

DiscoveryEngine::DiscoveryEngine(boost::asio::io_context& io,
                                 ProvisionedSockets sockets,
                                 boost::asio::ip::address_v4 local_address,
                                 boost::asio::ip::address_v4 group,
                                 Endpoint announce_endpoint,
                                 Announcement announcement,
                                 DiscoveryConfig config,
                                 std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , logger_(std::move(logger))
    , local_address_(local_address)
    , multicast_endpoint_(group, config_.multicast_port)
    , announce_endpoint_(announce_endpoint)
    , announce_strand_(boost::asio::make_strand(io))
    , listen_strand_(boost::asio::make_strand(io))
    , expiry_strand_(boost::asio::make_strand(io))
    , announce_socket_(std::move(sockets.announce))
    , listen_socket_(std::move(sockets.listen))
    , announce_timer_(io)
    , expiry_timer_(io)
    , inbound_(config_.receive_buffer_bytes)
    , announcement_(std::move(announcement)) {}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void DiscoveryEngine::start() {
    if (started_.exchange(true)) {
        logger_->warn("DiscoveryEngine::start() called twice; ignoring");
        return;
    }
    if (stopped_.load()) return;

    auto self = shared_from_this();

    boost::asio::post(announce_strand_, [self] {
        self->announce_timer_.expires_at(std::chrono::steady_clock::now());
        self->announce_tick();
    });
    boost::asio::post(listen_strand_, [self] {
        self->arm_receive();
    });
    boost::asio::post(expiry_strand_, [self] {
        self->expiry_timer_.expires_at(std::chrono::steady_clock::now());
        self->expiry_tick();
    });

    logger_->info("LAN discovery started for " + announcement_.name()
                  + " (group " + endpoint_string(multicast_endpoint_)
                  + ", announce " + std::to_string(config_.announce_interval_ms)
                  + "ms, timeout " + std::to_string(config_.peer_timeout_ms) + "ms)");
}

void DiscoveryEngine::stop() {
    if (stopped_.exchange(true)) return;

    auto self = shared_from_this();

    boost::asio::post(announce_strand_, [self] {
        boost::system::error_code ec;
        self->announce_timer_.cancel();
        self->announce_socket_.close(ec);
        if (ec) self->logger_->warn("Announce socket close failed: " + ec.message());
    });
    boost::asio::post(listen_strand_, [self] {
        boost::system::error_code ec;
        self->listen_socket_.close(ec);
        if (ec) self->logger_->warn("Listen socket close failed: " + ec.message());
    });
    boost::asio::post(expiry_strand_, [self] {
        self->expiry_timer_.cancel();
    });

    logger_->info("LAN discovery stopping for " + announcement_.name());
}

bool DiscoveryEngine::is_running() const noexcept {
    return started_.load() && !stopped_.load();
}

// ─────────────────────────────────────────────
// Announcer Loop
// ─────────────────────────────────────────────

void DiscoveryEngine::announce_tick() {
    if (stopped_.load()) return;

    outbound_ = AnnouncementCodec::encode(announcement_.read());

    announce_socket_.async_send_to(
        boost::asio::buffer(outbound_), multicast_endpoint_,
        boost::asio::bind_executor(announce_strand_,
            [self = shared_from_this()](const boost::system::error_code& ec, size_t /*sent*/) {
                self->on_announce_sent(ec);
            }));
}

void DiscoveryEngine::on_announce_sent(const boost::system::error_code& ec) {
    if (stopped_.load() || aborted(ec)) return;

    if (ec) {
        logger_->warn("Announce send error: " + ec.message());
    }

    // Fixed rate: the next deadline is anchored to the previous one
    announce_timer_.expires_at(announce_timer_.expiry()
                               + std::chrono::milliseconds(config_.announce_interval_ms));
    announce_timer_.async_wait(boost::asio::bind_executor(announce_strand_,
        [self = shared_from_this()](const boost::system::error_code& wait_ec) {
            if (self->stopped_.load() || aborted(wait_ec)) return;
            self->announce_tick();
        }));
}

// ─────────────────────────────────────────────
// Listener Loop
// ─────────────────────────────────────────────

void DiscoveryEngine::arm_receive() {
    if (stopped_.load()) return;

    listen_socket_.async_receive_from(
        boost::asio::buffer(inbound_), sender_,
        boost::asio::bind_executor(listen_strand_,
            [self = shared_from_this()](const boost::system::error_code& ec, size_t bytes) {
                self->on_receive(ec, bytes);
            }));
}

void DiscoveryEngine::on_receive(const boost::system::error_code& ec, size_t bytes) {
    if (stopped_.load() || aborted(ec)) return;

    if (ec) {
        logger_->warn("Listener error: " + ec.message());
    } else {
        try {
            ingest_datagram(inbound_.data(), bytes, sender_);
        } catch (const std::exception& e) {
            logger_->warn("Datagram from " + endpoint_string(sender_) + " dropped: " + e.what());
        }
    }

    arm_receive();
}

bool DiscoveryEngine::ingest_datagram(const char* data, size_t size, const Endpoint& sender) {
    auto decoded = AnnouncementCodec::decode(data, size);
    if (!decoded) {
        logger_->debug("Failed to parse announcement from " + endpoint_string(sender)
                       + ": " + decoded.error().message);
        return false;
    }

    if (announcement_.is_self(decoded->name)) {
        return false;
    }

    Peer peer{
        .addr = sender,
        .name = decoded->name,
        .port = decoded->port,
        .last_seen = std::chrono::steady_clock::now()
    };

    if (registry_.upsert(peer.name, peer)) {
        logger_->info("Peer discovered: " + peer.name + " at " + peer.addr_string()
                      + " (service port " + std::to_string(peer.port) + ")");
        notify_discovered(peer);
    }
    return true;
}

// ─────────────────────────────────────────────
// Expiry Loop
// ─────────────────────────────────────────────

void DiscoveryEngine::expiry_tick() {
    if (stopped_.load()) return;

    try {
        sweep_expired(std::chrono::steady_clock::now());
    } catch (const std::exception& e) {
        logger_->warn("Expiry sweep failed: " + std::string(e.what()));
    }

    expiry_timer_.expires_at(expiry_timer_.expiry()
                             + std::chrono::milliseconds(config_.expiry_interval_ms));
    expiry_timer_.async_wait(boost::asio::bind_executor(expiry_strand_,
        [self = shared_from_this()](const boost::system::error_code& ec) {
            if (self->stopped_.load() || aborted(ec)) return;
            self->expiry_tick();
        }));
}

size_t DiscoveryEngine::sweep_expired(SteadyTime now) {
    auto evicted = registry_.evict_stale(now, std::chrono::milliseconds(config_.peer_timeout_ms));
    for (const auto& peer : evicted) {
        logger_->info("Peer lost: " + peer.name);
        notify_lost(peer);
    }
    return evicted.size();
}

// ─────────────────────────────────────────────
// Queries and Updates
// ─────────────────────────────────────────────

std::vector<Peer> DiscoveryEngine::get_peers() const {
    return registry_.snapshot();
}

std::vector<uint8_t> DiscoveryEngine::peers_as_bytes() const {
    return AnnouncementCodec::encode_peers(registry_.snapshot());
}

size_t DiscoveryEngine::known_peer_count() const {
    return registry_.size();
}

Announcement DiscoveryEngine::local_announcement() const {
    return announcement_.read();
}

void DiscoveryEngine::update_local_announcement(Announcement announcement) {
    announcement_.write(std::move(announcement));
}

void DiscoveryEngine::set_local_name(PeerName name) {
    announcement_.set_name(std::move(name));
}

void DiscoveryEngine::set_service_port(uint16_t port) {
    announcement_.set_port(port);
}

const boost::asio::ip::address_v4& DiscoveryEngine::local_address() const noexcept {
    return local_address_;
}

const Endpoint& DiscoveryEngine::announce_endpoint() const noexcept {
    return announce_endpoint_;
}

const DiscoveryConfig& DiscoveryEngine::config() const noexcept {
    return config_;
}

// ─────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────

void DiscoveryEngine::on_peer_discovered(PeerCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_discovered_.push_back(std::move(callback));
}

void DiscoveryEngine::on_peer_lost(PeerCallback callback) {
    std::lock_guard lock(callback_mutex_);
    on_lost_.push_back(std::move(callback));
}

void DiscoveryEngine::notify_discovered(const Peer& peer) {
    std::vector<PeerCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = on_discovered_;
    }
    invoke_callbacks(callbacks, peer, "discovered");
}

void DiscoveryEngine::notify_lost(const Peer& peer) {
    std::vector<PeerCallback> callbacks;
    {
        std::lock_guard lock(callback_mutex_);
        callbacks = on_lost_;
    }
    invoke_callbacks(callbacks, peer, "lost");
}

// A throwing callback must not unwind into the loop that raised the event
void DiscoveryEngine::invoke_callbacks(const std::vector<PeerCallback>& callbacks,
                                       const Peer& peer,
                                       const char* event) {
    for (const auto& cb : callbacks) {
        try {
            cb(peer);
        } catch (const std::exception& e) {
            logger_->warn(std::string("Peer ") + event + " callback for " + peer.name
                          + " threw: " + e.what());
        }
    }
}

}  // namespace lan_discovery
