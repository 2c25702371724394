/**
 * @file discovery_engine.hpp
 * @brief UDP multicast peer discovery: announce, listen and expiry loops.
 * @author Dimitris Kafetzis
 *
 * Sends the local announcement to the multicast group on a fixed interval
 * and listens for other participants' announcements. Peers not heard from
 * within the staleness window are evicted by a separate sweep. The three
 * loops are asynchronous operation chains on a shared io_context, each
 * bound to its own strand.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/peer_registry.hpp"
#include "network/shared_announcement.hpp"
#include "network/socket_provisioner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lan_discovery {

using PeerCallback = std::function<void(const Peer&)>;

class DiscoveryEngine : public std::enable_shared_from_this<DiscoveryEngine> {
public:
    /**
     * @brief Select an interface, provision both sockets, and build the engine.
     *
     * No loop runs until start(). Any setup failure is returned as an
     * ErrorKind::Setup error and nothing is left half-configured.
     */
    static Result<std::shared_ptr<DiscoveryEngine>> create(
        boost::asio::io_context& io,
        uint16_t service_port,
        PeerName local_name,
        DiscoveryConfig config = {},
        std::shared_ptr<Logger> logger = nullptr);

    // Non-copyable
    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /// Launch the announce, listen and expiry loops. Call exactly once.
    void start();

    /// Cancel every loop at its next suspension point and close the sockets.
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    // Query
    [[nodiscard]] std::vector<Peer> get_peers() const;
    [[nodiscard]] std::vector<uint8_t> peers_as_bytes() const;
    [[nodiscard]] size_t known_peer_count() const;

    // Local identity
    [[nodiscard]] Announcement local_announcement() const;
    void update_local_announcement(Announcement announcement);
    void set_local_name(PeerName name);
    void set_service_port(uint16_t port);

    // Callbacks run on the loop that raised the event; one that throws is
    // logged at warn and does not stop the loop.
    void on_peer_discovered(PeerCallback callback);
    void on_peer_lost(PeerCallback callback);

    /**
     * @brief Apply one received datagram to the registry.
     *
     * Malformed payloads and self-announcements are dropped. Returns true
     * if the registry was written.
     */
    bool ingest_datagram(const char* data, size_t size, const Endpoint& sender);

    /// Evict peers stale at `now`; returns how many were removed.
    size_t sweep_expired(SteadyTime now);

    [[nodiscard]] const boost::asio::ip::address_v4& local_address() const noexcept;
    [[nodiscard]] const Endpoint& announce_endpoint() const noexcept;
    [[nodiscard]] const DiscoveryConfig& config() const noexcept;

private:
    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;

    DiscoveryEngine(boost::asio::io_context& io,
                    ProvisionedSockets sockets,
                    boost::asio::ip::address_v4 local_address,
                    boost::asio::ip::address_v4 group,
                    Endpoint announce_endpoint,
                    Announcement announcement,
                    DiscoveryConfig config,
                    std::shared_ptr<Logger> logger);

    // Announcer (announce_strand_)
    void announce_tick();
    void on_announce_sent(const boost::system::error_code& ec);

    // Listener (listen_strand_)
    void arm_receive();
    void on_receive(const boost::system::error_code& ec, size_t bytes);

    // Expiry (expiry_strand_)
    void expiry_tick();

    void notify_discovered(const Peer& peer);
    void notify_lost(const Peer& peer);
    void invoke_callbacks(const std::vector<PeerCallback>& callbacks,
                          const Peer& peer,
                          const char* event);

    DiscoveryConfig config_;
    std::shared_ptr<Logger> logger_;
    boost::asio::ip::address_v4 local_address_;
    Endpoint multicast_endpoint_;
    Endpoint announce_endpoint_;

    Strand announce_strand_;
    Strand listen_strand_;
    Strand expiry_strand_;

    boost::asio::ip::udp::socket announce_socket_;
    boost::asio::ip::udp::socket listen_socket_;
    boost::asio::steady_timer announce_timer_;
    boost::asio::steady_timer expiry_timer_;

    std::string outbound_;          // announce strand only
    std::vector<char> inbound_;     // listen strand only
    Endpoint sender_;               // listen strand only

    SharedAnnouncement announcement_;
    PeerRegistry registry_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};

    // Callbacks
    std::mutex callback_mutex_;
    std::vector<PeerCallback> on_discovered_;
    std::vector<PeerCallback> on_lost_;
};

}  // namespace lan_discovery
