/**
 * @file socket_provisioner.cpp
 * @brief Multicast socket setup using Boost.Asio error_code overloads.
 * @author Dimitris Kafetzis
 */

#include "network/socket_provisioner.hpp"

#include <boost/asio/ip/multicast.hpp>

#include <cstddef>
#include <string>
#include <sys/socket.h>

namespace lan_discovery {

namespace {

using udp = boost::asio::ip::udp;

/// SO_REUSEPORT as a SettableSocketOption; asio has no public type for it.
class ReusePort {
public:
    explicit ReusePort(bool enabled) : value_(enabled ? 1 : 0) {}

    template <typename Protocol>
    int level(const Protocol&) const { return SOL_SOCKET; }

    template <typename Protocol>
    int name(const Protocol&) const { return SO_REUSEPORT; }

    template <typename Protocol>
    const int* data(const Protocol&) const { return &value_; }

    template <typename Protocol>
    std::size_t size(const Protocol&) const { return sizeof(value_); }

private:
    int value_;
};

Error setup_error(const char* step, const boost::system::error_code& ec) {
    return Error{ErrorKind::Setup, std::string(step) + ": " + ec.message()};
}

}  // anonymous namespace

Result<ProvisionedSockets> provision_sockets(boost::asio::io_context& io,
                                             const SocketOptions& options) {
    if (!options.group.is_multicast()) {
        return Error{ErrorKind::Setup,
                     "Not a multicast group: " + options.group.to_string()};
    }

    boost::system::error_code ec;

    // ── Announce socket ──────────────────────
    udp::socket announce(io);
    announce.open(udp::v4(), ec);
    if (ec) return setup_error("Announce socket open failed", ec);

    announce.set_option(udp::socket::reuse_address(true), ec);
    if (ec) return setup_error("Announce SO_REUSEADDR failed", ec);

    announce.set_option(boost::asio::ip::multicast::enable_loopback(true), ec);
    if (ec) return setup_error("Announce IP_MULTICAST_LOOP failed", ec);

    announce.set_option(boost::asio::ip::multicast::hops(options.ttl), ec);
    if (ec) return setup_error("Announce IP_MULTICAST_TTL failed", ec);

    announce.bind(udp::endpoint(options.local_address, 0), ec);
    if (ec) return setup_error("Announce bind failed", ec);

    announce.set_option(boost::asio::ip::multicast::outbound_interface(options.local_address), ec);
    if (ec) return setup_error("Announce IP_MULTICAST_IF failed", ec);

    announce.non_blocking(true, ec);
    if (ec) return setup_error("Announce non-blocking failed", ec);

    // ── Listen socket ────────────────────────
    udp::socket listen(io);
    listen.open(udp::v4(), ec);
    if (ec) return setup_error("Listen socket open failed", ec);

    listen.set_option(udp::socket::reuse_address(true), ec);
    if (ec) return setup_error("Listen SO_REUSEADDR failed", ec);

    listen.set_option(ReusePort(true), ec);
    if (ec) return setup_error("Listen SO_REUSEPORT failed", ec);

    listen.bind(udp::endpoint(boost::asio::ip::address_v4::any(), options.port), ec);
    if (ec) return setup_error("Listen bind failed", ec);

    listen.set_option(boost::asio::ip::multicast::join_group(options.group, options.local_address), ec);
    if (ec) return setup_error("Multicast join failed", ec);

    listen.set_option(boost::asio::ip::multicast::enable_loopback(true), ec);
    if (ec) return setup_error("Listen IP_MULTICAST_LOOP failed", ec);

    listen.set_option(boost::asio::ip::multicast::hops(options.ttl), ec);
    if (ec) return setup_error("Listen IP_MULTICAST_TTL failed", ec);

    listen.non_blocking(true, ec);
    if (ec) return setup_error("Listen non-blocking failed", ec);

    return ProvisionedSockets{std::move(announce), std::move(listen)};
}

}  // namespace lan_discovery
