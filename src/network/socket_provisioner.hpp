/**
 * @file socket_provisioner.hpp
 * @brief Build the announce and listen UDP sockets with multicast options.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/udp.hpp>

#include <cstdint>

namespace lan_discovery {

/**
 * @brief The two sockets an engine needs, both open and non-blocking.
 */
struct ProvisionedSockets {
    boost::asio::ip::udp::socket announce;
    boost::asio::ip::udp::socket listen;
};

struct SocketOptions {
    boost::asio::ip::address_v4 local_address;
    boost::asio::ip::address_v4 group;
    uint16_t port = 0;
    int ttl = 1;
};

/**
 * @brief Open and configure both sockets on `io`.
 *
 * Announce: bound to local_address:0, SO_REUSEADDR, loopback on, multicast
 * hops = ttl, outbound interface pinned to local_address.
 * Listen: bound to 0.0.0.0:port, SO_REUSEADDR + SO_REUSEPORT, joined to
 * the group on local_address, loopback on, hops = ttl.
 *
 * Any failing step returns an ErrorKind::Setup error; partially opened
 * sockets are closed when the locals go out of scope.
 */
Result<ProvisionedSockets> provision_sockets(boost::asio::io_context& io,
                                             const SocketOptions& options);

}  // namespace lan_discovery
