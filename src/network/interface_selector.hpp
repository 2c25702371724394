/**
 * @file interface_selector.hpp
 * @brief Choose the local IPv4 address used for binding and group membership.
 * @author Dimitris Kafetzis
 *
 * Selection is a pure function over an enumerated address list so the
 * heuristic can be tested without touching real interfaces.
 */

#pragma once

#include "core/result.hpp"

#include <boost/asio/ip/address_v4.hpp>

#include <string>
#include <vector>

namespace lan_discovery {

struct InterfaceAddress {
    std::string interface_name;
    boost::asio::ip::address_v4 address;
};

inline constexpr int UNUSABLE_SCORE = -1;

/**
 * @brief Rate an address for multicast use; higher is better.
 *
 * Loopback, link-local (169.254/16), multicast and unspecified addresses
 * are UNUSABLE_SCORE. Private ranges rank 192.168/16 > 172.16/12 > 10/8,
 * and any other unicast address is usable at the lowest rank.
 */
[[nodiscard]] int score_address(const boost::asio::ip::address_v4& address) noexcept;

/**
 * @brief Highest-scoring candidate, first-seen on ties; loopback if none usable.
 */
[[nodiscard]] boost::asio::ip::address_v4 select_interface_address(
    const std::vector<InterfaceAddress>& candidates);

/**
 * @brief All IPv4 interface addresses, in getifaddrs() order.
 */
Result<std::vector<InterfaceAddress>> enumerate_interfaces();

/**
 * @brief Resolve the local address, honouring an explicit override if given.
 */
Result<boost::asio::ip::address_v4> pick_local_address(const std::string& override_address = {});

}  // namespace lan_discovery
