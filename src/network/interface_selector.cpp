/**
 * @file interface_selector.cpp
 * @brief Address scoring and getifaddrs()-based interface enumeration.
 * @author Dimitris Kafetzis
 */

#include "network/interface_selector.hpp"

#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace lan_discovery {

namespace {

constexpr int SCORE_192_168 = 100;
constexpr int SCORE_172_16 = 90;
constexpr int SCORE_10 = 80;
constexpr int SCORE_OTHER = 10;

}  // anonymous namespace

int score_address(const boost::asio::ip::address_v4& address) noexcept {
    const auto octets = address.to_bytes();
    const bool link_local = octets[0] == 169 && octets[1] == 254;

    if (address.is_loopback() || link_local
        || address.is_multicast() || address.is_unspecified()) {
        return UNUSABLE_SCORE;
    }

    if (octets[0] == 192 && octets[1] == 168) return SCORE_192_168;
    if (octets[0] == 172 && octets[1] >= 16 && octets[1] <= 31) return SCORE_172_16;
    if (octets[0] == 10) return SCORE_10;
    return SCORE_OTHER;
}

boost::asio::ip::address_v4 select_interface_address(
    const std::vector<InterfaceAddress>& candidates) {
    int best_score = UNUSABLE_SCORE;
    auto best = boost::asio::ip::address_v4::loopback();

    for (const auto& candidate : candidates) {
        int score = score_address(candidate.address);
        // Strict comparison keeps the first-seen address on ties
        if (score > best_score) {
            best_score = score;
            best = candidate.address;
        }
    }

    return best;
}

Result<std::vector<InterfaceAddress>> enumerate_interfaces() {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        return Error{ErrorKind::Setup,
                     "Failed to list interfaces: " + std::string(strerror(errno))};
    }

    std::vector<InterfaceAddress> result;
    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) continue;

        const auto* sin = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        result.push_back(InterfaceAddress{
            .interface_name = it->ifa_name != nullptr ? it->ifa_name : "",
            .address = boost::asio::ip::address_v4(ntohl(sin->sin_addr.s_addr))
        });
    }

    ::freeifaddrs(list);
    return result;
}

Result<boost::asio::ip::address_v4> pick_local_address(const std::string& override_address) {
    if (!override_address.empty()) {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address_v4(override_address, ec);
        if (ec) {
            return Error{ErrorKind::Setup, "Invalid interface address: " + override_address};
        }
        return address;
    }

    auto interfaces = enumerate_interfaces();
    if (!interfaces) {
        return interfaces.error();
    }
    return select_interface_address(*interfaces);
}

}  // namespace lan_discovery
