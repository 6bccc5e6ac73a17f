/*
 * Copyright (c) 2025-present
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * The HybridLB Authors and Contributors.
 */
#include "hlb_core/discovery/InterfaceEnumerator.hpp"
#include "hlb_core/discovery/NetworkRanker.hpp"
#include "utils/Logger.hpp"
#include <arpa/inet.h>
#include <bit>
#include <cerrno>
#include <cstring>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace discovery
{

namespace
{
const Ipv4Network kLoopback = boost::asio::ip::make_network_v4("127.0.0.0/8");
const Ipv4Network kLinkLocal = boost::asio::ip::make_network_v4("169.254.0.0/16");
} // namespace

bool
InterfaceEnumerator::isGlobalScope(const Ipv4Address& address)
{
    return !address.is_unspecified() && !NetworkRanker::contains(kLoopback, address) &&
           !NetworkRanker::contains(kLinkLocal, address);
}

uint8_t
InterfaceEnumerator::prefixLengthFromMask(uint32_t mask)
{
    return static_cast<uint8_t>(std::countl_one(mask));
}

std::vector<LocalAddress>
InterfaceEnumerator::enumerate()
{
    std::vector<LocalAddress> result;

    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "getifaddrs failed: {}; continuing without local addresses",
                           std::strerror(errno));
        return result;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next)
    {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
        {
            continue;
        }
        if (ifa->ifa_flags & IFF_LOOPBACK)
        {
            continue;
        }
        if (ifa->ifa_netmask == nullptr || ifa->ifa_netmask->sa_family != AF_INET)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "No netmask found for {}", ifa->ifa_name);
            continue;
        }

        const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        const auto* mask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask);

        Ipv4Address address(ntohl(sin->sin_addr.s_addr));
        if (!isGlobalScope(address))
        {
            continue;
        }

        LocalAddress local;
        local.interfaceName = ifa->ifa_name;
        local.address = address;
        local.prefixLength = prefixLengthFromMask(ntohl(mask->sin_addr.s_addr));
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Local address {}/{} on {}",
                            local.address.to_string(),
                            local.prefixLength,
                            local.interfaceName);
        result.push_back(std::move(local));
    }

    freeifaddrs(ifaddr);
    return result;
}

} // namespace discovery
