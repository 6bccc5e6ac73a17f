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
#include "hlb_core/discovery/NetworkRanker.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <tuple>

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace discovery
{

NetworkRanker::NetworkRanker(std::vector<Ipv4Network> preferredBlocks,
                             std::string preferredInterface)
    : m_preferredBlocks(std::move(preferredBlocks)),
      m_preferredInterface(std::move(preferredInterface))
{
}

bool
NetworkRanker::contains(const Ipv4Network& block, const Ipv4Address& address)
{
    return (address.to_uint() & block.netmask().to_uint()) == block.network().to_uint();
}

bool
NetworkRanker::contains(const Ipv4Network& block, const Ipv4Network& network)
{
    return network.prefix_length() >= block.prefix_length() &&
           contains(block, network.network());
}

int
NetworkRanker::rank(const Ipv4Address& address) const
{
    for (size_t i = 0; i < m_preferredBlocks.size(); ++i)
    {
        if (contains(m_preferredBlocks[i], address))
        {
            return static_cast<int>(i);
        }
    }
    return UNRANKED;
}

int
NetworkRanker::rank(const Ipv4Network& network) const
{
    for (size_t i = 0; i < m_preferredBlocks.size(); ++i)
    {
        if (contains(m_preferredBlocks[i], network))
        {
            return static_cast<int>(i);
        }
    }
    return UNRANKED;
}

int
NetworkRanker::rankAddress(const LocalAddress& local) const
{
    if (!m_preferredInterface.empty() && local.interfaceName == m_preferredInterface)
    {
        return PREFERRED_INTERFACE_RANK;
    }
    return rank(local.address);
}

std::vector<LocalAddress>
NetworkRanker::orderAddresses(std::vector<LocalAddress> addrs) const
{
    std::sort(addrs.begin(), addrs.end(), [this](const LocalAddress& a, const LocalAddress& b) {
        return std::make_tuple(rankAddress(a), std::cref(a.interfaceName), a.address.to_uint()) <
               std::make_tuple(rankAddress(b), std::cref(b.interfaceName), b.address.to_uint());
    });
    return addrs;
}

std::string
NetworkRanker::chooseAdvertiseAddress(const std::vector<LocalAddress>& addrs) const
{
    if (!m_preferredInterface.empty())
    {
        for (const auto& local : addrs)
        {
            if (local.interfaceName == m_preferredInterface)
            {
                SPDLOG_LOGGER_INFO(Logger::instance(),
                                   "Advertising {} from preferred interface {}",
                                   local.address.to_string(),
                                   m_preferredInterface);
                return local.address.to_string();
            }
        }
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Preferred interface {} has no global IPv4 address",
                           m_preferredInterface);
    }

    // Block ranking only: the interface bias was handled above.
    std::vector<LocalAddress> ranked = addrs;
    std::sort(ranked.begin(), ranked.end(), [this](const LocalAddress& a, const LocalAddress& b) {
        return std::make_tuple(rank(a.address), std::cref(a.interfaceName), a.address.to_uint()) <
               std::make_tuple(rank(b.address), std::cref(b.interfaceName), b.address.to_uint());
    });

    if (!ranked.empty() && rank(ranked.front().address) != UNRANKED)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Advertising {} ({}, rank {})",
                           ranked.front().address.to_string(),
                           ranked.front().interfaceName,
                           rank(ranked.front().address));
        return ranked.front().address.to_string();
    }

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "No address in a preferred block; falling back to host name resolution");
    return resolveHostAddress();
}

std::string
NetworkRanker::resolveHostAddress()
{
    try
    {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(tcp::v4(), net::ip::host_name(), "");
        for (const auto& entry : results)
        {
            auto addr = entry.endpoint().address();
            if (addr.is_v4())
            {
                return addr.to_string();
            }
        }
    }
    catch (const boost::system::system_error& e)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(), "Host name resolution failed: {}", e.what());
    }
    return "127.0.0.1";
}

} // namespace discovery
