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

/**
 * @file test_ranker.cpp
 * @brief Tests for NetworkRanker ordering and advertise-address selection.
 */

#include <gtest/gtest.h>

#include "hlb_core/config/ConfigLoader.hpp"
#include "hlb_core/discovery/NetworkRanker.hpp"

using discovery::Ipv4Address;
using discovery::LocalAddress;
using discovery::NetworkRanker;

namespace
{
LocalAddress
local(const std::string& iface, const std::string& ip, uint8_t prefix)
{
    return LocalAddress{iface, boost::asio::ip::make_address_v4(ip), prefix};
}

NetworkRanker
defaultRanker(const std::string& preferIface = "")
{
    return NetworkRanker(discovery::defaultPreferredBlocks(), preferIface);
}
} // namespace

TEST(NetworkRanker, RankFollowsPreferredBlockOrder)
{
    auto ranker = defaultRanker();
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_address_v4("192.168.56.10")), 0);
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_address_v4("192.168.1.10")), 1);
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_address_v4("10.1.2.3")), 2);
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_address_v4("172.20.0.5")), 3);
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_address_v4("8.8.8.8")), NetworkRanker::UNRANKED);
}

TEST(NetworkRanker, NetworkRankRequiresFullContainment)
{
    auto ranker = defaultRanker();
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_network_v4("192.168.56.0/24")), 0);
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_network_v4("192.168.0.0/24")), 1);
    // /15 is wider than 192.168.0.0/16, so no block contains it
    EXPECT_EQ(ranker.rank(boost::asio::ip::make_network_v4("192.168.0.0/15")),
              NetworkRanker::UNRANKED);
}

TEST(NetworkRanker, PreferredInterfaceOverridesBlocks)
{
    auto ranker = defaultRanker("eth9");
    EXPECT_EQ(ranker.rankAddress(local("eth9", "8.8.8.8", 24)),
              NetworkRanker::PREFERRED_INTERFACE_RANK);
    EXPECT_EQ(ranker.rankAddress(local("eth0", "192.168.56.10", 24)), 0);
}

TEST(NetworkRanker, OrderingIsDeterministic)
{
    auto ranker = defaultRanker();
    std::vector<LocalAddress> a{local("eth1", "10.0.0.5", 8),
                                local("eth0", "192.168.1.4", 24),
                                local("eth2", "192.168.56.10", 24),
                                local("eth0", "172.16.3.3", 16)};
    std::vector<LocalAddress> b(a.rbegin(), a.rend());

    auto first = ranker.orderAddresses(a);
    auto second = ranker.orderAddresses(b);
    ASSERT_EQ(first.size(), 4u);
    for (size_t i = 0; i < first.size(); ++i)
    {
        EXPECT_EQ(first[i].address, second[i].address);
        EXPECT_EQ(first[i].interfaceName, second[i].interfaceName);
    }
    EXPECT_EQ(first[0].address.to_string(), "192.168.56.10");
    EXPECT_EQ(first[3].address.to_string(), "172.16.3.3");
}

TEST(NetworkRanker, AdvertisePicksHostOnlyNetwork)
{
    auto ranker = defaultRanker();
    std::vector<LocalAddress> addrs{local("enp0s3", "10.0.2.15", 24),
                                    local("enp0s8", "192.168.56.10", 24)};
    EXPECT_EQ(ranker.chooseAdvertiseAddress(addrs), "192.168.56.10");
}

TEST(NetworkRanker, AdvertiseHonoursPreferredInterface)
{
    auto ranker = defaultRanker("enp0s3");
    std::vector<LocalAddress> addrs{local("enp0s3", "10.0.2.15", 24),
                                    local("enp0s8", "192.168.56.10", 24)};
    EXPECT_EQ(ranker.chooseAdvertiseAddress(addrs), "10.0.2.15");
}

TEST(NetworkRanker, AdvertiseFallsBackToHostResolution)
{
    auto ranker = defaultRanker();
    std::vector<LocalAddress> addrs{local("eth0", "203.0.113.7", 24)};
    auto chosen = ranker.chooseAdvertiseAddress(addrs);
    EXPECT_FALSE(chosen.empty());
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(chosen, ec);
    EXPECT_FALSE(ec);
}
