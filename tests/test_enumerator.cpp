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
 * @file test_enumerator.cpp
 * @brief Tests for local address scope filtering and netmask conversion.
 */

#include <gtest/gtest.h>

#include "hlb_core/discovery/InterfaceEnumerator.hpp"

using discovery::InterfaceEnumerator;

namespace
{
bool
isGlobal(const std::string& ip)
{
    return InterfaceEnumerator::isGlobalScope(boost::asio::ip::make_address_v4(ip));
}
} // namespace

TEST(InterfaceEnumerator, LoopbackAndLinkLocalAreNotGlobal)
{
    EXPECT_FALSE(isGlobal("127.0.0.1"));
    EXPECT_FALSE(isGlobal("127.255.0.9"));
    EXPECT_FALSE(isGlobal("169.254.10.20"));
    EXPECT_FALSE(isGlobal("0.0.0.0"));
}

TEST(InterfaceEnumerator, RoutableAddressesAreGlobal)
{
    EXPECT_TRUE(isGlobal("192.168.56.10"));
    EXPECT_TRUE(isGlobal("10.0.2.15"));
    EXPECT_TRUE(isGlobal("8.8.8.8"));
    EXPECT_TRUE(isGlobal("169.253.255.255"));
    EXPECT_TRUE(isGlobal("128.0.0.1"));
}

TEST(InterfaceEnumerator, PrefixLengthFromMask)
{
    EXPECT_EQ(InterfaceEnumerator::prefixLengthFromMask(0xFFFFFF00u), 24);
    EXPECT_EQ(InterfaceEnumerator::prefixLengthFromMask(0xFFFF0000u), 16);
    EXPECT_EQ(InterfaceEnumerator::prefixLengthFromMask(0xFFFFFF80u), 25);
    EXPECT_EQ(InterfaceEnumerator::prefixLengthFromMask(0xFFFFFFFFu), 32);
    EXPECT_EQ(InterfaceEnumerator::prefixLengthFromMask(0u), 0);
}

TEST(InterfaceEnumerator, EnumerateReturnsOnlyGlobalAddresses)
{
    for (const auto& local : InterfaceEnumerator::enumerate())
    {
        EXPECT_FALSE(local.interfaceName.empty());
        EXPECT_TRUE(InterfaceEnumerator::isGlobalScope(local.address))
            << local.interfaceName << " " << local.address.to_string();
        EXPECT_FALSE(local.address.is_loopback()) << local.interfaceName;
        EXPECT_LE(local.prefixLength, 32);
    }
}
