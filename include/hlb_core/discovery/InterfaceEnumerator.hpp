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

#pragma once

#include "common_types/DiscoveryTypes.hpp"
#include <vector>

namespace discovery
{

/**
 * @brief Lists the host's global-scope IPv4 addresses.
 *
 * Loopback and link-local (169.254.0.0/16) addresses are excluded, as are entries the OS
 * reports without a netmask. Interfaces are reported in the order the OS returns them.
 */
class InterfaceEnumerator
{
  public:
    /**
     * @brief Snapshot the local addresses.
     *
     * @return Addresses with interface name and prefix length. Empty if the OS query fails;
     *         the failure is logged, never thrown.
     */
    static std::vector<LocalAddress> enumerate();

    static bool isGlobalScope(const Ipv4Address& address);

    // Number of leading one bits in a host-order netmask
    static uint8_t prefixLengthFromMask(uint32_t mask);
};

} // namespace discovery
