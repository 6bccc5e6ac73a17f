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
#include <string>
#include <vector>

namespace discovery
{

/**
 * @brief Orders addresses and networks by an operator-defined list of preferred blocks.
 *
 * The rank of an address or network is the index of the first preferred block containing
 * it, UNRANKED if none does. A configured preferred interface outranks every block.
 *
 * Used by the controller to pick the address it advertises and by the dataplane to decide
 * which subnets to scan first. Orderings are total: ties on rank fall back to interface
 * name and then to the numeric address, so an unchanged host always yields the same order.
 */
class NetworkRanker
{
  public:
    static constexpr int UNRANKED = 999;
    static constexpr int PREFERRED_INTERFACE_RANK = -1;

    explicit NetworkRanker(std::vector<Ipv4Network> preferredBlocks,
                           std::string preferredInterface = "");

    int rank(const Ipv4Address& address) const;
    int rank(const Ipv4Network& network) const;

    // Like rank(address), with the preferred interface bias applied.
    int rankAddress(const LocalAddress& local) const;

    std::vector<LocalAddress> orderAddresses(std::vector<LocalAddress> addrs) const;

    /**
     * @brief Pick the address the dataplane should use to reach this host.
     *
     * Priority: the preferred interface's address, then the best-ranked address, then the
     * address the host name resolves to, then 127.0.0.1.
     */
    std::string chooseAdvertiseAddress(const std::vector<LocalAddress>& addrs) const;

    const std::string& preferredInterface() const
    {
        return m_preferredInterface;
    }

    static bool contains(const Ipv4Network& block, const Ipv4Address& address);
    static bool contains(const Ipv4Network& block, const Ipv4Network& network);

    static std::string resolveHostAddress();

  private:
    std::vector<Ipv4Network> m_preferredBlocks;
    std::string m_preferredInterface;
};

} // namespace discovery
