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
#include "hlb_core/discovery/NetworkRanker.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace discovery
{

/**
 * @brief Turns the host's own addresses into the bounded list of subnets to scan.
 *
 * Only RFC1918 addresses contribute. Subnets wider than /24 are narrowed to the /24 around
 * the local address. The expected network, if set, is always added. Output is sorted by
 * (rank, prefix length, network address) and capped at maxCandidates.
 */
class CandidateSetBuilder
{
  public:
    CandidateSetBuilder(const NetworkRanker& ranker,
                        std::optional<Ipv4Network> expectedNetwork,
                        std::size_t maxCandidates);

    std::vector<RankedNetwork> build(const std::vector<LocalAddress>& addrs) const;

    static bool isPrivate(const Ipv4Address& address);

    // /24 containing the local address if the network is wider, else its canonical network
    static Ipv4Network shrinkToScanSize(const LocalAddress& local);

  private:
    const NetworkRanker& m_ranker;
    std::optional<Ipv4Network> m_expectedNetwork;
    std::size_t m_maxCandidates;
};

} // namespace discovery
