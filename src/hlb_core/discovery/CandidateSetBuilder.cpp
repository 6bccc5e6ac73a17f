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
#include "hlb_core/discovery/CandidateSetBuilder.hpp"
#include "setting/AppConfig.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <map>
#include <tuple>

namespace discovery
{

namespace
{
const Ipv4Network kPrivateBlocks[] = {boost::asio::ip::make_network_v4("10.0.0.0/8"),
                                      boost::asio::ip::make_network_v4("172.16.0.0/12"),
                                      boost::asio::ip::make_network_v4("192.168.0.0/16")};
} // namespace

CandidateSetBuilder::CandidateSetBuilder(const NetworkRanker& ranker,
                                         std::optional<Ipv4Network> expectedNetwork,
                                         std::size_t maxCandidates)
    : m_ranker(ranker),
      m_expectedNetwork(std::move(expectedNetwork)),
      m_maxCandidates(maxCandidates)
{
}

bool
CandidateSetBuilder::isPrivate(const Ipv4Address& address)
{
    return std::any_of(std::begin(kPrivateBlocks), std::end(kPrivateBlocks), [&](const auto& b) {
        return NetworkRanker::contains(b, address);
    });
}

Ipv4Network
CandidateSetBuilder::shrinkToScanSize(const LocalAddress& local)
{
    if (local.prefixLength < AppConfig::MAX_SCAN_PREFIX)
    {
        return Ipv4Network(local.address, AppConfig::MAX_SCAN_PREFIX).canonical();
    }
    return local.network();
}

std::vector<RankedNetwork>
CandidateSetBuilder::build(const std::vector<LocalAddress>& addrs) const
{
    // keyed by (network address, prefix) so duplicates collapse to their best rank
    std::map<std::pair<uint32_t, unsigned short>, RankedNetwork> unique;

    auto add = [&](const Ipv4Network& net, int rank) {
        auto key = std::make_pair(net.network().to_uint(), net.prefix_length());
        auto it = unique.find(key);
        if (it == unique.end())
        {
            unique.emplace(key, RankedNetwork{net, rank});
        }
        else if (rank < it->second.rank)
        {
            it->second.rank = rank;
        }
    };

    for (const auto& local : addrs)
    {
        if (!isPrivate(local.address))
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "Skipping non-private address {} on {}",
                                local.address.to_string(),
                                local.interfaceName);
            continue;
        }
        Ipv4Network net = shrinkToScanSize(local);
        int rank = m_ranker.rankAddress(local);
        if (rank != NetworkRanker::PREFERRED_INTERFACE_RANK)
        {
            rank = m_ranker.rank(net);
        }
        add(net, rank);
    }

    if (m_expectedNetwork)
    {
        add(m_expectedNetwork->canonical(), m_ranker.rank(m_expectedNetwork->canonical()));
    }

    std::vector<RankedNetwork> candidates;
    candidates.reserve(unique.size());
    for (auto& [key, ranked] : unique)
    {
        candidates.push_back(ranked);
    }

    std::sort(candidates.begin(), candidates.end(), [](const RankedNetwork& a, const RankedNetwork& b) {
        return std::make_tuple(a.rank, a.network.prefix_length(), a.network.network().to_uint()) <
               std::make_tuple(b.rank, b.network.prefix_length(), b.network.network().to_uint());
    });

    if (candidates.size() > m_maxCandidates)
    {
        candidates.resize(m_maxCandidates);
    }
    return candidates;
}

} // namespace discovery
