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
#include "hlb_core/config/ConfigLoader.hpp"
#include "hlb_core/discovery/DiscoveryErrors.hpp"
#include "hlb_core/discovery/DiscoveryFetcher.hpp"
#include "hlb_core/discovery/NetworkRanker.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace discovery
{

/**
 * @class DiscoveryOrchestrator
 * @brief Single best-effort pass that locates the controller from the dataplane host.
 *
 * State machine:
 *   Idle -> ScanningSubnet(i) -> Found | ScanningSubnet(i+1) | AllExhausted
 *
 * Candidate subnets are scanned one after another in rank order. Inside a subnet every host
 * is probed concurrently and each open host is fetched as soon as it is seen; the first valid
 * payload wins and everything still pending in that subnet is abandoned.
 *
 * An explicit controller address skips enumeration and scanning entirely.
 *
 * Errors crossing run():
 *  - NoCandidatesError: nothing to scan.
 *  - DiscoveryExhaustedError: all candidates scanned, no valid payload.
 *  - DiscoveryResourceError: sockets could not be opened.
 * Probe and fetch misses never escape.
 */
class DiscoveryOrchestrator
{
  public:
    enum class State
    {
        Idle,
        ScanningSubnet,
        Found,
        AllExhausted
    };

    using AddressProvider = std::function<std::vector<LocalAddress>()>;

    explicit DiscoveryOrchestrator(DiscoveryConfig config, AddressProvider addressProvider = {});

    /**
     * @brief Run the full discovery pass.
     *
     * @return The winning host and its payload, or the override address.
     */
    DiscoveryResult run();

    /**
     * @brief Scan the given candidates in order, starting at ScanningSubnet(0).
     */
    DiscoveryResult scanCandidates(const std::vector<RankedNetwork>& candidates);

    // Enumerate local addresses and turn them into ranked candidates
    std::vector<RankedNetwork> buildCandidates() const;

    State state() const
    {
        return m_state;
    }

    // Index of the subnet being (or last) scanned
    std::optional<std::size_t> subnetIndex() const
    {
        return m_subnetIndex;
    }

    static const char* toString(State state);

  private:
    DiscoveryResult useOverride(const std::string& address);
    std::optional<DiscoveryResult> scanSubnet(const RankedNetwork& candidate);
    void transition(State next, std::optional<std::size_t> index = std::nullopt);

    DiscoveryConfig m_config;
    AddressProvider m_addressProvider;
    NetworkRanker m_ranker;
    DiscoveryFetcher m_fetcher;

    State m_state = State::Idle;
    std::optional<std::size_t> m_subnetIndex;
};

} // namespace discovery
