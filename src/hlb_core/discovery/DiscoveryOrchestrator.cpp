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
#include "hlb_core/discovery/DiscoveryOrchestrator.hpp"
#include "hlb_core/discovery/CandidateSetBuilder.hpp"
#include "hlb_core/discovery/InterfaceEnumerator.hpp"
#include "hlb_core/discovery/ProbeScanner.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <boost/asio/io_context.hpp>
#include <memory>

namespace net = boost::asio;

namespace discovery
{

namespace
{
struct SubnetTally
{
    std::size_t noConnection = 0;
    std::size_t connectionOnly = 0;
    std::size_t validated = 0;

    void record(ScanOutcome outcome)
    {
        switch (outcome)
        {
        case ScanOutcome::NoConnection:
            ++noConnection;
            break;
        case ScanOutcome::ConnectionOnly:
            ++connectionOnly;
            break;
        case ScanOutcome::ValidatedPayload:
            ++validated;
            break;
        }
    }
};
} // namespace

DiscoveryOrchestrator::DiscoveryOrchestrator(DiscoveryConfig config, AddressProvider addressProvider)
    : m_config(std::move(config)),
      m_addressProvider(addressProvider ? std::move(addressProvider)
                                        : AddressProvider(&InterfaceEnumerator::enumerate)),
      m_ranker(m_config.preferredBlocks, m_config.preferredInterface),
      m_fetcher(m_config.discoveryPath, m_config.fetchTimeout)
{
}

const char*
DiscoveryOrchestrator::toString(State state)
{
    switch (state)
    {
    case State::Idle:
        return "Idle";
    case State::ScanningSubnet:
        return "ScanningSubnet";
    case State::Found:
        return "Found";
    case State::AllExhausted:
        return "AllExhausted";
    }
    return "Unknown";
}

void
DiscoveryOrchestrator::transition(State next, std::optional<std::size_t> index)
{
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Discovery state {} -> {}{}",
                        toString(m_state),
                        toString(next),
                        index ? "(" + std::to_string(*index) + ")" : std::string());
    m_state = next;
    if (index)
    {
        m_subnetIndex = index;
    }
}

DiscoveryResult
DiscoveryOrchestrator::run()
{
    m_state = State::Idle;
    m_subnetIndex.reset();

    if (m_config.controllerAddress)
    {
        return useOverride(*m_config.controllerAddress);
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "No controller address given; attempting auto-discovery");
    return scanCandidates(buildCandidates());
}

std::vector<RankedNetwork>
DiscoveryOrchestrator::buildCandidates() const
{
    CandidateSetBuilder builder(m_ranker, m_config.expectedNetwork, m_config.maxCandidates);
    return builder.build(m_addressProvider());
}

DiscoveryResult
DiscoveryOrchestrator::scanCandidates(const std::vector<RankedNetwork>& candidates)
{
    if (candidates.empty())
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "No candidate networks to scan");
        throw NoCandidatesError();
    }

    std::vector<std::string> attempted;
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        const auto& candidate = candidates[i];
        transition(State::ScanningSubnet, i);
        attempted.push_back(candidate.network.to_string());

        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Scanning {} (rank {}) for controller REST on port {} ...",
                           candidate.network.to_string(),
                           candidate.rank,
                           m_config.discoveryPort);

        auto found = scanSubnet(candidate);
        if (found)
        {
            found->attemptedNetworks = attempted;
            transition(State::Found);
            SPDLOG_LOGGER_INFO(Logger::instance(),
                               "Discovered controller at {}:{}",
                               found->host,
                               m_config.discoveryPort);
            return std::move(*found);
        }
    }

    transition(State::AllExhausted);
    SPDLOG_LOGGER_ERROR(Logger::instance(),
                        "Controller discovery failed; scanned {}",
                        utils::join(attempted));
    throw DiscoveryExhaustedError(std::move(attempted), m_config.discoveryPort);
}

std::optional<DiscoveryResult>
DiscoveryOrchestrator::scanSubnet(const RankedNetwork& candidate)
{
    net::io_context ioc;
    std::optional<DiscoveryResult> winner;
    SubnetTally tally;
    const uint16_t port = m_config.discoveryPort;
    const int64_t startedMs = utils::getCurrentTimeMillisSteadyClock();

    auto scanner = std::make_shared<ProbeScanner>(ioc, m_config.probeTimeout, m_config.maxInFlight);
    scanner->start(ProbeScanner::hostsOf(candidate.network), port, [&](const std::string& host) {
        if (winner)
        {
            return;
        }
        m_fetcher.asyncFetch(ioc, host, port, [&, host](std::optional<DiscoveryResult> result) {
            if (winner)
            {
                return;
            }
            if (!result)
            {
                tally.record(ScanOutcome::ConnectionOnly);
                SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                    "{}:{} accepted TCP but gave no valid payload",
                                    host,
                                    port);
                return;
            }
            tally.record(ScanOutcome::ValidatedPayload);
            winner = std::move(result);
            // First validated payload wins; abandon the rest of this subnet.
            scanner->cancel();
            ioc.stop();
        });
    });

    ioc.run();

    tally.noConnection = scanner->completedCount() - scanner->openCount();
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "{}: {} probed, {} no connection, {} open without payload, {} validated "
                        "in {} ms",
                        candidate.network.to_string(),
                        scanner->completedCount(),
                        tally.noConnection,
                        tally.connectionOnly,
                        tally.validated,
                        utils::getCurrentTimeMillisSteadyClock() - startedMs);

    if (!winner && scanner->resourceError())
    {
        throw DiscoveryResourceError(candidate.network.to_string(), *scanner->resourceError());
    }
    return winner;
}

DiscoveryResult
DiscoveryOrchestrator::useOverride(const std::string& address)
{
    DiscoveryResult result;
    result.host = address;
    result.controllerAddress = address;

    if (!m_config.verifyOverride)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "Using controller {} without verification", address);
        transition(State::Found);
        return result;
    }

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Verifying controller {} via http://{}:{}{}",
                       address,
                       address,
                       m_config.discoveryPort,
                       m_config.discoveryPath);

    auto fetched = m_fetcher.fetch(address, m_config.discoveryPort);
    transition(State::Found);
    if (fetched)
    {
        return std::move(*fetched);
    }

    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "Could not reach controller REST at {}:{}; continuing with defaults",
                       address,
                       m_config.discoveryPort);
    return result;
}

} // namespace discovery
