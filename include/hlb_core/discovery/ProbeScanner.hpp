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
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace discovery
{

namespace beast = boost::beast;
namespace net = boost::asio;

/**
 * @class ProbeScanner
 * @brief Concurrent TCP connect scan of a list of hosts on one port.
 *
 * At most maxInFlight connects are pending at once; each gets its own deadline. A refused,
 * unreachable or timed out host is a miss. Hosts that accept are reported through the
 * OpenHandler as soon as their connect completes, so callers can act on the first open host
 * while the rest of the subnet is still being probed.
 *
 * The scanner must be created with std::make_shared and its io_context must be run by a
 * single thread; all bookkeeping relies on handlers being serialized.
 */
class ProbeScanner : public std::enable_shared_from_this<ProbeScanner>
{
  public:
    using OpenHandler = std::function<void(const std::string& host)>;

    ProbeScanner(net::io_context& ioc, std::chrono::milliseconds connectTimeout,
                 std::size_t maxInFlight);

    /**
     * @brief Queue every host and start the first batch of probes.
     *
     * Returns immediately; work happens while the io_context runs.
     */
    void start(std::vector<Ipv4Address> hosts, uint16_t port, OpenHandler onOpen);

    /**
     * @brief Stop launching probes and abort the pending ones.
     *
     * Aborted probes are neither reported nor counted as misses.
     */
    void cancel();

    bool cancelled() const
    {
        return m_cancelled;
    }

    /**
     * @brief Error that made probing impossible (descriptor/buffer/memory exhaustion).
     *
     * Set at most once; scanning stops when it is.
     */
    const std::optional<beast::error_code>& resourceError() const
    {
        return m_resourceError;
    }

    std::size_t completedCount() const
    {
        return m_completed;
    }

    std::size_t openCount() const
    {
        return m_open;
    }

    static std::vector<Ipv4Address> hostsOf(const Ipv4Network& network);

    static bool isResourceError(const beast::error_code& ec);

    /**
     * @brief Blocking scan of a whole subnet.
     *
     * @return Hosts that accepted a connection, in ascending address order.
     * @throws boost::system::system_error on a resource failure.
     */
    static std::vector<std::string> scan(const Ipv4Network& network, uint16_t port,
                                         std::chrono::milliseconds connectTimeout,
                                         std::size_t maxInFlight);

  private:
    void launchNext();
    void onConnect(const std::shared_ptr<beast::tcp_stream>& stream, const Ipv4Address& host,
                   beast::error_code ec);

    net::io_context& m_ioc;
    std::chrono::milliseconds m_connectTimeout;
    std::size_t m_maxInFlight;

    std::vector<Ipv4Address> m_hosts;
    uint16_t m_port = 0;
    OpenHandler m_onOpen;

    std::size_t m_next = 0;
    std::size_t m_inFlight = 0;
    std::size_t m_completed = 0;
    std::size_t m_open = 0;
    bool m_cancelled = false;
    std::optional<beast::error_code> m_resourceError;

    std::unordered_set<std::shared_ptr<beast::tcp_stream>> m_active;
};

} // namespace discovery
