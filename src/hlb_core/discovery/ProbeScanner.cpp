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
#include "hlb_core/discovery/ProbeScanner.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/system_error.hpp>

using tcp = boost::asio::ip::tcp;

namespace discovery
{

ProbeScanner::ProbeScanner(net::io_context& ioc,
                           std::chrono::milliseconds connectTimeout,
                           std::size_t maxInFlight)
    : m_ioc(ioc),
      m_connectTimeout(connectTimeout),
      m_maxInFlight(std::max<std::size_t>(maxInFlight, 1))
{
}

std::vector<Ipv4Address>
ProbeScanner::hostsOf(const Ipv4Network& network)
{
    std::vector<Ipv4Address> hosts;
    for (const auto& addr : network.hosts())
    {
        hosts.push_back(addr);
    }
    return hosts;
}

bool
ProbeScanner::isResourceError(const beast::error_code& ec)
{
    return ec == net::error::no_descriptors || ec == net::error::no_buffer_space ||
           ec == net::error::no_memory ||
           ec == boost::system::errc::too_many_files_open_in_system;
}

void
ProbeScanner::start(std::vector<Ipv4Address> hosts, uint16_t port, OpenHandler onOpen)
{
    m_hosts = std::move(hosts);
    m_port = port;
    m_onOpen = std::move(onOpen);
    m_next = 0;
    launchNext();
}

void
ProbeScanner::cancel()
{
    if (m_cancelled)
    {
        return;
    }
    m_cancelled = true;
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Probe scan cancelled with {} probes in flight, {} not started",
                        m_inFlight,
                        m_hosts.size() - m_next);
    for (const auto& stream : m_active)
    {
        stream->cancel();
    }
}

void
ProbeScanner::launchNext()
{
    while (!m_cancelled && m_inFlight < m_maxInFlight && m_next < m_hosts.size())
    {
        Ipv4Address host = m_hosts[m_next++];
        auto stream = std::make_shared<beast::tcp_stream>(m_ioc);
        stream->expires_after(m_connectTimeout);
        m_active.insert(stream);
        ++m_inFlight;

        stream->async_connect(tcp::endpoint(host, m_port),
                              [self = shared_from_this(), stream, host](beast::error_code ec) {
                                  self->onConnect(stream, host, ec);
                              });
    }
}

void
ProbeScanner::onConnect(const std::shared_ptr<beast::tcp_stream>& stream,
                        const Ipv4Address& host,
                        beast::error_code ec)
{
    --m_inFlight;
    m_active.erase(stream);

    beast::error_code ignored;
    stream->socket().close(ignored);

    if (m_cancelled)
    {
        return;
    }
    ++m_completed;

    if (!ec)
    {
        ++m_open;
        SPDLOG_LOGGER_TRACE(Logger::instance(), "{}:{} open", host.to_string(), m_port);
        m_onOpen(host.to_string());
    }
    else if (isResourceError(ec))
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Cannot probe {}:{}: {}",
                            host.to_string(),
                            m_port,
                            ec.message());
        m_resourceError = ec;
        cancel();
        return;
    }
    else
    {
        SPDLOG_LOGGER_TRACE(Logger::instance(),
                            "{}:{} miss ({})",
                            host.to_string(),
                            m_port,
                            ec.message());
    }

    launchNext();
}

std::vector<std::string>
ProbeScanner::scan(const Ipv4Network& network,
                   uint16_t port,
                   std::chrono::milliseconds connectTimeout,
                   std::size_t maxInFlight)
{
    net::io_context ioc;
    std::vector<Ipv4Address> open;

    auto scanner = std::make_shared<ProbeScanner>(ioc, connectTimeout, maxInFlight);
    scanner->start(hostsOf(network), port, [&open](const std::string& host) {
        open.push_back(boost::asio::ip::make_address_v4(host));
    });
    ioc.run();

    if (scanner->resourceError())
    {
        throw boost::system::system_error(*scanner->resourceError(),
                                          "probe scan of " + network.to_string());
    }

    std::sort(open.begin(), open.end());
    std::vector<std::string> result;
    for (const auto& addr : open)
    {
        result.push_back(addr.to_string());
    }
    return result;
}

} // namespace discovery
