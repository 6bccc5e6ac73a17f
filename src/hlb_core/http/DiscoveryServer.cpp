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
#include "hlb_core/http/DiscoveryServer.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <boost/asio/ip/address.hpp>
#include <utility>
#include <vector>

DiscoveryServer::DiscoveryServer(net::io_context& ioc,
                                 std::string bindAddress,
                                 uint16_t port,
                                 std::shared_ptr<const DiscoveryEndpointState> state,
                                 unsigned threadCount)
    : m_ioContext(ioc),
      m_bindAddress(std::move(bindAddress)),
      m_requestedPort(port),
      m_threadCount(std::max(threadCount, 1u)),
      m_state(std::move(state))
{
}

DiscoveryServer::~DiscoveryServer()
{
    stop();
}

void
DiscoveryServer::start()
{
    if (m_serverRunning.load())
    {
        return;
    }

    tcp::endpoint endpoint{net::ip::make_address(m_bindAddress), m_requestedPort};
    m_serverAcceptor = std::make_unique<tcp::acceptor>(m_ioContext, endpoint);
    m_acceptRetryTimer = std::make_unique<net::steady_timer>(m_ioContext);

    m_serverRunning.store(true);
    m_serverThread = std::thread(&DiscoveryServer::runServer, this);
}

uint16_t
DiscoveryServer::port() const
{
    if (!m_serverAcceptor)
    {
        return m_requestedPort;
    }
    boost::system::error_code ec;
    auto ep = m_serverAcceptor->local_endpoint(ec);
    return ec ? m_requestedPort : ep.port();
}

void
DiscoveryServer::stop()
{
    // Exchange returns the old value, so we check if it *was* true
    if (!m_serverRunning.exchange(false))
    {
        return;
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "DiscoveryServer stopping");

    m_ioContext.stop();

    if (m_serverThread.joinable())
    {
        m_serverThread.join();
    }

    // No handler runs past this point; closing is safe from this thread.
    if (m_serverAcceptor)
    {
        boost::system::error_code ec;
        m_serverAcceptor->close(ec);
        if (ec && ec != net::error::bad_descriptor)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(), "acceptor close error: {}", ec.message());
        }
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "DiscoveryServer stopped.");
}

void
DiscoveryServer::runServer()
{
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Discovery endpoint listening on {}:{}",
                       m_bindAddress,
                       port());

    doAccept(); // start async accept loop

    std::vector<std::thread> threadPool;
    for (unsigned i = 0; i < m_threadCount; ++i)
    {
        threadPool.emplace_back([this]() { m_ioContext.run(); });
    }

    for (auto& t : threadPool)
    {
        t.join();
    }

    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Exiting discovery endpoint loop");
}

void
DiscoveryServer::doAccept()
{
    auto sock = std::make_shared<tcp::socket>(m_ioContext);

    m_serverAcceptor->async_accept(*sock, [this, sock](boost::system::error_code ec) {
        if (!ec && m_serverRunning.load())
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Accepted new connection");
            std::make_shared<HttpSession>(std::move(*sock), m_state)->start();
        }
        else if (ec && ec != net::error::operation_aborted)
        {
            ++m_acceptFailures;
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Accept failed: {}; retrying in {} ms",
                               ec.message(),
                               ACCEPT_RETRY_DELAY.count());
            return retryAccept();
        }

        if (m_serverRunning.load())
        {
            doAccept(); // keep accepting
        }
    });
}

void
DiscoveryServer::retryAccept()
{
    // Errors such as EMFILE persist until descriptors are released
    m_acceptRetryTimer->expires_after(ACCEPT_RETRY_DELAY);
    m_acceptRetryTimer->async_wait([this](boost::system::error_code ec) {
        if (!ec && m_serverRunning.load())
        {
            doAccept();
        }
    });
}
