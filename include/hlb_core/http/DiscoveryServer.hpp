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

#include "hlb_core/http/HttpSession.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

/**
 * @class DiscoveryServer
 * @brief Controller-side HTTP listener for /discover, /status and /health.
 *
 * start() binds synchronously, so a port already in use surfaces as a
 * boost::system::system_error to the caller, then serves from a background thread that
 * runs the io_context on a small pool. stop() is idempotent and joins everything.
 */
class DiscoveryServer
{
  public:
    DiscoveryServer(net::io_context& ioc,
                    std::string bindAddress,
                    uint16_t port,
                    std::shared_ptr<const DiscoveryEndpointState> state,
                    unsigned threadCount = 2);
    ~DiscoveryServer();

    void start();
    void stop();

    // Port actually bound; differs from the requested one when that was 0
    uint16_t port() const;

    bool running() const
    {
        return m_serverRunning.load();
    }

    // Accepts that failed with something other than shutdown
    std::size_t acceptFailures() const
    {
        return m_acceptFailures.load();
    }

    static constexpr std::chrono::milliseconds ACCEPT_RETRY_DELAY{100};

  private:
    void runServer();
    void doAccept();
    void retryAccept();

    std::atomic<bool> m_serverRunning{false};
    net::io_context& m_ioContext;

    std::string m_bindAddress;
    uint16_t m_requestedPort;
    unsigned m_threadCount;

    std::unique_ptr<tcp::acceptor> m_serverAcceptor;
    std::unique_ptr<net::steady_timer> m_acceptRetryTimer;
    std::atomic<std::size_t> m_acceptFailures{0};
    std::thread m_serverThread;

    std::shared_ptr<const DiscoveryEndpointState> m_state;
};
