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

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief What the discovery endpoint serves, shared by every session.
 *
 * payloadSource is called per request so the advertised payload always reflects the
 * controller's current configuration. It may throw; the session answers 500 then.
 */
struct DiscoveryEndpointState
{
    std::function<json()> payloadSource;
    std::string advertiseIp;
    std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now();
};

/**
 * @class HttpSession
 * @brief Serves one client connection of the discovery endpoint using Boost.Beast.
 *
 * Reads requests, routes them, writes the response and honours keep-alive. Managed by a
 * std::shared_ptr that the pending asynchronous operations keep alive.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession>
{
  public:
    HttpSession(tcp::socket socket, std::shared_ptr<const DiscoveryEndpointState> state);

    /**
     * @brief Starts the asynchronous operation for the session.
     */
    void start();

  private:
    // --- Asynchronous Operation Handlers ---
    void readRequest();
    void onRead(beast::error_code ec, std::size_t bytesTransferred);
    void writeResponse();
    void onWrite(beast::error_code ec, std::size_t bytesTransferred);
    void closeSocket();

    // --- Request Routing and Handling ---
    void handleRequest();

    void handleDiscover(http::response<http::string_body>& res);
    void handleStatus(http::response<http::string_body>& res);
    void handleHealth(http::response<http::string_body>& res);
    void handleNotFound(http::response<http::string_body>& res);

    // --- Member Variables ---
    tcp::socket m_socket;
    beast::flat_buffer m_buffer;
    http::request<http::string_body> m_req;

    // The response must be stored in a shared_ptr to keep it alive during async write
    std::shared_ptr<http::response<http::string_body>> m_res;

    std::shared_ptr<const DiscoveryEndpointState> m_state;
};
