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
#include "hlb_core/http/HttpSession.hpp"
#include "setting/AppConfig.hpp"
#include "utils/Logger.hpp"
#include <string>
#include <string_view>

HttpSession::HttpSession(tcp::socket socket, std::shared_ptr<const DiscoveryEndpointState> state)
    : m_socket(std::move(socket)),
      m_state(std::move(state))
{
}

void
HttpSession::start()
{
    readRequest();
}

void
HttpSession::readRequest()
{
    m_req = {}; // Clear request for reuse
    http::async_read(m_socket,
                     m_buffer,
                     m_req,
                     beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

void
HttpSession::onRead(beast::error_code ec, std::size_t bytes_transferred)
{
    boost::ignore_unused(bytes_transferred);

    if (ec == http::error::end_of_stream)
    {
        return closeSocket();
    }
    if (ec)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Read error: {}", ec.message());
        return;
    }

    handleRequest();
}

void
HttpSession::handleRequest()
{
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Got request: {} {}",
                       std::string(m_req.method_string()),
                       std::string(m_req.target()));

    auto response =
        std::make_shared<http::response<http::string_body>>(http::status::ok, m_req.version());
    response->keep_alive(m_req.keep_alive());
    response->set(http::field::server, AppConfig::SERVER_NAME);
    response->set(http::field::access_control_allow_origin, "*");
    response->set(http::field::access_control_allow_methods, "GET, OPTIONS");
    response->set(http::field::content_type, "application/json");

    try
    {
        const auto method = m_req.method();
        const std::string targetStr(m_req.target());
        // Query strings are accepted and ignored
        const std::string_view target = std::string_view(targetStr).substr(0, targetStr.find('?'));

        if (method == http::verb::options)
        {
            response->result(http::status::no_content); // 204 No Content
            m_res = response;
            writeResponse();
            return;
        }

        // --- API ROUTING ---
        if (method == http::verb::get && target == AppConfig::DISCOVER_PATH)
        {
            handleDiscover(*response);
        }
        else if (method == http::verb::get && target == AppConfig::STATUS_PATH)
        {
            handleStatus(*response);
        }
        else if (method == http::verb::get && target == AppConfig::HEALTH_PATH)
        {
            handleHealth(*response);
        }
        else
        {
            handleNotFound(*response);
        }
    }
    catch (const json::exception& e)
    {
        response->result(http::status::internal_server_error);
        response->body() = json{{"error", "JSON encoding error"}, {"details", e.what()}}.dump();
        SPDLOG_LOGGER_ERROR(Logger::instance(), "JSON exception in request handler: {}", e.what());
    }
    catch (const std::exception& e)
    {
        response->result(http::status::internal_server_error);
        response->body() = json{{"error", "Internal server error"}, {"details", e.what()}}.dump();
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Standard exception in request handler: {}",
                            e.what());
    }

    m_res = response;
    writeResponse();
}

void
HttpSession::writeResponse()
{
    m_res->prepare_payload();
    SPDLOG_LOGGER_TRACE(Logger::instance(),
                        "Server reply with status {}: {}",
                        m_res->result_int(),
                        m_res->body());
    http::async_write(m_socket,
                      *m_res,
                      beast::bind_front_handler(&HttpSession::onWrite, shared_from_this()));
}

void
HttpSession::onWrite(beast::error_code ec, std::size_t bytes_transferred)
{
    boost::ignore_unused(bytes_transferred);

    if (ec)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Write error: {}", ec.message());
        return;
    }

    // Honor keep-alive
    if (!m_res->keep_alive())
    {
        closeSocket();
        return;
    }

    m_res.reset(); // free the just-sent message
    readRequest(); // continue serving next request
}

void
HttpSession::closeSocket()
{
    beast::error_code ec;
    m_socket.shutdown(tcp::socket::shutdown_send, ec);
}

// --- Individual Request Handlers Implementation ---

void
HttpSession::handleDiscover(http::response<http::string_body>& res)
{
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Handle Discover");
    res.body() = m_state->payloadSource().dump();
}

void
HttpSession::handleStatus(http::response<http::string_body>& res)
{
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Handle Status");
    json status = m_state->payloadSource();
    status["status"] = "running";
    status["advertise_ip"] = m_state->advertiseIp;
    status["uptime_s"] = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::steady_clock::now() - m_state->startedAt)
                             .count();
    res.body() = status.dump();
}

void
HttpSession::handleHealth(http::response<http::string_body>& res)
{
    res.body() = R"({"status":"ok"})";
}

void
HttpSession::handleNotFound(http::response<http::string_body>& res)
{
    SPDLOG_LOGGER_WARN(Logger::instance(),
                       "Received unsupported request: method={}, target={}",
                       std::string(m_req.method_string()),
                       std::string(m_req.target()));
    res.result(http::status::not_found);
    res.body() = json{{"error", "Not Found"}}.dump();
}
