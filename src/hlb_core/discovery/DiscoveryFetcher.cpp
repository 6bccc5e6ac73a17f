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
#include "hlb_core/discovery/DiscoveryFetcher.hpp"
#include "hlb_core/discovery/PayloadCodec.hpp"
#include "utils/Logger.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace discovery
{

namespace
{

/**
 * One GET exchange: connect, write request, read response, validate.
 * Keeps itself alive through the handlers it hands to Beast.
 */
class FetchSession : public std::enable_shared_from_this<FetchSession>
{
  public:
    FetchSession(net::io_context& ioc,
                 std::string host,
                 uint16_t port,
                 std::string path,
                 std::chrono::milliseconds timeout,
                 DiscoveryFetcher::ResultHandler handler)
        : m_stream(ioc),
          m_host(std::move(host)),
          m_port(port),
          m_path(std::move(path)),
          m_timeout(timeout),
          m_handler(std::move(handler))
    {
    }

    void run()
    {
        boost::system::error_code ec;
        auto address = net::ip::make_address_v4(m_host, ec);
        if (ec)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Fetch skipped, bad host {}", m_host);
            net::post(m_stream.get_executor(),
                      [self = shared_from_this()]() { self->finish(std::nullopt); });
            return;
        }

        // One deadline for the whole exchange
        m_stream.expires_after(m_timeout);
        m_stream.async_connect(tcp::endpoint(address, m_port),
                               beast::bind_front_handler(&FetchSession::onConnect,
                                                         shared_from_this()));
    }

  private:
    void onConnect(beast::error_code ec)
    {
        if (ec)
        {
            return miss("connect", ec);
        }

        m_req.method(http::verb::get);
        m_req.target(m_path);
        m_req.version(11);
        m_req.set(http::field::host, m_host + ":" + std::to_string(m_port));
        m_req.set(http::field::user_agent, "hlb-discovery");
        m_req.set(http::field::accept, "application/json");
        m_req.set(http::field::connection, "close");

        http::async_write(m_stream,
                          m_req,
                          beast::bind_front_handler(&FetchSession::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t bytesTransferred)
    {
        boost::ignore_unused(bytesTransferred);
        if (ec)
        {
            return miss("write", ec);
        }

        m_parser.body_limit(DiscoveryFetcher::MAX_BODY_BYTES);
        http::async_read(m_stream,
                         m_buffer,
                         m_parser,
                         beast::bind_front_handler(&FetchSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t bytesTransferred)
    {
        boost::ignore_unused(bytesTransferred);
        if (ec)
        {
            return miss("read", ec);
        }

        beast::error_code ignored;
        m_stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        const auto& res = m_parser.get();
        if (http::to_status_class(res.result()) != http::status_class::successful)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "{}:{}{} answered HTTP {}",
                                m_host,
                                m_port,
                                m_path,
                                res.result_int());
            return finish(std::nullopt);
        }

        auto payload = parseDiscoveryPayload(res.body());
        if (!payload)
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(),
                                "{}:{}{} returned an invalid discovery payload",
                                m_host,
                                m_port,
                                m_path);
            return finish(std::nullopt);
        }

        DiscoveryResult result;
        result.host = m_host;
        result.controllerAddress =
            payload->controller.address ? payload->controller.address->to_string() : m_host;
        result.payload = std::move(payload);
        result.verified = true;
        finish(std::move(result));
    }

    void miss(const char* stage, const beast::error_code& ec)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Fetch {}:{}{} failed at {}: {}",
                            m_host,
                            m_port,
                            m_path,
                            stage,
                            ec.message());
        finish(std::nullopt);
    }

    void finish(std::optional<DiscoveryResult> result)
    {
        auto handler = std::move(m_handler);
        m_handler = nullptr;
        if (handler)
        {
            handler(std::move(result));
        }
    }

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    http::request<http::empty_body> m_req;
    http::response_parser<http::string_body> m_parser;

    std::string m_host;
    uint16_t m_port;
    std::string m_path;
    std::chrono::milliseconds m_timeout;
    DiscoveryFetcher::ResultHandler m_handler;
};

} // namespace

DiscoveryFetcher::DiscoveryFetcher(std::string path, std::chrono::milliseconds timeout)
    : m_path(std::move(path)),
      m_timeout(timeout)
{
}

void
DiscoveryFetcher::asyncFetch(net::io_context& ioc,
                             const std::string& host,
                             uint16_t port,
                             ResultHandler handler) const
{
    std::make_shared<FetchSession>(ioc, host, port, m_path, m_timeout, std::move(handler))->run();
}

std::optional<DiscoveryResult>
DiscoveryFetcher::fetch(const std::string& host, uint16_t port) const
{
    net::io_context ioc;
    std::optional<DiscoveryResult> out;
    asyncFetch(ioc, host, port, [&out](std::optional<DiscoveryResult> result) {
        out = std::move(result);
    });
    ioc.run();
    return out;
}

} // namespace discovery
