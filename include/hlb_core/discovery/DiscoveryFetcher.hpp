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
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace discovery
{

/**
 * @class DiscoveryFetcher
 * @brief Fetches and validates the discovery payload from one host.
 *
 * Issues a single "GET <path>" bounded by one overall deadline. A transport error, a
 * non-2xx status, an oversized or non-JSON body and a payload lacking its VIP all count
 * as a miss and yield std::nullopt; nothing is thrown.
 */
class DiscoveryFetcher
{
  public:
    using ResultHandler = std::function<void(std::optional<DiscoveryResult>)>;

    static constexpr std::size_t MAX_BODY_BYTES = 64 * 1024;

    DiscoveryFetcher(std::string path, std::chrono::milliseconds timeout);

    /**
     * @brief Start a fetch on the caller's io_context.
     *
     * handler is invoked exactly once from the io_context unless the context is stopped
     * first.
     */
    void asyncFetch(boost::asio::io_context& ioc, const std::string& host, uint16_t port,
                    ResultHandler handler) const;

    // Blocking variant on a private io_context
    std::optional<DiscoveryResult> fetch(const std::string& host, uint16_t port) const;

    const std::string& path() const
    {
        return m_path;
    }

  private:
    std::string m_path;
    std::chrono::milliseconds m_timeout;
};

} // namespace discovery
