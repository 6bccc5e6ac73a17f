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

// utils/Utils.hpp
#pragma once

#include "utils/Logger.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Common utility helpers used across HybridLB.
 *
 * This header provides small, header-only helpers for:
 *  - IPv4 address and port parsing,
 *  - environment variable lookup,
 *  - timestamp helpers,
 *  - string joining for log and error messages.
 */
namespace utils
{

/**
 * @brief Parse dotted IPv4 string.
 *
 * @param ipStr Dotted IPv4 string (e.g., "192.168.56.121").
 * @return Parsed address.
 * @throws std::invalid_argument if the string is not a valid IPv4 address.
 */
inline boost::asio::ip::address_v4
parseIpv4(const std::string& ipStr)
{
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address_v4(ipStr, ec);
    if (ec)
    {
        throw std::invalid_argument("Invalid IP address: " + ipStr);
    }
    return addr;
}

/**
 * @brief Check whether a string is a dotted IPv4 address.
 */
inline bool
isIpv4(const std::string& ipStr)
{
    boost::system::error_code ec;
    boost::asio::ip::make_address_v4(ipStr, ec);
    return !ec;
}

/**
 * @brief Parse a decimal TCP port in 1..65535.
 *
 * @throws std::invalid_argument on parse failure or out-of-range value.
 */
inline uint16_t
parsePort(std::string_view portStr)
{
    unsigned int value = 0;
    auto [p, ec] = std::from_chars(portStr.data(), portStr.data() + portStr.size(), value);
    if (ec != std::errc() || p != portStr.data() + portStr.size() || value == 0 || value > 65535)
    {
        throw std::invalid_argument("Invalid port: " + std::string(portStr));
    }
    return static_cast<uint16_t>(value);
}

/**
 * @brief Parse a non-negative decimal integer option value.
 *
 * @throws std::invalid_argument on parse failure.
 */
inline std::size_t
parseCount(std::string_view str)
{
    std::size_t value = 0;
    auto [p, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || p != str.data() + str.size())
    {
        throw std::invalid_argument("Invalid number: " + std::string(str));
    }
    return value;
}

/**
 * @brief Read an environment variable.
 *
 * @return The value, or std::nullopt if unset or empty.
 */
inline std::optional<std::string>
getEnv(const char* name)
{
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0')
    {
        return std::nullopt;
    }
    return std::string(value);
}

inline std::string
join(const std::vector<std::string>& parts, std::string_view sep = ", ")
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
        {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

/**
 * @brief Monotonic time in milliseconds (steady_clock).
 *
 * Suitable for measuring durations; not tied to wall-clock time.
 */
inline int64_t
getCurrentTimeMillisSteadyClock()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace utils
