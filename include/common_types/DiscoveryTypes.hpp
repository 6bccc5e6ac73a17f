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

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace discovery
{

using Ipv4Address = boost::asio::ip::address_v4;
using Ipv4Network = boost::asio::ip::network_v4;

// One global IPv4 address bound to a local interface
struct LocalAddress
{
    std::string interfaceName;
    Ipv4Address address;
    uint8_t prefixLength = 32;

    Ipv4Network network() const
    {
        return Ipv4Network(address, prefixLength).canonical();
    }
};

// Candidate network with its preference; lower rank is preferred
struct RankedNetwork
{
    Ipv4Network network;
    int rank = 0;
};

struct ControllerEndpoint
{
    std::optional<Ipv4Address> address; // absent: use the responding host
    uint16_t openflowPort = 0;
    uint16_t restPort = 0;
    uint16_t metricsPort = 0;
};

struct VirtualService
{
    Ipv4Address address;
    uint16_t port = 0;
    std::vector<uint16_t> services;
};

/**
 * @brief Controller identity as advertised on the discovery endpoint.
 *
 * backends are opaque descriptors forwarded untouched, in the controller's order.
 */
struct DiscoveryPayload
{
    ControllerEndpoint controller;
    VirtualService vip;
    std::vector<nlohmann::json> backends;
};

// Per-host outcome while scanning a subnet
enum class ScanOutcome
{
    NoConnection,
    ConnectionOnly,
    ValidatedPayload
};

/**
 * @brief Result of a discovery pass.
 *
 * host is the address that answered (or the operator override). controllerAddress is the
 * payload's controller address when present, otherwise host. payload is absent only for an
 * override that was trusted or could not be verified.
 */
struct DiscoveryResult
{
    std::string host;
    std::string controllerAddress;
    std::optional<DiscoveryPayload> payload;
    bool verified = false;
    std::vector<std::string> attemptedNetworks;
};

} // namespace discovery
