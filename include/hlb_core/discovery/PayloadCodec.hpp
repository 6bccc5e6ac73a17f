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
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief JSON encoding of the discovery payload served on /discover.
 *
 * Schema:
 *   {
 *     "controller": {"ip": str, "of_listen_port": int, "rest_port": int, "metrics_port": int},
 *     "vip":        {"ip": str, "port": int, "services": [int, ...]},
 *     "backends":   [any, ...]
 *   }
 *
 * "vip" with a valid "ip" is mandatory. Everything under "controller" is optional and falls
 * back to the responding host and the default ports.
 */
namespace discovery
{

/**
 * @brief Read a TCP port from an integer or a numeric string.
 *
 * @return The port, or std::nullopt if j is null, not numeric or outside 1..65535.
 */
std::optional<uint16_t> portFromJson(const nlohmann::json& j);

/**
 * @brief Pick the HTTP service port from a VIP service list.
 *
 * 8080 if listed, else the first entry, else 8080.
 */
uint16_t preferredServicePort(const std::vector<uint16_t>& services);

std::optional<DiscoveryPayload> payloadFromJson(const nlohmann::json& j);

/**
 * @brief Parse and validate a discovery response body.
 *
 * @return std::nullopt when the body is not a JSON object or a required field is missing
 *         or malformed. Never throws.
 */
std::optional<DiscoveryPayload> parseDiscoveryPayload(const std::string& body);

nlohmann::json payloadToJson(const DiscoveryPayload& payload);

} // namespace discovery
