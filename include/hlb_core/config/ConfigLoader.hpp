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
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace discovery
{
std::vector<Ipv4Network> defaultPreferredBlocks();
Ipv4Network defaultExpectedNetwork();
} // namespace discovery

/**
 * @brief Everything a dataplane discovery pass needs, passed by value.
 *
 * controllerAddress set means no scanning at all. expectedNetwork is appended to the
 * candidate set even when no local interface is bound to it; std::nullopt disables that.
 */
struct DiscoveryConfig
{
    std::optional<std::string> controllerAddress;
    std::string preferredInterface;
    uint16_t discoveryPort;
    std::string discoveryPath;
    bool verifyOverride = true;

    std::vector<discovery::Ipv4Network> preferredBlocks;
    std::optional<discovery::Ipv4Network> expectedNetwork;

    std::chrono::milliseconds probeTimeout;
    std::chrono::milliseconds fetchTimeout;
    std::size_t maxInFlight;
    std::size_t maxCandidates;

    DiscoveryConfig();
};

/**
 * @brief Operator values for the topology launcher.
 *
 * vip and httpPort always win. controllerPort is used only when no payload was fetched.
 */
struct LaunchOverrides
{
    std::optional<std::string> vip;
    std::optional<uint16_t> controllerPort;
    std::optional<uint16_t> httpPort;
};

// Dataplane process options: discovery settings plus what the launcher needs
struct DataplaneOptions
{
    DiscoveryConfig discovery;
    LaunchOverrides launch;
    std::string topologyScript;
    std::vector<std::string> passThroughArgs;
    bool showHelp = false;
};

struct ControllerConfig
{
    std::optional<std::string> advertiseIp; // absent or "auto": detect
    std::string preferredInterface;
    std::string bindAddress;
    std::string configPath;

    uint16_t openflowPort;
    uint16_t restPort;
    uint16_t metricsPort;

    std::string vipIp;
    uint16_t vipPort;
    std::vector<uint16_t> vipServices;
    std::vector<nlohmann::json> backends;

    std::vector<discovery::Ipv4Network> preferredBlocks;
    bool showHelp = false;

    ControllerConfig();
};

/**
 * @brief Builds configuration value objects from flags, environment and config files.
 *
 * Precedence: explicit flag > environment variable > config file > built-in default.
 * Invalid values throw std::invalid_argument; an unreadable config file only warns.
 */
class ConfigLoader
{
  public:
    static DataplaneOptions parseDataplaneArgs(int argc, char* argv[]);
    static ControllerConfig parseControllerArgs(int argc, char* argv[]);

    /**
     * @brief Merge a controller JSON config file into cfg.
     *
     * @return false if the file is missing or malformed; cfg is left untouched then.
     */
    static bool loadControllerFile(const std::string& path, ControllerConfig& cfg);

    static std::string dataplaneUsage();
    static std::string controllerUsage();
};
