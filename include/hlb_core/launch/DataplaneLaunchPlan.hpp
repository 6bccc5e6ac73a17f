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
#include "hlb_core/config/ConfigLoader.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Settings the dataplane topology is started with once the controller is known.
 *
 * Values come from the discovery payload when there is one, otherwise from the defaults in
 * AppConfig. Operator overrides are applied as LaunchOverrides describes.
 */
struct DataplaneLaunchPlan
{
    std::string controllerIp;
    uint16_t controllerPort = 0;
    std::string vipIp;
    uint16_t httpPort = 0;
    bool verified = false;

    static DataplaneLaunchPlan fromDiscovery(const discovery::DiscoveryResult& result,
                                             const LaunchOverrides& overrides);

    /**
     * @brief argv for the topology launcher. Python scripts are run through python3.
     */
    std::vector<std::string> command(const std::string& script,
                                     const std::vector<std::string>& extraArgs) const;
};

/**
 * @brief Replace the current process with argv.
 *
 * @return Only on failure, with the errno-based error message.
 */
std::string execCommand(const std::vector<std::string>& argv);
