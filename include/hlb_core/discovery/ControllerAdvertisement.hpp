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
#include <functional>
#include <string>
#include <vector>

namespace discovery
{

/**
 * @brief Address the controller tells dataplanes to use.
 *
 * An explicit cfg.advertiseIp wins; otherwise the ranker picks among the local addresses
 * returned by addressProvider (InterfaceEnumerator::enumerate when empty).
 */
std::string selectAdvertiseAddress(const ControllerConfig& cfg,
                                   const std::function<std::vector<LocalAddress>()>& addressProvider = {});

DiscoveryPayload makeControllerPayload(const ControllerConfig& cfg, const std::string& advertiseIp);

} // namespace discovery
