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
#include "hlb_core/discovery/ControllerAdvertisement.hpp"
#include "hlb_core/discovery/InterfaceEnumerator.hpp"
#include "hlb_core/discovery/NetworkRanker.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"

namespace discovery
{

std::string
selectAdvertiseAddress(const ControllerConfig& cfg,
                       const std::function<std::vector<LocalAddress>()>& addressProvider)
{
    if (cfg.advertiseIp)
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "Advertising configured address {}", *cfg.advertiseIp);
        return *cfg.advertiseIp;
    }

    auto addrs = addressProvider ? addressProvider() : InterfaceEnumerator::enumerate();
    NetworkRanker ranker(cfg.preferredBlocks, cfg.preferredInterface);
    return ranker.chooseAdvertiseAddress(addrs);
}

DiscoveryPayload
makeControllerPayload(const ControllerConfig& cfg, const std::string& advertiseIp)
{
    DiscoveryPayload payload;
    payload.controller.address = utils::parseIpv4(advertiseIp);
    payload.controller.openflowPort = cfg.openflowPort;
    payload.controller.restPort = cfg.restPort;
    payload.controller.metricsPort = cfg.metricsPort;
    payload.vip.address = utils::parseIpv4(cfg.vipIp);
    payload.vip.port = cfg.vipPort;
    payload.vip.services = cfg.vipServices;
    payload.backends = cfg.backends;
    return payload;
}

} // namespace discovery
