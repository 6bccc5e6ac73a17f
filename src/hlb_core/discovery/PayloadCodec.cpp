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
#include "hlb_core/discovery/PayloadCodec.hpp"
#include "setting/AppConfig.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace discovery
{

std::optional<uint16_t>
portFromJson(const json& j)
{
    if (j.is_number_integer())
    {
        auto value = j.get<int64_t>();
        if (value < 1 || value > 65535)
        {
            return std::nullopt;
        }
        return static_cast<uint16_t>(value);
    }
    if (j.is_string())
    {
        try
        {
            return utils::parsePort(j.get<std::string>());
        }
        catch (const std::invalid_argument&)
        {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

uint16_t
preferredServicePort(const std::vector<uint16_t>& services)
{
    if (std::find(services.begin(), services.end(), AppConfig::DEFAULT_HTTP_PORT) !=
        services.end())
    {
        return AppConfig::DEFAULT_HTTP_PORT;
    }
    if (!services.empty())
    {
        return services.front();
    }
    return AppConfig::DEFAULT_HTTP_PORT;
}

namespace
{

// Absent keys fall back; present but invalid ones reject the payload.
bool
readOptionalPort(const json& obj, const char* key, uint16_t fallback, uint16_t& out)
{
    if (!obj.contains(key) || obj[key].is_null())
    {
        out = fallback;
        return true;
    }
    auto port = portFromJson(obj[key]);
    if (!port)
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Rejecting payload: invalid {}", key);
        return false;
    }
    out = *port;
    return true;
}

} // namespace

std::optional<DiscoveryPayload>
payloadFromJson(const json& j)
{
    if (!j.is_object())
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Rejecting payload: not a JSON object");
        return std::nullopt;
    }

    if (!j.contains("vip") || !j["vip"].is_object())
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Rejecting payload: missing vip");
        return std::nullopt;
    }

    DiscoveryPayload payload;

    const auto& vip = j["vip"];
    if (!vip.contains("ip") || !vip["ip"].is_string() ||
        !utils::isIpv4(vip["ip"].get<std::string>()))
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Rejecting payload: missing or invalid vip.ip");
        return std::nullopt;
    }
    payload.vip.address = utils::parseIpv4(vip["ip"].get<std::string>());

    if (vip.contains("services") && vip["services"].is_array())
    {
        for (const auto& s : vip["services"])
        {
            if (auto port = portFromJson(s))
            {
                payload.vip.services.push_back(*port);
            }
        }
    }
    if (!readOptionalPort(vip, "port", preferredServicePort(payload.vip.services), payload.vip.port))
    {
        return std::nullopt;
    }

    json ctrl = j.value("controller", json::object());
    if (ctrl.is_null())
    {
        ctrl = json::object();
    }
    if (!ctrl.is_object())
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Rejecting payload: controller is not an object");
        return std::nullopt;
    }
    if (ctrl.contains("ip") && !ctrl["ip"].is_null())
    {
        if (!ctrl["ip"].is_string() || !utils::isIpv4(ctrl["ip"].get<std::string>()))
        {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Rejecting payload: invalid controller.ip");
            return std::nullopt;
        }
        payload.controller.address = utils::parseIpv4(ctrl["ip"].get<std::string>());
    }
    if (!readOptionalPort(ctrl, "of_listen_port", AppConfig::DEFAULT_OFP_PORT,
                          payload.controller.openflowPort) ||
        !readOptionalPort(ctrl, "rest_port", AppConfig::DEFAULT_REST_PORT,
                          payload.controller.restPort) ||
        !readOptionalPort(ctrl, "metrics_port", AppConfig::DEFAULT_METRICS_PORT,
                          payload.controller.metricsPort))
    {
        return std::nullopt;
    }

    if (j.contains("backends") && j["backends"].is_array())
    {
        payload.backends.assign(j["backends"].begin(), j["backends"].end());
    }

    return payload;
}

std::optional<DiscoveryPayload>
parseDiscoveryPayload(const std::string& body)
{
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded())
    {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Rejecting payload: body is not JSON");
        return std::nullopt;
    }
    return payloadFromJson(j);
}

json
payloadToJson(const DiscoveryPayload& payload)
{
    json ctrl = {{"of_listen_port", payload.controller.openflowPort},
                 {"rest_port", payload.controller.restPort},
                 {"metrics_port", payload.controller.metricsPort}};
    if (payload.controller.address)
    {
        ctrl["ip"] = payload.controller.address->to_string();
    }

    return json{{"controller", ctrl},
                {"vip",
                 {{"ip", payload.vip.address.to_string()},
                  {"port", payload.vip.port},
                  {"services", payload.vip.services}}},
                {"backends", payload.backends}};
}

} // namespace discovery
