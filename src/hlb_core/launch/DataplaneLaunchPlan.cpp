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
#include "hlb_core/launch/DataplaneLaunchPlan.hpp"
#include "setting/AppConfig.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>

DataplaneLaunchPlan
DataplaneLaunchPlan::fromDiscovery(const discovery::DiscoveryResult& result,
                                   const LaunchOverrides& overrides)
{
    DataplaneLaunchPlan plan;
    plan.controllerIp = result.controllerAddress;
    plan.controllerPort = overrides.controllerPort.value_or(AppConfig::DEFAULT_OFP_PORT);
    plan.vipIp = AppConfig::DEFAULT_VIP_IP;
    plan.httpPort = AppConfig::DEFAULT_HTTP_PORT;
    plan.verified = result.verified;

    if (result.payload)
    {
        plan.controllerPort = result.payload->controller.openflowPort;
        plan.vipIp = result.payload->vip.address.to_string();
        plan.httpPort = result.payload->vip.port;
    }
    if (overrides.vip)
    {
        plan.vipIp = *overrides.vip;
    }
    if (overrides.httpPort)
    {
        plan.httpPort = *overrides.httpPort;
    }
    return plan;
}

std::vector<std::string>
DataplaneLaunchPlan::command(const std::string& script, const std::vector<std::string>& extraArgs) const
{
    std::vector<std::string> argv;
    if (script.ends_with(".py"))
    {
        argv.emplace_back("python3");
    }
    argv.push_back(script);
    argv.insert(argv.end(),
                {"--controller-ip",
                 controllerIp,
                 "--controller-port",
                 std::to_string(controllerPort),
                 "--vip",
                 vipIp,
                 "--http-port",
                 std::to_string(httpPort)});
    argv.insert(argv.end(), extraArgs.begin(), extraArgs.end());
    return argv;
}

std::string
execCommand(const std::vector<std::string>& argv)
{
    if (argv.empty())
    {
        return "empty command";
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& arg : argv)
    {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    ::execvp(cargs[0], cargs.data());
    return std::strerror(errno);
}
