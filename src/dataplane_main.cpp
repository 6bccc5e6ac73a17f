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
#include "hlb_core/config/ConfigLoader.hpp"
#include "hlb_core/discovery/DiscoveryErrors.hpp"
#include "hlb_core/discovery/DiscoveryOrchestrator.hpp"
#include "hlb_core/launch/DataplaneLaunchPlan.hpp"
#include "spdlog/spdlog.h"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

namespace
{
enum ExitCode
{
    EXIT_OK = 0,
    EXIT_UNEXPECTED = 1,
    EXIT_BAD_ARGUMENTS = 2,
    EXIT_DISCOVERY_FAILED = 3,
    EXIT_RESOURCE_FAILURE = 4
};
} // namespace

int
main(int argc, char* argv[])
{
    auto logCfg = Logger::parse_cli_args(argc, argv);
    Logger::init(logCfg);

    DataplaneOptions opts;
    try
    {
        opts = ConfigLoader::parseDataplaneArgs(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "{}", e.what());
        std::cerr << ConfigLoader::dataplaneUsage();
        return EXIT_BAD_ARGUMENTS;
    }
    if (opts.showHelp)
    {
        std::cout << ConfigLoader::dataplaneUsage();
        return EXIT_OK;
    }

    discovery::DiscoveryResult result;
    try
    {
        discovery::DiscoveryOrchestrator orchestrator(opts.discovery);
        result = orchestrator.run();
    }
    catch (const discovery::DiscoveryResourceError& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "{}", e.what());
        return EXIT_RESOURCE_FAILURE;
    }
    catch (const discovery::DiscoveryError& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_DISCOVERY_FAILED;
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "Unexpected discovery failure: {}", e.what());
        return EXIT_UNEXPECTED;
    }

    auto plan = DataplaneLaunchPlan::fromDiscovery(result, opts.launch);

    SPDLOG_LOGGER_INFO(Logger::instance(), "Using controller:");
    SPDLOG_LOGGER_INFO(Logger::instance(), "  OpenFlow: {}:{}", plan.controllerIp, plan.controllerPort);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "  REST:     http://{}:{}{}{}",
                       result.host,
                       opts.discovery.discoveryPort,
                       opts.discovery.discoveryPath,
                       plan.verified ? "" : " (unverified)");
    SPDLOG_LOGGER_INFO(Logger::instance(), "  VIP:      {}:{}", plan.vipIp, plan.httpPort);

    if (opts.topologyScript.empty())
    {
        json summary = {{"controller_ip", plan.controllerIp},
                        {"controller_port", plan.controllerPort},
                        {"vip", plan.vipIp},
                        {"http_port", plan.httpPort},
                        {"verified", plan.verified},
                        {"scanned", result.attemptedNetworks}};
        std::cout << summary.dump() << std::endl;
        return EXIT_OK;
    }

    auto command = plan.command(opts.topologyScript, opts.passThroughArgs);
    SPDLOG_LOGGER_INFO(Logger::instance(), "Starting topology: {}", utils::join(command, " "));
    Logger::instance()->flush();

    auto error = execCommand(command);
    SPDLOG_LOGGER_ERROR(Logger::instance(), "Cannot start {}: {}", command.front(), error);
    return EXIT_UNEXPECTED;
}
