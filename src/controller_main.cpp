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
#include "hlb_core/discovery/ControllerAdvertisement.hpp"
#include "hlb_core/discovery/PayloadCodec.hpp"
#include "hlb_core/http/DiscoveryServer.hpp"
#include "setting/AppConfig.hpp"
#include "spdlog/spdlog.h"
#include "utils/Logger.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> gShutdownRequested{false};

void
handleSignal(int)
{
    gShutdownRequested.store(true);
}

int
main(int argc, char* argv[])
{
    auto logCfg = Logger::parse_cli_args(argc, argv);
    Logger::init(logCfg);

    ControllerConfig cfg;
    try
    {
        cfg = ConfigLoader::parseControllerArgs(argc, argv);
    }
    catch (const std::invalid_argument& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "{}", e.what());
        std::cerr << ConfigLoader::controllerUsage();
        return 2;
    }
    if (cfg.showHelp)
    {
        std::cout << ConfigLoader::controllerUsage();
        return 0;
    }

    const std::string advertiseIp = discovery::selectAdvertiseAddress(cfg);

    json payload;
    try
    {
        payload = discovery::payloadToJson(discovery::makeControllerPayload(cfg, advertiseIp));
    }
    catch (const std::invalid_argument& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Cannot build discovery payload: {}", e.what());
        return 2;
    }

    auto state = std::make_shared<DiscoveryEndpointState>();
    state->payloadSource = [payload]() { return payload; };
    state->advertiseIp = advertiseIp;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    net::io_context ioc;
    DiscoveryServer server(ioc, cfg.bindAddress, cfg.restPort, state);
    try
    {
        server.start();
    }
    catch (const boost::system::system_error& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(),
                               "Cannot listen on {}:{}: {}",
                               cfg.bindAddress,
                               cfg.restPort,
                               e.what());
        return 1;
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "Controller endpoints:");
    SPDLOG_LOGGER_INFO(Logger::instance(), "  OpenFlow: tcp://{}:{}", advertiseIp, cfg.openflowPort);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "  REST API: http://{}:{}{}",
                       advertiseIp,
                       server.port(),
                       AppConfig::STATUS_PATH);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "  Discover: http://{}:{}{}",
                       advertiseIp,
                       server.port(),
                       AppConfig::DISCOVER_PATH);
    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "  Metrics:  http://{}:{}/metrics",
                       advertiseIp,
                       cfg.metricsPort);
    SPDLOG_LOGGER_INFO(Logger::instance(), "  VIP:      {}:{}", cfg.vipIp, cfg.vipPort);

    while (!gShutdownRequested.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Shutdown requested. Cleaning up...");

    server.stop();

    SPDLOG_LOGGER_INFO(Logger::instance(), "Discovery endpoint stopped. Exiting.");
    return 0;
}
