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
#include "utils/Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <string_view>
#include <vector>

std::shared_ptr<spdlog::logger> Logger::m_logger = nullptr;

spdlog::level::level_enum
Logger::parse_level(const std::string& name)
{
    if (name == "trace")
    {
        return spdlog::level::trace;
    }
    if (name == "debug")
    {
        return spdlog::level::debug;
    }
    if (name == "info")
    {
        return spdlog::level::info;
    }
    if (name == "warn" || name == "warning")
    {
        return spdlog::level::warn;
    }
    if (name == "err" || name == "error")
    {
        return spdlog::level::err;
    }
    if (name == "critical")
    {
        return spdlog::level::critical;
    }
    if (name == "off")
    {
        return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogConfig
Logger::parse_cli_args(int argc, char* argv[])
{
    LogConfig cfg;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        if (arg == "--")
        {
            break;
        }
        if (arg == "--log-level" && i + 1 < argc)
        {
            cfg.level = parse_level(argv[++i]);
        }
        else if (arg.starts_with("--log-level="))
        {
            cfg.level = parse_level(std::string(arg.substr(12)));
        }
        else if (arg == "--log-file" && i + 1 < argc)
        {
            cfg.enableFile = true;
            cfg.filePath = argv[++i];
        }
        else if (arg.starts_with("--log-file="))
        {
            cfg.enableFile = true;
            cfg.filePath = std::string(arg.substr(11));
        }
    }
    return cfg;
}

void
Logger::init(const LogConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (cfg.enableFile)
    {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.filePath, true));
    }

    m_logger = std::make_shared<spdlog::logger>("hlb", sinks.begin(), sinks.end());
    m_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v");
    m_logger->set_level(cfg.level);
    m_logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(m_logger);
}

std::shared_ptr<spdlog::logger>
Logger::instance()
{
    if (!m_logger)
    {
        return spdlog::default_logger();
    }
    return m_logger;
}
