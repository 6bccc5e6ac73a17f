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

/*
 * spdlog Log Levels:
 *   trace     - Per-host probe outcomes.
 *   debug     - Discovery fetch misses and payload rejections.
 *   info      - Discovery state transitions and startup summary.
 *   warn      - Recoverable problems (interface enumeration, config file, override miss).
 *   err       - Discovery exhausted, server I/O errors.
 *   critical  - Serious errors that lead the application to abort.
 *   off       - Disables logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

/**
 * @brief Runtime logging configuration options for the global logger.
 *
 * enableFile controls whether logs are also written to a file sink (filePath).
 * level selects the minimum log severity that will be emitted.
 */
struct LogConfig
{
    bool enableFile = false;
    std::string filePath = "hlb.log";
    spdlog::level::level_enum level = spdlog::level::info;
};

/**
 * @brief Centralized spdlog wrapper providing a process-wide logger instance.
 *
 * Usage:
 *  - Call Logger::init(cfg) once at program startup.
 *  - Use Logger::instance() anywhere to log via SPDLOG_LOGGER_* macros.
 *
 * Threading:
 *  - spdlog is thread-safe; Logger::instance() returns a shared logger.
 *  - init() should be called once during startup before concurrent logging.
 *    Before init(), instance() hands out spdlog's default console logger.
 */
class Logger
{
  public:
    /**
     * @brief Convert a textual log level into a spdlog level enum.
     *
     * @param name Log level name (e.g., "trace", "debug", "info", "warn", "err", "critical",
     * "off").
     * @return Corresponding spdlog level. Unknown values default to info.
     */
    static spdlog::level::level_enum parse_level(const std::string& name);
    /**
     * @brief Parse --log-level and --log-file from the command line into LogConfig.
     *
     * Other arguments are left for the caller's own option parsing.
     */
    static LogConfig parse_cli_args(int argc, char* argv[]);
    /**
     * @brief Initialize the global logger instance.
     *
     * Creates a console sink and, if enabled, a file sink; sets pattern and level.
     */
    static void init(const LogConfig& cfg);
    /**
     * @brief Access the global logger instance.
     */
    static std::shared_ptr<spdlog::logger> instance();

  private:
    static std::shared_ptr<spdlog::logger> m_logger;
};
