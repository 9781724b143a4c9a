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
 */

/*
 * spdlog Log Levels:
 *   trace     - Very detailed logs, typically only of interest when diagnosing problems.
 *   debug     - Debugging information, helpful during development.
 *   info      - Informational messages that highlight the progress of the application.
 *   warn      - Potentially harmful situations which still allow the application to continue
 * running. Drift between the local store and a controller is reported at this level.
 *   err       - Error events that might still allow the application to continue running.
 *   critical  - Serious errors that lead the application to abort.
 *   off       - Disables logging.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Runtime logging configuration options for the global logger.
 *
 * filePath enables an additional rotating file sink when non-empty.
 * level selects the minimum log severity that will be emitted.
 */
struct LogConfig
{
    std::string filePath;
    spdlog::level::level_enum level = spdlog::level::info;
};

/**
 * @brief Centralized spdlog wrapper providing a process-wide logger instance.
 *
 * Responsibilities:
 *  - Parse log level names (e.g., "info", "debug") into spdlog enums.
 *  - Parse CLI arguments (--log-level, --log-file) into LogConfig.
 *  - Initialize spdlog sinks/formatters and set the global log level.
 *  - Provide access to the initialized logger.
 *
 * Usage:
 *  - Call Logger::init(cfg) once at program startup.
 *  - Use Logger::instance() anywhere to log via SPDLOG_LOGGER_* macros.
 *
 * Threading:
 *  - spdlog is thread-safe; Logger::instance() returns a shared logger.
 *  - When init() was never called, instance() lazily creates a console-only logger so that
 *    library code and tests can log without explicit setup.
 */
class Logger
{
  public:
    /**
     * @brief Convert a textual log level into a spdlog level enum.
     *
     * @param name Log level name ("trace", "debug", "info", "warn", "err", "critical", "off").
     * @return Corresponding spdlog level. Unknown values default to info.
     */
    static spdlog::level::level_enum parse_level(const std::string& name);
    /**
     * @brief Parse command-line arguments into LogConfig.
     *
     * Recognizes "--log-level <name>" and "--log-file <path>"; other arguments are ignored.
     */
    static LogConfig parse_cli_args(int argc, char* argv[]);
    /**
     * @brief Initialize the global logger instance.
     *
     * Creates a colored console sink and, when cfg.filePath is set, a rotating file sink.
     * Calling init() again replaces the previous logger.
     */
    static void init(const LogConfig& cfg);
    /**
     * @brief Access the global logger instance.
     *
     * @return Shared pointer to the spdlog logger.
     */
    static std::shared_ptr<spdlog::logger> instance();

  private:
    static std::shared_ptr<spdlog::logger> m_logger;
    static std::mutex m_mutex;
};
