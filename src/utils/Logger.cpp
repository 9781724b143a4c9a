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

#include "utils/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <vector>

std::shared_ptr<spdlog::logger> Logger::m_logger;
std::mutex Logger::m_mutex;

namespace
{
constexpr std::size_t MAX_LOG_FILE_SIZE = 10 * 1024 * 1024;
constexpr std::size_t MAX_LOG_FILES = 5;
const char* LOGGER_NAME = "netsync";
const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";
} // namespace

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
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc)
        {
            cfg.level = parse_level(argv[++i]);
        }
        else if (arg == "--log-file" && i + 1 < argc)
        {
            cfg.filePath = argv[++i];
        }
    }
    return cfg;
}

void
Logger::init(const LogConfig& cfg)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!cfg.filePath.empty())
    {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cfg.filePath,
                                                                               MAX_LOG_FILE_SIZE,
                                                                               MAX_LOG_FILES));
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(cfg.level);
    logger->flush_on(spdlog::level::warn);

    std::lock_guard<std::mutex> lock(m_mutex);
    m_logger = std::move(logger);
}

std::shared_ptr<spdlog::logger>
Logger::instance()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_logger)
    {
        m_logger = std::make_shared<spdlog::logger>(
            LOGGER_NAME,
            std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        m_logger->set_pattern(LOG_PATTERN);
        m_logger->set_level(spdlog::level::info);
    }
    return m_logger;
}
