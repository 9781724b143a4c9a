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
#include "common_types/Errors.hpp"
#include "nsync_core/backend/HttpBackendClient.hpp"
#include "nsync_core/cluster/ClusterRegistry.hpp"
#include "nsync_core/config/SyncConfig.hpp"
#include "nsync_core/policy/PolicyEnforcer.hpp"
#include "nsync_core/reconciliation/DriftAuditor.hpp"
#include "nsync_core/reconciliation/ReconciliationEngine.hpp"
#include "nsync_core/store/InMemoryRecordStore.hpp"
#include "setting/AppConfig.hpp"
#include "spdlog/spdlog.h"
#include "utils/Logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> gShutdownRequested{false};

void
handleSigint(int)
{
    gShutdownRequested.store(true);
}

std::string
parseConfigPath(int argc, char* argv[])
{
    std::string path = AppConfig::CONFIG_FILE;
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            path = argv[i + 1];
        }
    }
    return path;
}

int
main(int argc, char* argv[])
{
    auto cfg = Logger::parse_cli_args(argc, argv);
    Logger::init(cfg);

    std::signal(SIGINT, handleSigint);
    std::signal(SIGTERM, handleSigint);

    const std::string configPath = parseConfigPath(argc, argv);
    SPDLOG_LOGGER_INFO(Logger::instance(), "Loading configuration from {}", configPath);

    std::unique_ptr<ClusterRegistry> registry;
    std::unique_ptr<RolePolicyEnforcer> policy;
    SyncConfig config;
    try
    {
        config = loadSyncConfig(configPath);

        HttpClientOptions clientOptions;
        clientOptions.useHttps = config.sync.useHttps;
        clientOptions.concurrentConnections = config.sync.concurrentConnections;
        registry = ClusterRegistry::build(config, [&clientOptions](const Cluster& cluster) {
            return std::make_shared<HttpBackendClient>(cluster.endpoints(), clientOptions);
        });

        policy = std::make_unique<RolePolicyEnforcer>(config.policy);
    }
    catch (const NetSyncError& e)
    {
        SPDLOG_LOGGER_CRITICAL(Logger::instance(), "Startup failed: {}", e.what());
        return 1;
    }

    auto store = std::make_unique<InMemoryRecordStore>();
    auto engine = std::make_unique<ReconciliationEngine>(*registry,
                                                         *store,
                                                         *policy,
                                                         EngineOptions::fromSyncOptions(config.sync));

    std::unique_ptr<DriftAuditor> auditor;
    if (config.sync.auditIntervalSeconds > 0)
    {
        auditor = std::make_unique<DriftAuditor>(
            *engine, std::chrono::seconds(config.sync.auditIntervalSeconds));
        auditor->start();
    }
    else
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "Periodic consistency audit disabled");
    }

    while (!gShutdownRequested.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Shutdown requested. Cleaning up...");

    if (auditor)
    {
        auditor->stop();
    }

    SPDLOG_LOGGER_INFO(Logger::instance(), "All subsystems stopped. Exiting.");
    return 0;
}
