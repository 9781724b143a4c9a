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

// tests/TestSupport.hpp
#pragma once

#include "FakeBackendClient.hpp"
#include "nsync_core/cluster/ClusterRegistry.hpp"
#include "nsync_core/config/SyncConfig.hpp"
#include "nsync_core/policy/PolicyEnforcer.hpp"
#include "nsync_core/reconciliation/ReconciliationEngine.hpp"
#include "nsync_core/store/InMemoryRecordStore.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <map>
#include <memory>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <string>
#include <vector>

namespace test_support
{

/// Captures what Logger::instance() emits while in scope.
class LogCapture
{
  public:
    LogCapture()
        : m_sink(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(512))
    {
        m_sink->set_pattern("[%l] %v");
        Logger::instance()->sinks().push_back(m_sink);
    }

    ~LogCapture()
    {
        auto& sinks = Logger::instance()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), m_sink), sinks.end());
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    /// Number of captured lines containing @p text.
    std::size_t count(const std::string& text) const
    {
        auto lines = m_sink->last_formatted();
        return static_cast<std::size_t>(
            std::count_if(lines.begin(), lines.end(), [&text](const std::string& line) {
                return line.find(text) != std::string::npos;
            }));
    }

    bool contains(const std::string& text) const
    {
        return count(text) > 0;
    }

  private:
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> m_sink;
};

inline ClusterOptions
clusterOptions(const std::string& name, const std::optional<std::string>& zone)
{
    ClusterOptions options;
    options.name = name;
    options.defaultTzUuid = "tz-" + name;
    options.clusterUuid = "cluster-uuid-" + name;
    options.zoneId = zone;
    options.controllerConnections = {"192.0.2.10:443:admin:secret:30:10:2:2",
                                     "192.0.2.11:443:admin:secret:30:10:2:2"};
    return options;
}

/**
 * @brief Engine wired to one FakeBackendClient per cluster.
 *
 * Clusters are named c0, c1, ... and serve zones zone-c0, zone-c1, ...; c0 is the default.
 */
struct EngineFixture
{
    explicit EngineFixture(std::size_t clusterCount = 1, EngineOptions options = EngineOptions{})
        : admin{"admin-tenant", true},
          tenant{"tenant-a", false},
          otherTenant{"tenant-b", false}
    {
        SyncConfig config;
        config.sync.defaultClusterName = "c0";
        for (std::size_t i = 0; i < clusterCount; ++i)
        {
            const std::string name = "c" + std::to_string(i);
            config.clusters.push_back(clusterOptions(name, "zone-" + name));
        }
        registry = ClusterRegistry::build(config, [this](const Cluster& cluster) {
            auto client = std::make_shared<FakeBackendClient>();
            fakes[cluster.name()] = client;
            return client;
        });
        engine = std::make_unique<ReconciliationEngine>(*registry, store, policy, options);
    }

    FakeBackendClient& fake(const std::string& clusterName = "c0")
    {
        return *fakes.at(clusterName);
    }

    std::map<std::string, std::shared_ptr<FakeBackendClient>> fakes;
    std::unique_ptr<ClusterRegistry> registry;
    InMemoryRecordStore store;
    RolePolicyEnforcer policy;
    std::unique_ptr<ReconciliationEngine> engine;

    RequestContext admin;
    RequestContext tenant;
    RequestContext otherTenant;
};

inline NetworkCreateRequest
overlayNetwork(const std::string& name)
{
    NetworkCreateRequest request;
    request.name = name;
    return request;
}

inline NetworkCreateRequest
vlanNetwork(const std::string& name, const std::string& physnet, int segmentationId)
{
    NetworkCreateRequest request;
    request.name = name;
    request.networkType = "vlan";
    request.physicalNetwork = physnet;
    request.segmentationId = segmentationId;
    return request;
}

inline PortCreateRequest
portOn(const std::string& networkId, const std::string& name)
{
    PortCreateRequest request;
    request.networkId = networkId;
    request.name = name;
    request.deviceId = "vm-" + name;
    request.fixedIps = {FixedIp{"subnet-1", "10.0.0.10"}};
    return request;
}

} // namespace test_support
