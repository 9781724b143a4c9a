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

#include "nsync_core/cluster/ClusterRegistry.hpp"
#include "common_types/Errors.hpp"
#include "nsync_core/backend/BackendClient.hpp"
#include "utils/Logger.hpp"
#include <mutex>
#include <stdexcept>

std::unique_ptr<ClusterRegistry>
ClusterRegistry::build(const SyncConfig& config, const ClientFactory& clientFactory)
{
    if (config.clusters.empty())
    {
        throw InvalidClusterConfig("<global>", "no cluster configured");
    }

    auto registry = std::make_unique<ClusterRegistry>(BuildKey{});

    for (const auto& options : config.clusters)
    {
        if (registry->m_clustersByName.count(options.name))
        {
            throw InvalidClusterConfig(options.name, "duplicate cluster name");
        }

        auto cluster = std::make_shared<Cluster>(
            options.name,
            ClusterParameters{options.defaultTzUuid, options.clusterUuid, options.zoneId});

        for (const auto& connection : options.controllerConnections)
        {
            try
            {
                cluster->addController(
                    parseControllerConnection(connection, options.endpointDefaults));
            }
            catch (const std::invalid_argument& e)
            {
                SPDLOG_LOGGER_ERROR(Logger::instance(),
                                    "Invalid connection parameters for controller {} in "
                                    "cluster {}: {}",
                                    connection,
                                    options.name,
                                    e.what());
                throw InvalidClusterConfig(options.name, e.what());
            }
        }

        // Client factories read the primary endpoint, check before calling one.
        if (!cluster->hasEndpoints())
        {
            throw InvalidClusterConfig(options.name, "no controller endpoint configured");
        }
        cluster->bindClient(clientFactory(*cluster));

        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Cluster options: {}", cluster->describe().dump());
        registry->m_clustersByName.emplace(options.name, cluster);
        registry->m_clusters.push_back(std::move(cluster));
    }

    const auto& defaultName = config.sync.defaultClusterName;
    if (defaultName && registry->m_clustersByName.count(*defaultName))
    {
        registry->m_defaultCluster = registry->m_clustersByName.at(*defaultName);
    }
    else
    {
        registry->m_defaultCluster = registry->m_clusters.front();
        if (!defaultName)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Default cluster name not specified. Using first cluster: {}",
                               registry->m_defaultCluster->name());
        }
        else
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Default cluster name {} not found. Using first cluster: {}",
                               *defaultName,
                               registry->m_defaultCluster->name());
        }
    }

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Cluster registry ready: {} cluster(s), default {}",
                       registry->m_clusters.size(),
                       registry->m_defaultCluster->name());
    return registry;
}

Cluster&
ClusterRegistry::resolve(const std::optional<std::string>& zoneId) const
{
    if (!zoneId)
    {
        return *m_defaultCluster;
    }

    {
        std::shared_lock lock(m_zoneCacheMutex);
        auto it = m_zoneCache.find(*zoneId);
        if (it != m_zoneCache.end())
        {
            return *it->second;
        }
    }

    SPDLOG_LOGGER_DEBUG(Logger::instance(), "Looking for zone: {}", *zoneId);
    for (const auto& cluster : m_clusters)
    {
        if (cluster->zone() && *cluster->zone() == *zoneId)
        {
            std::unique_lock lock(m_zoneCacheMutex);
            m_zoneCache.emplace(*zoneId, cluster);
            return *cluster;
        }
    }

    SPDLOG_LOGGER_ERROR(Logger::instance(),
                        "Unable to find cluster config entry for zone: {}",
                        *zoneId);
    throw UnknownZone(*zoneId);
}

Cluster*
ClusterRegistry::find(const std::string& name) const
{
    auto it = m_clustersByName.find(name);
    return it == m_clustersByName.end() ? nullptr : it->second.get();
}
