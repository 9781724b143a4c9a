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

// nsync_core/cluster/ClusterRegistry.hpp
#pragma once

#include "nsync_core/cluster/Cluster.hpp"
#include "nsync_core/config/SyncConfig.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief All configured controller clusters, and the rule that picks one for a resource.
 *
 * Built once by build(); afterwards only the zone -> cluster cache changes. Zone assignment
 * is static for the process lifetime, so cached entries are never invalidated.
 *
 * Resolution rules:
 *  - explicit zone: cached cluster, else the first cluster whose zone matches (then cached),
 *    else UnknownZone;
 *  - no zone: the default cluster.
 *
 * The default cluster is the configured default_cluster_name when it names a cluster,
 * otherwise the first cluster in configuration order (logged at warning level).
 */
class ClusterRegistry
{
    /// Only build() can name this, so only build() can construct a registry.
    struct BuildKey
    {
        explicit BuildKey() = default;
    };

  public:
    /// Creates the backend client for a fully populated cluster.
    using ClientFactory = std::function<std::shared_ptr<BackendClient>(const Cluster&)>;

    /**
     * @brief Build the registry from configuration.
     *
     * Every controller connection of every cluster is parsed, then a client is bound to each
     * cluster. Any failure aborts the whole build.
     *
     * @throws InvalidClusterConfig on an empty cluster list, duplicate names, a malformed
     *         connection string, or a cluster without controllers.
     */
    static std::unique_ptr<ClusterRegistry> build(const SyncConfig& config,
                                                  const ClientFactory& clientFactory);

    explicit ClusterRegistry(BuildKey) {}

    ClusterRegistry(const ClusterRegistry&) = delete;
    ClusterRegistry& operator=(const ClusterRegistry&) = delete;

    /**
     * @brief Cluster where a resource carrying @p zoneId should be configured.
     *
     * @throws UnknownZone if @p zoneId is set and no cluster serves it.
     */
    Cluster& resolve(const std::optional<std::string>& zoneId) const;

    Cluster& defaultCluster() const
    {
        return *m_defaultCluster;
    }

    /// @return nullptr when no cluster has this name.
    Cluster* find(const std::string& name) const;

    /// All clusters in configuration order.
    const std::vector<std::shared_ptr<Cluster>>& clusters() const
    {
        return m_clusters;
    }

  private:
    std::vector<std::shared_ptr<Cluster>> m_clusters;
    std::unordered_map<std::string, std::shared_ptr<Cluster>> m_clustersByName;
    std::shared_ptr<Cluster> m_defaultCluster;

    mutable std::shared_mutex m_zoneCacheMutex;
    mutable std::unordered_map<std::string, std::shared_ptr<Cluster>> m_zoneCache;
};
