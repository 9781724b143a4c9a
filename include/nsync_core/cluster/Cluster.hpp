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

// nsync_core/cluster/Cluster.hpp
#pragma once

#include "nsync_core/cluster/ControllerEndpoint.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

class BackendClient;

using json = nlohmann::json;

/// Parameters shared by every controller of a cluster.
struct ClusterParameters
{
    std::string defaultTzUuid;
    std::optional<std::string> clusterUuid;
    std::optional<std::string> zoneId;
};

/**
 * @brief A named set of SDN controllers treated as one backend target.
 *
 * The first controller added becomes the primary endpoint; later ones are kept in order as
 * secondary failover endpoints. Scalar connection accessors (host(), port(), user(), ...)
 * report the primary endpoint and throw std::logic_error while no endpoint exists.
 *
 * A Cluster is built at startup (addController(), then bindClient()) and read-only afterwards.
 * bindClient() refuses a cluster without endpoints, so a cluster reachable through a
 * ClusterRegistry always has a primary endpoint and a client.
 */
class Cluster
{
  public:
    Cluster(std::string name, ClusterParameters parameters);

    /// Append a controller; the first one becomes the primary endpoint.
    void addController(ControllerEndpoint endpoint);

    /**
     * @brief Attach the client used for every backend call against this cluster.
     *
     * @throws InvalidClusterConfig if the cluster has no controller endpoint or client is null.
     */
    void bindClient(std::shared_ptr<BackendClient> client);

    const std::string& name() const
    {
        return m_name;
    }

    const ControllerEndpoint& primary() const;

    const std::vector<ControllerEndpoint>& secondaries() const
    {
        return m_secondaries;
    }

    /// Primary first, then secondaries in configuration order.
    std::vector<ControllerEndpoint> endpoints() const;

    bool hasEndpoints() const
    {
        return m_primary.has_value();
    }

    const std::string& host() const;
    uint16_t port() const;
    const std::string& user() const;
    const std::string& password() const;
    std::chrono::seconds requestTimeout() const;
    std::chrono::seconds httpTimeout() const;
    int retries() const;
    int redirects() const;

    const std::string& defaultTzUuid() const
    {
        return m_parameters.defaultTzUuid;
    }

    const std::optional<std::string>& uuid() const
    {
        return m_parameters.clusterUuid;
    }

    const std::optional<std::string>& zone() const
    {
        return m_parameters.zoneId;
    }

    /**
     * @brief Client bound to this cluster.
     *
     * @throws std::logic_error if bindClient() was never called.
     */
    BackendClient& client() const;

    /// Diagnostic description; passwords are masked.
    json describe() const;

  private:
    std::string m_name;
    ClusterParameters m_parameters;
    std::optional<ControllerEndpoint> m_primary;
    std::vector<ControllerEndpoint> m_secondaries;
    std::shared_ptr<BackendClient> m_client;
};
