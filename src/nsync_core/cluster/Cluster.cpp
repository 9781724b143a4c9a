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

#include "nsync_core/cluster/Cluster.hpp"
#include "common_types/Errors.hpp"
#include "nsync_core/backend/BackendClient.hpp"
#include <stdexcept>
#include <utility>

Cluster::Cluster(std::string name, ClusterParameters parameters)
    : m_name(std::move(name)),
      m_parameters(std::move(parameters))
{
}

void
Cluster::addController(ControllerEndpoint endpoint)
{
    if (!m_primary)
    {
        m_primary = std::move(endpoint);
    }
    else
    {
        m_secondaries.push_back(std::move(endpoint));
    }
}

void
Cluster::bindClient(std::shared_ptr<BackendClient> client)
{
    if (!m_primary)
    {
        throw InvalidClusterConfig(m_name, "no controller endpoint configured");
    }
    if (!client)
    {
        throw InvalidClusterConfig(m_name, "no backend client available");
    }
    m_client = std::move(client);
}

const ControllerEndpoint&
Cluster::primary() const
{
    if (!m_primary)
    {
        throw std::logic_error("cluster " + m_name + " has no controller endpoint");
    }
    return *m_primary;
}

std::vector<ControllerEndpoint>
Cluster::endpoints() const
{
    std::vector<ControllerEndpoint> all;
    if (m_primary)
    {
        all.push_back(*m_primary);
    }
    all.insert(all.end(), m_secondaries.begin(), m_secondaries.end());
    return all;
}

const std::string&
Cluster::host() const
{
    return primary().host;
}

uint16_t
Cluster::port() const
{
    return primary().port;
}

const std::string&
Cluster::user() const
{
    return primary().user;
}

const std::string&
Cluster::password() const
{
    return primary().password;
}

std::chrono::seconds
Cluster::requestTimeout() const
{
    return primary().requestTimeout;
}

std::chrono::seconds
Cluster::httpTimeout() const
{
    return primary().httpTimeout;
}

int
Cluster::retries() const
{
    return primary().retries;
}

int
Cluster::redirects() const
{
    return primary().redirects;
}

BackendClient&
Cluster::client() const
{
    if (!m_client)
    {
        throw std::logic_error("cluster " + m_name + " has no bound backend client");
    }
    return *m_client;
}

json
Cluster::describe() const
{
    json controllers = json::array();
    for (const auto& endpoint : endpoints())
    {
        controllers.push_back({{"address", endpoint.address()},
                               {"user", endpoint.user},
                               {"password", "***"},
                               {"request_timeout", endpoint.requestTimeout.count()},
                               {"http_timeout", endpoint.httpTimeout.count()},
                               {"retries", endpoint.retries},
                               {"redirects", endpoint.redirects}});
    }

    json j{{"name", m_name},
           {"default_tz_uuid", m_parameters.defaultTzUuid},
           {"controllers", controllers}};
    if (m_parameters.clusterUuid)
    {
        j["cluster_uuid"] = *m_parameters.clusterUuid;
    }
    if (m_parameters.zoneId)
    {
        j["zone_id"] = *m_parameters.zoneId;
    }
    return j;
}
