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

// nsync_core/backend/ControllerApi.hpp
#pragma once

#include "common_types/BackendTypes.hpp"
#include "common_types/NetworkTypes.hpp"
#include "nsync_core/backend/BackendClient.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class Cluster;

/**
 * @brief Logical switch and logical port operations expressed as controller resource calls.
 *
 * Every function goes through the BackendClient bound to the given cluster and lets its
 * BackendError / ResourceNotFound propagate. Collection reads page through all results
 * client-side and de-duplicate them by uuid.
 */
namespace controller_api
{

inline const std::string SWITCH_COLLECTION = "/ws.v1/lswitch";
inline const std::string ANY_SWITCH = "*";
inline const std::string VIF_ATTACHMENT = "VifAttachment";

std::string switchPath(const std::string& switchUuid);
std::string portCollectionPath(const std::string& switchUuid);
std::string portPath(const std::string& switchUuid, const std::string& portUuid);

/**
 * @brief Run @p request page by page until the controller stops returning a cursor.
 *
 * Results are returned in controller order with duplicate uuids (re-delivered across page
 * boundaries) dropped. A repeated cursor ends the scan with a warning.
 */
std::vector<json> queryAllPages(BackendClient& client, const QueryRequest& request);

/**
 * @brief Create a logical switch.
 *
 * @param networkId When set, the switch is a fragment of that network and is tagged with it.
 */
BackendSwitch createSwitch(const Cluster& cluster,
                           const std::string& tenantId,
                           const std::string& displayName,
                           const std::optional<ProviderBinding>& binding,
                           const std::optional<std::string>& networkId = std::nullopt);

/**
 * @brief Every switch backing a network: the primary (uuid == networkId) first, then the
 *        fragments tagged with the network id when the primary is tagged multi-switch.
 *
 * @throws ResourceNotFound if the primary switch does not exist on this cluster.
 */
std::vector<BackendSwitch> getSwitches(const Cluster& cluster, const std::string& networkId);

/// Replace display name and tags of a switch; the tenant tag is always kept.
void updateSwitch(const Cluster& cluster,
                  const BackendSwitch& lswitch,
                  const std::string& tenantId,
                  const std::vector<Tag>& extraTags);

/// Delete switches one by one; the first failure propagates.
void deleteSwitches(const Cluster& cluster, const std::vector<std::string>& switchUuids);

/**
 * @brief All switches of the cluster, optionally restricted to some tenants.
 *
 * An empty @p tenantIds means every tenant.
 */
std::vector<BackendSwitch> querySwitches(const Cluster& cluster,
                                         const std::vector<std::string>& tenantIds);

/**
 * @brief Create the backend port of a local port on a switch.
 *
 * The port is tagged with the tenant, the network id, the local port id (join key) and the
 * SHA-1 digest of the device id. With port security enabled, the MAC/IP pairs of its fixed
 * IPs become its only allowed address pairs.
 */
BackendPort createPort(const Cluster& cluster,
                       const std::string& switchUuid,
                       const LogicalPort& port,
                       bool portSecurityEnabled);

/// Attach an interface of @p attachmentType with id @p attachmentId to a backend port.
void plugInterface(const Cluster& cluster,
                   const std::string& switchUuid,
                   const std::string& portUuid,
                   const std::string& attachmentType,
                   const std::string& attachmentId);

void updatePort(const Cluster& cluster,
                const BackendPort& backendPort,
                const LogicalPort& port,
                bool portSecurityEnabled);

ResourceStatus getPortStatus(const Cluster& cluster,
                             const std::string& switchUuid,
                             const std::string& portUuid);

void deletePort(const Cluster& cluster, const BackendPort& backendPort);

/**
 * @brief Tag filters of a port query; empty vectors mean no constraint.
 *
 * Ports are always looked up under every switch and narrowed by their network tag, so ports
 * placed on fragment switches are found as well.
 */
struct PortQuery
{
    std::vector<std::string> networkIds;
    std::vector<std::string> deviceIds; // raw ids, hashed before querying
    std::vector<std::string> tenantIds;
    std::optional<std::string> portId;
};

/// Ports carrying the logical-port-id join tag and matching @p query.
std::vector<BackendPort> queryPorts(const Cluster& cluster, const PortQuery& query);

/**
 * @brief Locate the backend port tagged with @p portId, scanning @p clusters in order.
 *
 * @param networkId Logical network the port belongs to, std::nullopt for any network.
 * @return The first match and its cluster, std::nullopt when no cluster has the port.
 */
std::optional<std::pair<BackendPort, std::shared_ptr<Cluster>>>
findPortByTag(const std::vector<std::shared_ptr<Cluster>>& clusters,
              const std::optional<std::string>& networkId,
              const std::string& portId);

} // namespace controller_api
