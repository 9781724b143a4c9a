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

#include "nsync_core/backend/ControllerApi.hpp"
#include "common_types/Errors.hpp"
#include "nsync_core/cluster/Cluster.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <algorithm>
#include <unordered_set>

namespace
{
const std::string SWITCH_STATUS_RELATION = "LogicalSwitchStatus";
const std::string PORT_STATUS_RELATION = "LogicalPortStatus";

std::string
transportType(const std::optional<ProviderBinding>& binding)
{
    if (!binding)
    {
        return "stt";
    }
    switch (binding->networkType)
    {
    case NetworkType::FLAT:
    case NetworkType::VLAN:
        return "bridge";
    case NetworkType::GRE:
        return "gre";
    case NetworkType::STT:
        return "stt";
    }
    return "stt";
}

/// Decode a controller document, reporting a malformed one as a BackendError.
template <typename T>
T
decodeDocument(const json& document, const std::string& kind)
{
    try
    {
        return document.get<T>();
    }
    catch (const json::exception& e)
    {
        throw BackendError("Malformed " + kind + " document from controller: " + e.what());
    }
}

json
tagsToJson(const std::vector<Tag>& tags)
{
    json j = json::array();
    for (const auto& tag : tags)
    {
        j.push_back(tag);
    }
    return j;
}

json
buildPortDocument(const LogicalPort& port, bool portSecurityEnabled)
{
    std::vector<Tag> tags{{tag_scope::TENANT_ID, port.tenantId},
                          {tag_scope::LOGICAL_NETWORK_ID, port.networkId},
                          {tag_scope::LOGICAL_PORT_ID, port.id}};
    if (!port.deviceId.empty())
    {
        tags.push_back({tag_scope::DEVICE_ID, utils::sha1Hex(port.deviceId)});
    }

    json allowedPairs = json::array();
    if (portSecurityEnabled)
    {
        for (const auto& fixedIp : port.fixedIps)
        {
            allowedPairs.push_back(
                {{"mac_address", port.macAddress}, {"ip_address", fixedIp.ipAddress}});
        }
    }

    return json{{"display_name", utils::truncateDisplayName(port.name)},
                {"admin_status_enabled", port.adminStateUp},
                {"port_security_enabled", portSecurityEnabled},
                {"allowed_address_pairs", allowedPairs},
                {"tags", tagsToJson(tags)}};
}

void
appendTagFilters(std::vector<TagFilter>& filters,
                 const std::string& scope,
                 const std::vector<std::string>& values)
{
    for (const auto& value : values)
    {
        filters.push_back({scope, value});
    }
}
} // namespace

namespace controller_api
{

std::string
switchPath(const std::string& switchUuid)
{
    return SWITCH_COLLECTION + "/" + switchUuid;
}

std::string
portCollectionPath(const std::string& switchUuid)
{
    return switchPath(switchUuid) + "/lport";
}

std::string
portPath(const std::string& switchUuid, const std::string& portUuid)
{
    return portCollectionPath(switchUuid) + "/" + portUuid;
}

std::vector<json>
queryAllPages(BackendClient& client, const QueryRequest& request)
{
    std::vector<json> results;
    std::unordered_set<std::string> seenUuids;
    std::unordered_set<std::string> seenCursors;
    std::optional<std::string> cursor;

    while (true)
    {
        QueryPage page = client.query(request, cursor);
        for (auto& item : page.results)
        {
            const std::string uuid =
                item.is_object() && item.contains("uuid") && item["uuid"].is_string()
                    ? item["uuid"].get<std::string>()
                    : std::string();
            if (!uuid.empty() && !seenUuids.insert(uuid).second)
            {
                continue;
            }
            results.push_back(std::move(item));
        }

        if (!page.nextCursor || page.nextCursor->empty())
        {
            break;
        }
        if (!seenCursors.insert(*page.nextCursor).second)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Controller returned page cursor {} twice for {}; stopping scan",
                               *page.nextCursor,
                               request.path);
            break;
        }
        cursor = page.nextCursor;
    }
    return results;
}

BackendSwitch
createSwitch(const Cluster& cluster,
             const std::string& tenantId,
             const std::string& displayName,
             const std::optional<ProviderBinding>& binding,
             const std::optional<std::string>& networkId)
{
    std::vector<Tag> tags{{tag_scope::TENANT_ID, tenantId}};
    if (networkId)
    {
        tags.push_back({tag_scope::LOGICAL_NETWORK_ID, *networkId});
    }

    json transportZone{{"zone_uuid",
                        binding && binding->physicalNetwork ? *binding->physicalNetwork
                                                            : cluster.defaultTzUuid()},
                       {"transport_type", transportType(binding)}};
    if (binding && binding->networkType == NetworkType::VLAN && binding->segmentationId)
    {
        transportZone["binding_config"] = {
            {"vlan_translation", json::array({{{"transport", *binding->segmentationId}}})}};
    }

    json document{{"display_name", utils::truncateDisplayName(displayName)},
                  {"transport_zones", json::array({transportZone})},
                  {"tags", tagsToJson(tags)}};

    BackendSwitch lswitch = decodeDocument<BackendSwitch>(
        cluster.client().create(SWITCH_COLLECTION, document), "logical switch");
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Created logical switch {} ({}) on cluster {}",
                        lswitch.uuid,
                        displayName,
                        cluster.name());
    return lswitch;
}

std::vector<BackendSwitch>
getSwitches(const Cluster& cluster, const std::string& networkId)
{
    std::vector<BackendSwitch> switches;
    switches.push_back(decodeDocument<BackendSwitch>(
        cluster.client().read(switchPath(networkId), {SWITCH_STATUS_RELATION}), "logical switch"));

    if (!findTag(switches.front().tags, tag_scope::MULTI_SWITCH))
    {
        return switches;
    }

    QueryRequest request{SWITCH_COLLECTION,
                         {"uuid", "display_name", "tags", "lport_count"},
                         {SWITCH_STATUS_RELATION},
                         {{tag_scope::LOGICAL_NETWORK_ID, networkId}}};
    for (const auto& item : queryAllPages(cluster.client(), request))
    {
        auto fragment = decodeDocument<BackendSwitch>(item, "logical switch");
        if (fragment.uuid != networkId)
        {
            switches.push_back(std::move(fragment));
        }
    }
    return switches;
}

void
updateSwitch(const Cluster& cluster,
             const BackendSwitch& lswitch,
             const std::string& tenantId,
             const std::vector<Tag>& extraTags)
{
    std::vector<Tag> tags;
    for (const auto& tag : lswitch.tags)
    {
        bool replaced = tag.scope == tag_scope::TENANT_ID ||
                        std::any_of(extraTags.begin(), extraTags.end(), [&tag](const Tag& extra) {
                            return extra.scope == tag.scope;
                        });
        if (!replaced)
        {
            tags.push_back(tag);
        }
    }
    tags.push_back({tag_scope::TENANT_ID, tenantId});
    tags.insert(tags.end(), extraTags.begin(), extraTags.end());

    json document{{"display_name", utils::truncateDisplayName(lswitch.displayName)},
                  {"tags", tagsToJson(tags)}};
    cluster.client().update(switchPath(lswitch.uuid), document);
}

void
deleteSwitches(const Cluster& cluster, const std::vector<std::string>& switchUuids)
{
    for (const auto& uuid : switchUuids)
    {
        cluster.client().remove(switchPath(uuid));
        SPDLOG_LOGGER_DEBUG(Logger::instance(),
                            "Deleted logical switch {} on cluster {}",
                            uuid,
                            cluster.name());
    }
}

std::vector<BackendSwitch>
querySwitches(const Cluster& cluster, const std::vector<std::string>& tenantIds)
{
    QueryRequest request{SWITCH_COLLECTION,
                         {"uuid", "display_name", "fabric_status", "tags"},
                         {SWITCH_STATUS_RELATION},
                         {}};
    appendTagFilters(request.tags, tag_scope::TENANT_ID, tenantIds);

    std::vector<BackendSwitch> switches;
    for (const auto& item : queryAllPages(cluster.client(), request))
    {
        switches.push_back(decodeDocument<BackendSwitch>(item, "logical switch"));
    }
    return switches;
}

BackendPort
createPort(const Cluster& cluster,
           const std::string& switchUuid,
           const LogicalPort& port,
           bool portSecurityEnabled)
{
    json created = cluster.client().create(portCollectionPath(switchUuid),
                                           buildPortDocument(port, portSecurityEnabled));
    BackendPort backendPort = decodeDocument<BackendPort>(created, "logical port");
    backendPort.switchUuid = switchUuid;

    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Created logical port {} for port {} on switch {}",
                        backendPort.uuid,
                        port.id,
                        switchUuid);
    return backendPort;
}

void
plugInterface(const Cluster& cluster,
              const std::string& switchUuid,
              const std::string& portUuid,
              const std::string& attachmentType,
              const std::string& attachmentId)
{
    json attachment{{"type", attachmentType}, {"vif_uuid", attachmentId}};
    cluster.client().attach(portPath(switchUuid, portUuid) + "/attachment", attachment);
}

void
updatePort(const Cluster& cluster,
           const BackendPort& backendPort,
           const LogicalPort& port,
           bool portSecurityEnabled)
{
    cluster.client().update(portPath(backendPort.switchUuid, backendPort.uuid),
                            buildPortDocument(port, portSecurityEnabled));
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Updated logical port {} on switch {}",
                        backendPort.uuid,
                        backendPort.switchUuid);
}

ResourceStatus
getPortStatus(const Cluster& cluster, const std::string& switchUuid, const std::string& portUuid)
{
    json status = cluster.client().read(portPath(switchUuid, portUuid) + "/status", {});
    const json& linkUp = status.is_object() && status.contains("link_status_up")
                             ? status["link_status_up"]
                             : json(false);
    if (!linkUp.is_boolean())
    {
        throw BackendError("Malformed status document for logical port " + portUuid);
    }
    return linkUp.get<bool>() ? ResourceStatus::ACTIVE : ResourceStatus::DOWN;
}

void
deletePort(const Cluster& cluster, const BackendPort& backendPort)
{
    if (backendPort.switchUuid.empty())
    {
        throw BackendError("cannot locate the switch of logical port " + backendPort.uuid);
    }
    cluster.client().remove(portPath(backendPort.switchUuid, backendPort.uuid));
}

std::vector<BackendPort>
queryPorts(const Cluster& cluster, const PortQuery& query)
{
    QueryRequest request{portCollectionPath(ANY_SWITCH),
                         {"uuid", "tags", "admin_status_enabled", "display_name", "fabric_status_up"},
                         {PORT_STATUS_RELATION},
                         {}};
    appendTagFilters(request.tags, tag_scope::LOGICAL_NETWORK_ID, query.networkIds);
    for (const auto& deviceId : query.deviceIds)
    {
        request.tags.push_back({tag_scope::DEVICE_ID, utils::sha1Hex(deviceId)});
    }
    appendTagFilters(request.tags, tag_scope::TENANT_ID, query.tenantIds);
    request.tags.push_back({tag_scope::LOGICAL_PORT_ID, query.portId});

    std::vector<BackendPort> ports;
    for (const auto& item : queryAllPages(cluster.client(), request))
    {
        ports.push_back(decodeDocument<BackendPort>(item, "logical port"));
    }
    return ports;
}

std::optional<std::pair<BackendPort, std::shared_ptr<Cluster>>>
findPortByTag(const std::vector<std::shared_ptr<Cluster>>& clusters,
              const std::optional<std::string>& networkId,
              const std::string& portId)
{
    PortQuery query;
    if (networkId)
    {
        query.networkIds.push_back(*networkId);
    }
    query.portId = portId;

    for (const auto& cluster : clusters)
    {
        std::vector<BackendPort> ports;
        try
        {
            ports = queryPorts(*cluster, query);
        }
        catch (const ResourceNotFound&)
        {
            continue;
        }

        if (ports.empty())
        {
            continue;
        }
        if (ports.size() > 1)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Found {} logical ports tagged with port id {} on cluster {}; "
                               "using {}",
                               ports.size(),
                               portId,
                               cluster->name(),
                               ports.front().uuid);
        }
        return std::make_pair(ports.front(), cluster);
    }
    return std::nullopt;
}

} // namespace controller_api
