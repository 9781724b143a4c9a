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

#include "nsync_core/reconciliation/ReconciliationEngine.hpp"
#include "common_types/Errors.hpp"
#include "nsync_core/backend/ControllerApi.hpp"
#include "nsync_core/cluster/ClusterRegistry.hpp"
#include "nsync_core/store/RecordStore.hpp"
#include "utils/Logger.hpp"
#include "utils/Utils.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>

namespace
{
ResourceStatus
combineStatus(const std::optional<ResourceStatus>& current, bool up)
{
    if (current == ResourceStatus::DOWN || !up)
    {
        return ResourceStatus::DOWN;
    }
    return ResourceStatus::ACTIVE;
}

bool
contains(const std::vector<std::string>& values, const std::string& value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}
} // namespace

ReconciliationEngine::ReconciliationEngine(ClusterRegistry& registry,
                                           RecordStore& store,
                                           const PolicyEnforcer& policy,
                                           EngineOptions options)
    : m_registry(registry),
      m_store(store),
      m_policy(policy),
      m_portSecurity(store),
      m_options(options)
{
}

std::optional<ProviderBinding>
ReconciliationEngine::handleProviderCreate(const RequestContext& ctx,
                                           const NetworkCreateRequest& request)
{
    if (!request.hasProviderAttributes())
    {
        return std::nullopt;
    }

    // Authorize before exposing provider details to the caller
    m_policy.enforceSet(ctx,
                        PolicyTarget{request.tenantId.value_or(ctx.tenantId), std::nullopt},
                        policy_action::PROVIDER_NETWORK_SET);

    if (!request.networkType)
    {
        throw InvalidInput("provider:network_type required");
    }
    auto type = networkTypeFromString(*request.networkType);
    if (!type)
    {
        throw InvalidInput("provider:network_type " + *request.networkType + " not supported");
    }

    if (*type != NetworkType::VLAN)
    {
        if (request.segmentationId)
        {
            throw InvalidInput("Segmentation ID cannot be specified with " + to_string(*type) +
                               " network type");
        }
        return ProviderBinding{*type, request.physicalNetwork, std::nullopt};
    }

    if (!request.segmentationId)
    {
        throw InvalidInput("Segmentation ID must be specified with vlan network type");
    }
    int segmentationId = *request.segmentationId;
    if (segmentationId < MIN_VLAN_TAG || segmentationId > MAX_VLAN_TAG)
    {
        throw InvalidInput(std::to_string(segmentationId) + " out of range (" +
                           std::to_string(MIN_VLAN_TAG) + " to " + std::to_string(MAX_VLAN_TAG) +
                           ")");
    }
    if (m_store.findNetworkBySegment(request.physicalNetwork, segmentationId))
    {
        throw SegmentationIdInUse(segmentationId, request.physicalNetwork.value_or(""));
    }
    return ProviderBinding{*type, request.physicalNetwork, segmentationId};
}

std::string
ReconciliationEngine::tenantForCreate(const RequestContext& ctx,
                                      const std::optional<std::string>& requested) const
{
    if (!requested || *requested == ctx.tenantId)
    {
        return ctx.tenantId;
    }
    if (!ctx.isAdmin)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Tenant {} may not create resources for tenant {}",
                           ctx.tenantId,
                           *requested);
        throw NotAuthorized("create resources for tenant " + *requested);
    }
    return *requested;
}

void
ReconciliationEngine::extendProvider(const RequestContext& ctx,
                                     LogicalNetwork& network,
                                     std::optional<ProviderBinding> binding) const
{
    if (!m_policy.checkView(ctx,
                            PolicyTarget{network.tenantId, std::nullopt},
                            policy_action::PROVIDER_NETWORK_VIEW))
    {
        return;
    }
    if (!binding)
    {
        binding = m_store.getNetworkBinding(network.id);
    }
    // Overlay networks created without provider attributes have no binding
    network.provider = binding;
}

LogicalNetwork
ReconciliationEngine::createNetwork(const RequestContext& ctx, const NetworkCreateRequest& request)
{
    auto binding = handleProviderCreate(ctx, request);

    if (!request.adminStateUp)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Networks with admin_state_up=False are not supported. Ignoring "
                           "setting for network {}",
                           request.name.empty() ? "<unknown>" : request.name);
    }
    const std::string tenantId = tenantForCreate(ctx, request.tenantId);
    Cluster& cluster = m_registry.resolve(request.zoneId);

    BackendSwitch lswitch;
    try
    {
        lswitch = controller_api::createSwitch(cluster, tenantId, request.name, binding);
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Unable to create logical switch for network {} on cluster {}: {}",
                            request.name,
                            cluster.name(),
                            e.what());
        throw BackendUnavailable("unable to create logical switch on cluster " + cluster.name() +
                                 ": " + e.what());
    }

    LogicalNetwork network;
    network.id = lswitch.uuid;
    network.tenantId = tenantId;
    network.name = request.name;
    network.adminStateUp = request.adminStateUp;
    network.zoneId = request.zoneId;

    try
    {
        TransactionScope tx(m_store);
        LogicalNetwork created = m_store.createNetwork(network);
        m_portSecurity.recordNetwork(created.id, request.portSecurityEnabled);
        if (binding)
        {
            m_store.addNetworkBinding(NetworkBinding{created.id, *binding});
        }
        extendProvider(ctx, created, binding);
        m_portSecurity.extendNetwork(created);
        tx.commit();

        SPDLOG_LOGGER_INFO(Logger::instance(),
                           "Created network {} ({}) for tenant {} on cluster {}",
                           created.id,
                           created.name,
                           tenantId,
                           cluster.name());
        return created;
    }
    catch (const std::exception& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Logical switch {} on cluster {} is orphaned: storing network "
                            "record failed: {}",
                            lswitch.uuid,
                            cluster.name(),
                            e.what());
        throw;
    }
}

LogicalNetwork
ReconciliationEngine::updateNetwork(const RequestContext& ctx,
                                    const std::string& networkId,
                                    const NetworkUpdateRequest& request)
{
    if (request.adminStateUp && !*request.adminStateUp)
    {
        throw NotSupported("admin_state_up=False networks are not supported.");
    }

    LogicalNetwork updated;
    bool nameChanged = false;
    {
        TransactionScope tx(m_store);
        LogicalNetwork network = m_store.getNetwork(networkId);
        if (request.name && *request.name != network.name)
        {
            network.name = *request.name;
            nameChanged = true;
        }
        if (request.adminStateUp)
        {
            network.adminStateUp = *request.adminStateUp;
        }
        updated = m_store.updateNetwork(network);
        if (request.portSecurityEnabled)
        {
            m_portSecurity.updateNetwork(networkId, *request.portSecurityEnabled);
        }
        extendProvider(ctx, updated, std::nullopt);
        m_portSecurity.extendNetwork(updated);
        tx.commit();
    }

    if (nameChanged)
    {
        try
        {
            Cluster& cluster = m_registry.resolve(updated.zoneId);
            BackendSwitch primary = controller_api::getSwitches(cluster, networkId).front();
            primary.displayName = updated.name;
            controller_api::updateSwitch(cluster, primary, updated.tenantId, {});
        }
        catch (const NetSyncError& e)
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Unable to rename logical switch of network {}: {}. Local and "
                               "controller names differ",
                               networkId,
                               e.what());
        }
    }
    return updated;
}

std::vector<std::pair<std::shared_ptr<Cluster>, std::vector<std::string>>>
ReconciliationEngine::switchClusterPairs(const std::string& networkId) const
{
    std::vector<std::pair<std::shared_ptr<Cluster>, std::vector<std::string>>> pairs;
    for (const auto& cluster : m_registry.clusters())
    {
        std::vector<std::string> uuids;
        try
        {
            for (const auto& lswitch : controller_api::getSwitches(*cluster, networkId))
            {
                uuids.push_back(lswitch.uuid);
            }
        }
        catch (const ResourceNotFound&)
        {
            continue;
        }
        catch (const BackendError& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Unable to get logical switches of network {} on cluster {}: {}",
                                networkId,
                                cluster->name(),
                                e.what());
            throw BackendUnavailable("unable to get logical switches of network " + networkId +
                                     ": " + e.what());
        }
        pairs.emplace_back(cluster, std::move(uuids));
    }

    if (pairs.empty())
    {
        throw NetworkNotFound(networkId);
    }
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Network {} has switches on {} cluster(s)",
                        networkId,
                        pairs.size());
    return pairs;
}

void
ReconciliationEngine::deleteNetwork(const RequestContext& ctx, const std::string& networkId)
{
    auto pairs = switchClusterPairs(networkId);

    {
        TransactionScope tx(m_store);
        m_store.deleteNetwork(networkId);
        tx.commit();
    }

    for (const auto& [cluster, uuids] : pairs)
    {
        try
        {
            controller_api::deleteSwitches(*cluster, uuids);
        }
        catch (const BackendError& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Failed to delete logical switches of network {} on cluster {}: "
                                "{}. Local store and controller diverge",
                                networkId,
                                cluster->name(),
                                e.what());
        }
    }
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "deleteNetwork completed for tenant: {}", ctx.tenantId);
}

LogicalNetwork
ReconciliationEngine::getNetwork(const RequestContext& ctx, const std::string& networkId)
{
    LogicalNetwork network;
    {
        TransactionScope tx(m_store);
        network = m_store.getNetwork(networkId);
        extendProvider(ctx, network, std::nullopt);
        m_portSecurity.extendNetwork(network);
        tx.commit();
    }

    Cluster& cluster = m_registry.resolve(network.zoneId);
    try
    {
        auto switches = controller_api::getSwitches(cluster, networkId);
        bool up = std::all_of(switches.begin(), switches.end(), [](const BackendSwitch& s) {
            return s.fabricStatus;
        });
        network.status = up ? ResourceStatus::ACTIVE : ResourceStatus::DOWN;
    }
    catch (const ResourceNotFound&)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Logical switch of network {} not found on cluster {}",
                           networkId,
                           cluster.name());
        network.status = ResourceStatus::DOWN;
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Unable to get logical switches of network {} on cluster {}: {}",
                            networkId,
                            cluster.name(),
                            e.what());
        throw BackendUnavailable("unable to get logical switches: " + std::string(e.what()));
    }
    return network;
}

std::vector<LogicalNetwork>
ReconciliationEngine::getNetworks(const RequestContext& ctx,
                                  const NetworkFilters& filters,
                                  DriftReport* report)
{
    return listNetworks(ctx, filters, report, m_options.strictConsistency);
}

std::vector<LogicalNetwork>
ReconciliationEngine::listNetworks(const RequestContext& ctx,
                                   const NetworkFilters& filters,
                                   DriftReport* report,
                                   bool strict)
{
    std::vector<LogicalNetwork> networks;
    {
        TransactionScope tx(m_store);
        networks = m_store.findNetworks(filters);
        for (auto& network : networks)
        {
            extendProvider(ctx, network, std::nullopt);
            m_portSecurity.extendNetwork(network);
        }
        tx.commit();
    }

    std::vector<std::string> tenantFilter;
    if (!filters.tenantIds.empty())
    {
        tenantFilter = filters.tenantIds;
    }
    else if (!ctx.isAdmin)
    {
        tenantFilter.push_back(ctx.tenantId);
    }

    std::vector<BackendSwitch> switches;
    for (const auto& cluster : m_registry.clusters())
    {
        try
        {
            auto found = controller_api::querySwitches(*cluster, tenantFilter);
            switches.insert(switches.end(), found.begin(), found.end());
        }
        catch (const BackendError& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Unable to get logical switches on cluster {}: {}",
                                cluster->name(),
                                e.what());
            throw BackendUnavailable("unable to get logical switches: " + std::string(e.what()));
        }
    }

    std::unordered_map<std::string, std::size_t> byId;
    for (std::size_t i = 0; i < networks.size(); ++i)
    {
        byId.emplace(networks[i].id, i);
    }
    std::vector<bool> matched(networks.size(), false);

    std::size_t unclaimed = 0;
    for (const auto& lswitch : switches)
    {
        auto primary = byId.find(lswitch.uuid);
        if (primary != byId.end())
        {
            auto& network = networks[primary->second];
            network.name = lswitch.displayName;
            network.status = combineStatus(network.status, lswitch.fabricStatus);
            matched[primary->second] = true;
            continue;
        }

        auto owner = findTag(lswitch.tags, tag_scope::LOGICAL_NETWORK_ID);
        if (owner)
        {
            auto fragmentOf = byId.find(*owner);
            if (fragmentOf != byId.end())
            {
                auto& network = networks[fragmentOf->second];
                network.status = combineStatus(network.status, lswitch.fabricStatus);
                continue;
            }
        }

        // Only switches the filters would have selected count as drift
        bool selected = (filters.ids.empty() || contains(filters.ids, lswitch.uuid) ||
                         (owner && contains(filters.ids, *owner))) &&
                        (filters.names.empty() || contains(filters.names, lswitch.displayName));
        if (selected)
        {
            ++unclaimed;
        }
    }

    std::size_t unmatched = 0;
    for (std::size_t i = 0; i < networks.size(); ++i)
    {
        if (!matched[i])
        {
            ++unmatched;
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Network {} has no logical switch on any cluster",
                               networks[i].id);
        }
    }

    if (report)
    {
        report->unmatchedLocalNetworks += unmatched;
        report->unclaimedBackendSwitches += unclaimed;
    }

    if (unclaimed > 0)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Found {} logical switches not bound to local networks. Local store "
                           "and controller are potentially out of sync",
                           unclaimed);
        if (strict)
        {
            throw OutOfSync("logical switches", unclaimed);
        }
    }

    SPDLOG_LOGGER_DEBUG(Logger::instance(), "getNetworks completed for tenant {}", ctx.tenantId);
    return networks;
}

std::optional<ReconciliationEngine::LocatedPort>
ReconciliationEngine::locatePort(const std::string& portId,
                                 const std::optional<std::string>& clusterName,
                                 const std::optional<std::string>& networkId) const
{
    const auto& clusters = m_registry.clusters();
    if (clusterName)
    {
        auto owner = std::find_if(clusters.begin(),
                                  clusters.end(),
                                  [&clusterName](const std::shared_ptr<Cluster>& c) {
                                      return c->name() == *clusterName;
                                  });
        if (owner != clusters.end())
        {
            auto found = controller_api::findPortByTag({*owner}, networkId, portId);
            if (found)
            {
                return found;
            }
        }
        else
        {
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Cluster {} of port {} is no longer configured",
                               *clusterName,
                               portId);
        }
    }
    return controller_api::findPortByTag(clusters, networkId, portId);
}

LogicalPort
ReconciliationEngine::createPort(const RequestContext& ctx, const PortCreateRequest& request)
{
    LogicalNetwork network = m_store.getNetwork(request.networkId);
    const std::string tenantId = tenantForCreate(ctx, request.tenantId);

    // Only checked when set, so ports can be created on shared networks of other tenants
    if (request.portSecurityEnabled)
    {
        m_policy.enforceSet(ctx,
                            PolicyTarget{tenantId, network.tenantId},
                            policy_action::PORT_SECURITY_CREATE);
    }

    LogicalPort port;
    port.id = utils::generateUuid();
    port.networkId = network.id;
    port.tenantId = tenantId;
    port.name = request.name;
    port.deviceId = request.deviceId;
    port.adminStateUp = request.adminStateUp;
    port.macAddress = request.macAddress.value_or(utils::generateMacAddress());
    port.fixedIps = request.fixedIps;
    port.zoneId = request.zoneId ? request.zoneId : network.zoneId;

    Cluster& cluster = m_registry.resolve(port.zoneId);
    port.clusterName = cluster.name();

    auto binding = m_store.getNetworkBinding(network.id);
    int maxPorts = m_options.maxPortsPerOverlaySwitch;
    bool allowFragmentation = false;
    if (binding && isBridged(binding->networkType))
    {
        maxPorts = m_options.maxPortsPerBridgedSwitch;
        allowFragmentation = true;
    }

    // The record is committed before any controller call and removed again if those fail
    LogicalPort created;
    bool portSecurity = false;
    {
        TransactionScope tx(m_store);
        created = m_store.createPort(port);
        portSecurity = m_portSecurity.resolveForPort(network.id, request.portSecurityEnabled);
        m_portSecurity.recordPort(created.id, portSecurity);
        tx.commit();
    }

    try
    {
        plugPort(cluster, network, binding, created, portSecurity, maxPorts, allowFragmentation);
    }
    catch (const std::exception&)
    {
        discardPortRecord(created.id);
        throw;
    }

    created.portSecurityEnabled = portSecurity;

    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "createPort completed on cluster {} for tenant {}: ({})",
                        cluster.name(),
                        tenantId,
                        created.id);
    return created;
}

void
ReconciliationEngine::plugPort(Cluster& cluster,
                               const LogicalNetwork& network,
                               const std::optional<ProviderBinding>& binding,
                               const LogicalPort& port,
                               bool portSecurity,
                               int maxPorts,
                               bool allowFragmentation)
{
    try
    {
        BackendSwitch lswitch =
            m_allocator.select(cluster, network, binding, maxPorts, allowFragmentation);
        BackendPort backendPort = controller_api::createPort(cluster, lswitch.uuid, port, portSecurity);
        try
        {
            controller_api::plugInterface(cluster,
                                          lswitch.uuid,
                                          backendPort.uuid,
                                          controller_api::VIF_ATTACHMENT,
                                          port.id);
        }
        catch (const BackendError&)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Logical port {} on switch {} (cluster {}) is orphaned: "
                                "attaching port {} failed",
                                backendPort.uuid,
                                lswitch.uuid,
                                cluster.name(),
                                port.id);
            throw;
        }
    }
    catch (const CapacityExhausted&)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Number of available ports for network {} exhausted",
                            network.id);
        throw;
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "An exception occurred while plugging the interface for port {} on "
                            "cluster {}: {}",
                            port.id,
                            cluster.name(),
                            e.what());
        throw BackendUnavailable("unable to plug interface for port " + port.id + ": " +
                                 e.what());
    }
}

void
ReconciliationEngine::discardPortRecord(const std::string& portId)
{
    try
    {
        TransactionScope tx(m_store);
        m_store.deletePort(portId);
        tx.commit();
    }
    catch (const NetSyncError& e)
    {
        // The create failure is what the caller sees
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Record of port {} could not be removed after a failed create: {}",
                            portId,
                            e.what());
    }
}

LogicalPort
ReconciliationEngine::updatePort(const RequestContext& ctx,
                                 const std::string& portId,
                                 const PortUpdateRequest& request)
{
    if (request.portSecurityEnabled)
    {
        LogicalPort existing = m_store.getPort(portId);
        m_policy.enforceSet(ctx,
                            PolicyTarget{existing.tenantId,
                                         m_store.getNetwork(existing.networkId).tenantId},
                            policy_action::PORT_SECURITY_UPDATE);
    }

    // The controller is updated first; the record is written only once that succeeded
    LogicalPort port = m_store.getPort(portId);
    if (request.name)
    {
        port.name = *request.name;
    }
    if (request.deviceId)
    {
        port.deviceId = *request.deviceId;
    }
    if (request.adminStateUp)
    {
        port.adminStateUp = *request.adminStateUp;
    }
    if (request.fixedIps)
    {
        port.fixedIps = *request.fixedIps;
    }
    m_portSecurity.extendPort(port);
    const bool portSecurity = request.portSecurityEnabled ? *request.portSecurityEnabled
                                                          : port.portSecurityEnabled.value_or(false);

    std::optional<LocatedPort> located;
    try
    {
        located = locatePort(portId, port.clusterName, port.networkId);
        if (!located)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(), "Port {} was not found on any cluster", portId);
            throw PortNotFound(portId);
        }
        controller_api::updatePort(*located->second, located->first, port, portSecurity);
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Unable to update logical port of port {}: {}",
                            portId,
                            e.what());
        throw BackendUnavailable("unable to update port " + portId + ": " + e.what());
    }

    LogicalPort updated;
    try
    {
        TransactionScope tx(m_store);
        updated = m_store.updatePort(port);
        m_portSecurity.updatePort(portId, request.portSecurityEnabled);
        tx.commit();
    }
    catch (const NetSyncError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Logical port {} updated on cluster {} but record of port {} could not "
                            "be updated: {}",
                            located->first.uuid,
                            located->second->name(),
                            portId,
                            e.what());
        throw;
    }
    updated.portSecurityEnabled = portSecurity;

    // The update is committed; a failed status read only leaves the status unset
    try
    {
        updated.status = controller_api::getPortStatus(*located->second,
                                                       located->first.switchUuid,
                                                       located->first.uuid);
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Unable to retrieve port status for: {} ({})",
                           located->first.uuid,
                           e.what());
    }
    return updated;
}

void
ReconciliationEngine::deletePort(const RequestContext& ctx, const std::string& portId)
{
    PortFilters byId;
    byId.ids.push_back(portId);
    auto records = m_store.findPorts(byId);
    std::optional<std::string> clusterName;
    if (!records.empty())
    {
        clusterName = records.front().clusterName;
    }

    std::optional<LocatedPort> located;
    try
    {
        located = locatePort(portId, clusterName, std::nullopt);
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Unable to look up port {}: {}", portId, e.what());
        throw BackendUnavailable("unable to look up port " + portId + ": " + e.what());
    }
    if (!located)
    {
        throw PortNotFound(portId);
    }

    try
    {
        controller_api::deletePort(*located->second, located->first);
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Unable to delete logical port {} of port {} on cluster {}: {}",
                            located->first.uuid,
                            portId,
                            located->second->name(),
                            e.what());
        throw BackendUnavailable("unable to delete port " + portId + ": " + e.what());
    }

    try
    {
        TransactionScope tx(m_store);
        m_store.deletePort(portId);
        tx.commit();
    }
    catch (const NetSyncError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Logical port {} deleted on cluster {} but record of port {} could not "
                            "be removed: {}",
                            located->first.uuid,
                            located->second->name(),
                            portId,
                            e.what());
        throw;
    }
    SPDLOG_LOGGER_DEBUG(Logger::instance(), "deletePort completed for tenant: {}", ctx.tenantId);
}

LogicalPort
ReconciliationEngine::getPort(const RequestContext& ctx, const std::string& portId)
{
    LogicalPort port;
    {
        TransactionScope tx(m_store);
        port = m_store.getPort(portId);
        m_portSecurity.extendPort(port);
        tx.commit();
    }

    std::optional<LocatedPort> located;
    try
    {
        located = locatePort(portId, port.clusterName, std::nullopt);
    }
    catch (const BackendError& e)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Unable to look up port {}: {}", portId, e.what());
        throw BackendUnavailable("unable to look up port " + portId + ": " + e.what());
    }

    if (!located)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Port {} was not found on any cluster; returning local record",
                           portId);
        return port;
    }

    const BackendPort& backendPort = located->first;
    port.adminStateUp = backendPort.adminStatusEnabled;
    port.name = backendPort.displayName;
    port.status = backendPort.fabricStatusUp ? ResourceStatus::ACTIVE : ResourceStatus::DOWN;

    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Port details for tenant {}: {}",
                        ctx.tenantId,
                        json(port).dump());
    return port;
}

std::vector<LogicalPort>
ReconciliationEngine::getPorts(const RequestContext& ctx,
                               const PortFilters& filters,
                               DriftReport* report)
{
    return listPorts(ctx, filters, report, m_options.strictConsistency);
}

std::vector<LogicalPort>
ReconciliationEngine::listPorts(const RequestContext& ctx,
                                const PortFilters& filters,
                                DriftReport* report,
                                bool strict)
{
    std::vector<LogicalPort> ports;
    {
        TransactionScope tx(m_store);
        ports = m_store.findPorts(filters);
        for (auto& port : ports)
        {
            m_portSecurity.extendPort(port);
        }
        tx.commit();
    }

    controller_api::PortQuery query;
    query.networkIds = filters.networkIds;
    query.deviceIds = filters.deviceIds;
    query.tenantIds = filters.tenantIds;

    std::map<std::string, BackendPort> backendPorts;
    for (const auto& cluster : m_registry.clusters())
    {
        try
        {
            for (auto& backendPort : controller_api::queryPorts(*cluster, query))
            {
                auto portId = findTag(backendPort.tags, tag_scope::LOGICAL_PORT_ID);
                if (portId)
                {
                    backendPorts.emplace(*portId, std::move(backendPort));
                }
            }
        }
        catch (const ResourceNotFound&)
        {
            continue;
        }
        catch (const BackendError& e)
        {
            SPDLOG_LOGGER_ERROR(Logger::instance(),
                                "Unable to get logical ports on cluster {}: {}",
                                cluster->name(),
                                e.what());
            throw BackendUnavailable("unable to get ports: " + std::string(e.what()));
        }
    }

    std::size_t unmatched = 0;
    for (auto& port : ports)
    {
        auto it = backendPorts.find(port.id);
        if (it == backendPorts.end())
        {
            ++unmatched;
            SPDLOG_LOGGER_WARN(Logger::instance(),
                               "Port {} was not found on the controller",
                               port.id);
            continue;
        }
        port.adminStateUp = it->second.adminStatusEnabled;
        port.name = it->second.displayName;
        port.status = it->second.fabricStatusUp ? ResourceStatus::ACTIVE : ResourceStatus::DOWN;
        backendPorts.erase(it);
    }

    std::size_t unclaimed = 0;
    for (const auto& entry : backendPorts)
    {
        if (filters.ids.empty() || contains(filters.ids, entry.first))
        {
            ++unclaimed;
        }
    }

    if (report)
    {
        report->unmatchedLocalPorts += unmatched;
        report->unclaimedBackendPorts += unclaimed;
    }

    if (unclaimed > 0)
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Found {} logical ports not bound to local ports. Local store and "
                           "controller are potentially out of sync",
                           unclaimed);
        if (strict)
        {
            throw OutOfSync("logical ports", unclaimed);
        }
    }
    return ports;
}

DriftReport
ReconciliationEngine::checkConsistency()
{
    const RequestContext admin{"", true};
    DriftReport report;
    listNetworks(admin, NetworkFilters{}, &report, false);
    listPorts(admin, PortFilters{}, &report, false);

    if (report.inSync())
    {
        SPDLOG_LOGGER_INFO(Logger::instance(), "Consistency check: local store and controller in sync");
    }
    else
    {
        SPDLOG_LOGGER_WARN(Logger::instance(),
                           "Consistency check: {} network(s) and {} port(s) without controller "
                           "resource, {} switch(es) and {} logical port(s) without local record",
                           report.unmatchedLocalNetworks,
                           report.unmatchedLocalPorts,
                           report.unclaimedBackendSwitches,
                           report.unclaimedBackendPorts);
    }
    return report;
}
