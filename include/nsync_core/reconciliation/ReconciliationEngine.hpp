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

// nsync_core/reconciliation/ReconciliationEngine.hpp
#pragma once

#include "common_types/BackendTypes.hpp"
#include "common_types/NetworkTypes.hpp"
#include "nsync_core/allocation/SwitchAllocator.hpp"
#include "nsync_core/config/SyncConfig.hpp"
#include "nsync_core/policy/PolicyEnforcer.hpp"
#include "nsync_core/security/PortSecurityBinding.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class Cluster;
class ClusterRegistry;
class RecordStore;

struct EngineOptions
{
    int maxPortsPerBridgedSwitch = AppConfig::MAX_LP_PER_BRIDGED_LS;
    int maxPortsPerOverlaySwitch = AppConfig::MAX_LP_PER_OVERLAY_LS;
    bool strictConsistency = false;

    static EngineOptions fromSyncOptions(const SyncOptions& sync)
    {
        return EngineOptions{sync.maxPortsPerBridgedSwitch,
                             sync.maxPortsPerOverlaySwitch,
                             sync.strictConsistency};
    }
};

/**
 * @brief Keeps local network/port records and controller switches/ports in step.
 *
 * Every operation combines one local transaction with controller calls. Local changes are
 * atomic; controller changes are not rolled back, so partial failures are logged with the
 * resource ids and cluster name involved.
 *
 * Listings cross-reference both sides: matched records take name and status from the
 * controller, local records without a controller counterpart are returned unchanged, and
 * controller resources no record explains are reported as one aggregate warning (OutOfSync
 * in strict consistency mode). Nothing is deleted to repair drift.
 *
 * Controller failures surface as BackendUnavailable, except CapacityExhausted and the
 * not-found kinds, which pass through.
 *
 * Thread-safe as long as the store, the policy and the backend clients are.
 */
class ReconciliationEngine
{
  public:
    ReconciliationEngine(ClusterRegistry& registry,
                         RecordStore& store,
                         const PolicyEnforcer& policy,
                         EngineOptions options);

    /**
     * @brief Create a logical switch, then the network record with the switch uuid as id.
     *
     * @throws InvalidInput on inconsistent provider attributes.
     * @throws SegmentationIdInUse if the (physical network, VLAN) pair is taken.
     * @throws NotAuthorized if provider attributes are set by a non-admin.
     * @throws UnknownZone, BackendUnavailable.
     */
    LogicalNetwork createNetwork(const RequestContext& ctx, const NetworkCreateRequest& request);

    /// @throws NotSupported for admin_state_up = false.
    LogicalNetwork updateNetwork(const RequestContext& ctx,
                                 const std::string& networkId,
                                 const NetworkUpdateRequest& request);

    /**
     * @brief Delete the network record, then its switches on every cluster (best effort).
     *
     * @throws NetworkNotFound if no cluster has a switch for the network; the local store is
     *         left untouched in that case.
     */
    void deleteNetwork(const RequestContext& ctx, const std::string& networkId);

    LogicalNetwork getNetwork(const RequestContext& ctx, const std::string& networkId);

    /// @param report When set, drift counts are added to it.
    std::vector<LogicalNetwork> getNetworks(const RequestContext& ctx,
                                            const NetworkFilters& filters,
                                            DriftReport* report = nullptr);

    /**
     * @brief Create the port record, place it on a switch with spare capacity and plug it.
     *
     * @throws CapacityExhausted when the network cannot take another port.
     * @throws BackendUnavailable when any other controller step fails.
     */
    LogicalPort createPort(const RequestContext& ctx, const PortCreateRequest& request);

    LogicalPort updatePort(const RequestContext& ctx,
                           const std::string& portId,
                           const PortUpdateRequest& request);

    /// @throws PortNotFound when no cluster has the port; the record is left untouched.
    void deletePort(const RequestContext& ctx, const std::string& portId);

    LogicalPort getPort(const RequestContext& ctx, const std::string& portId);

    /// Idempotent: repeated calls on unchanged state return the same projection.
    std::vector<LogicalPort> getPorts(const RequestContext& ctx,
                                      const PortFilters& filters,
                                      DriftReport* report = nullptr);

    /// Full admin-scope cross-reference of networks and ports; never raises OutOfSync.
    DriftReport checkConsistency();

  private:
    using LocatedPort = std::pair<BackendPort, std::shared_ptr<Cluster>>;

    std::optional<ProviderBinding> handleProviderCreate(const RequestContext& ctx,
                                                        const NetworkCreateRequest& request);
    std::string tenantForCreate(const RequestContext& ctx,
                                const std::optional<std::string>& requested) const;
    void extendProvider(const RequestContext& ctx,
                        LogicalNetwork& network,
                        std::optional<ProviderBinding> binding) const;

    std::vector<std::pair<std::shared_ptr<Cluster>, std::vector<std::string>>>
    switchClusterPairs(const std::string& networkId) const;

    /// Persisted cluster first, then every cluster.
    std::optional<LocatedPort> locatePort(const std::string& portId,
                                          const std::optional<std::string>& clusterName,
                                          const std::optional<std::string>& networkId) const;

    /// Place @p port on a switch of @p network and attach it; BackendError becomes BackendUnavailable.
    void plugPort(Cluster& cluster,
                  const LogicalNetwork& network,
                  const std::optional<ProviderBinding>& binding,
                  const LogicalPort& port,
                  bool portSecurity,
                  int maxPorts,
                  bool allowFragmentation);

    /// Compensate a committed port record whose controller side could not be created.
    void discardPortRecord(const std::string& portId);

    std::vector<LogicalNetwork> listNetworks(const RequestContext& ctx,
                                             const NetworkFilters& filters,
                                             DriftReport* report,
                                             bool strict);
    std::vector<LogicalPort> listPorts(const RequestContext& ctx,
                                       const PortFilters& filters,
                                       DriftReport* report,
                                       bool strict);

    ClusterRegistry& m_registry;
    RecordStore& m_store;
    const PolicyEnforcer& m_policy;
    PortSecurityBinding m_portSecurity;
    SwitchAllocator m_allocator;
    EngineOptions m_options;
};
