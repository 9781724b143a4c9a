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

// nsync_core/store/RecordStore.hpp
#pragma once

#include "common_types/NetworkTypes.hpp"
#include <optional>
#include <string>
#include <vector>

class TransactionScope;

/**
 * @brief Local record store for networks, ports and their side tables.
 *
 * Reads return records without projections (provider, port security, status are left
 * unset). Mutations inside a TransactionScope are atomic: an uncommitted scope rolls every
 * change back. Scopes nest; only the outermost one commits or rolls back.
 *
 * Errors: NetworkNotFound, PortNotFound, NetworkInUse, SegmentationIdInUse, InvalidInput.
 */
class RecordStore
{
  public:
    virtual ~RecordStore() = default;

    // Networks
    virtual LogicalNetwork createNetwork(const LogicalNetwork& network) = 0;
    virtual LogicalNetwork getNetwork(const std::string& networkId) const = 0;
    virtual std::vector<LogicalNetwork> findNetworks(const NetworkFilters& filters) const = 0;
    virtual LogicalNetwork updateNetwork(const LogicalNetwork& network) = 0;

    /// Remove a network with its binding and port security rows.
    /// @throws NetworkInUse while ports still reference the network.
    virtual void deleteNetwork(const std::string& networkId) = 0;

    // Provider bindings
    /// @throws SegmentationIdInUse if a VLAN binding reuses a (physical network, id) pair.
    virtual void addNetworkBinding(const NetworkBinding& binding) = 0;
    virtual std::optional<ProviderBinding> getNetworkBinding(const std::string& networkId) const = 0;
    /// @return id of the network bound to the VLAN pair, if any.
    virtual std::optional<std::string>
    findNetworkBySegment(const std::optional<std::string>& physicalNetwork,
                         int segmentationId) const = 0;

    // Port security
    virtual void setNetworkPortSecurity(const std::string& networkId, bool enabled) = 0;
    virtual std::optional<bool> getNetworkPortSecurity(const std::string& networkId) const = 0;
    virtual void setPortPortSecurity(const std::string& portId, bool enabled) = 0;
    virtual std::optional<bool> getPortPortSecurity(const std::string& portId) const = 0;

    // Ports
    /// @throws NetworkNotFound when the port's network does not exist.
    virtual LogicalPort createPort(const LogicalPort& port) = 0;
    virtual LogicalPort getPort(const std::string& portId) const = 0;
    virtual std::vector<LogicalPort> findPorts(const PortFilters& filters) const = 0;
    virtual LogicalPort updatePort(const LogicalPort& port) = 0;
    virtual void deletePort(const std::string& portId) = 0;

  protected:
    friend class TransactionScope;

    virtual void beginTransaction() = 0;
    virtual void commitTransaction() = 0;
    /// Must not throw; called from TransactionScope's destructor.
    virtual void rollbackTransaction() noexcept = 0;
};

/**
 * @brief RAII transaction on a RecordStore.
 *
 * Destroying the scope without commit() rolls back.
 */
class TransactionScope
{
  public:
    explicit TransactionScope(RecordStore& store)
        : m_store(store)
    {
        m_store.beginTransaction();
    }

    ~TransactionScope()
    {
        if (!m_finished)
        {
            m_store.rollbackTransaction();
        }
    }

    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;

    void commit()
    {
        m_finished = true;
        m_store.commitTransaction();
    }

  private:
    RecordStore& m_store;
    bool m_finished = false;
};
