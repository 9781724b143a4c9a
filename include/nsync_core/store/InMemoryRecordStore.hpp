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

// nsync_core/store/InMemoryRecordStore.hpp
#pragma once

#include "nsync_core/store/RecordStore.hpp"
#include <map>
#include <memory>
#include <mutex>

/**
 * @brief RecordStore kept in process memory.
 *
 * A transaction holds the store's recursive mutex from begin to commit/rollback, so
 * transactions are serialized and other threads' single calls wait for them. The outermost
 * scope snapshots the tables and restores the snapshot on rollback. A nested scope that
 * rolls back marks the outer transaction rollback-only.
 */
class InMemoryRecordStore : public RecordStore
{
  public:
    InMemoryRecordStore() = default;

    LogicalNetwork createNetwork(const LogicalNetwork& network) override;
    LogicalNetwork getNetwork(const std::string& networkId) const override;
    std::vector<LogicalNetwork> findNetworks(const NetworkFilters& filters) const override;
    LogicalNetwork updateNetwork(const LogicalNetwork& network) override;
    void deleteNetwork(const std::string& networkId) override;

    void addNetworkBinding(const NetworkBinding& binding) override;
    std::optional<ProviderBinding> getNetworkBinding(const std::string& networkId) const override;
    std::optional<std::string> findNetworkBySegment(const std::optional<std::string>& physicalNetwork,
                                                    int segmentationId) const override;

    void setNetworkPortSecurity(const std::string& networkId, bool enabled) override;
    std::optional<bool> getNetworkPortSecurity(const std::string& networkId) const override;
    void setPortPortSecurity(const std::string& portId, bool enabled) override;
    std::optional<bool> getPortPortSecurity(const std::string& portId) const override;

    LogicalPort createPort(const LogicalPort& port) override;
    LogicalPort getPort(const std::string& portId) const override;
    std::vector<LogicalPort> findPorts(const PortFilters& filters) const override;
    LogicalPort updatePort(const LogicalPort& port) override;
    void deletePort(const std::string& portId) override;

  protected:
    void beginTransaction() override;
    void commitTransaction() override;
    void rollbackTransaction() noexcept override;

  private:
    struct Tables
    {
        std::map<std::string, LogicalNetwork> networks;
        std::map<std::string, ProviderBinding> bindings;
        std::map<std::string, bool> networkPortSecurity;
        std::map<std::string, LogicalPort> ports;
        std::map<std::string, bool> portPortSecurity;
    };

    void endTransaction(bool restore) noexcept;

    mutable std::recursive_mutex m_mutex;
    Tables m_tables;
    std::unique_ptr<Tables> m_snapshot;
    int m_depth = 0;
    bool m_rollbackOnly = false;
};
