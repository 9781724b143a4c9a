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

#include "nsync_core/store/InMemoryRecordStore.hpp"
#include "common_types/Errors.hpp"
#include "utils/Logger.hpp"
#include <algorithm>

namespace
{
template <typename T>
bool
matches(const std::vector<T>& allowed, const T& value)
{
    return allowed.empty() || std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

LogicalNetwork
stripNetwork(LogicalNetwork network)
{
    network.provider.reset();
    network.portSecurityEnabled.reset();
    network.status.reset();
    return network;
}

LogicalPort
stripPort(LogicalPort port)
{
    port.portSecurityEnabled.reset();
    port.status.reset();
    return port;
}
} // namespace

void
InMemoryRecordStore::beginTransaction()
{
    m_mutex.lock();
    if (m_depth++ == 0)
    {
        m_snapshot = std::make_unique<Tables>(m_tables);
        m_rollbackOnly = false;
    }
}

void
InMemoryRecordStore::commitTransaction()
{
    if (m_depth == 1 && m_rollbackOnly)
    {
        endTransaction(true);
        throw NetSyncError("Transaction rolled back: a nested scope failed");
    }
    endTransaction(false);
}

void
InMemoryRecordStore::rollbackTransaction() noexcept
{
    if (m_depth > 1)
    {
        m_rollbackOnly = true;
    }
    endTransaction(m_depth == 1);
}

void
InMemoryRecordStore::endTransaction(bool restore) noexcept
{
    if (--m_depth == 0)
    {
        if (restore && m_snapshot)
        {
            m_tables = std::move(*m_snapshot);
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Record store transaction rolled back");
        }
        m_snapshot.reset();
        m_rollbackOnly = false;
    }
    m_mutex.unlock();
}

LogicalNetwork
InMemoryRecordStore::createNetwork(const LogicalNetwork& network)
{
    if (network.id.empty())
    {
        throw InvalidInput("network id must not be empty");
    }
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (m_tables.networks.count(network.id))
    {
        throw InvalidInput("network " + network.id + " already exists");
    }
    auto stored = stripNetwork(network);
    m_tables.networks.emplace(stored.id, stored);
    return stored;
}

LogicalNetwork
InMemoryRecordStore::getNetwork(const std::string& networkId) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_tables.networks.find(networkId);
    if (it == m_tables.networks.end())
    {
        throw NetworkNotFound(networkId);
    }
    return it->second;
}

std::vector<LogicalNetwork>
InMemoryRecordStore::findNetworks(const NetworkFilters& filters) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    std::vector<LogicalNetwork> result;
    for (const auto& [id, network] : m_tables.networks)
    {
        if (matches(filters.ids, id) && matches(filters.tenantIds, network.tenantId) &&
            matches(filters.names, network.name))
        {
            result.push_back(network);
        }
    }
    return result;
}

LogicalNetwork
InMemoryRecordStore::updateNetwork(const LogicalNetwork& network)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_tables.networks.find(network.id);
    if (it == m_tables.networks.end())
    {
        throw NetworkNotFound(network.id);
    }
    it->second = stripNetwork(network);
    return it->second;
}

void
InMemoryRecordStore::deleteNetwork(const std::string& networkId)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_tables.networks.count(networkId))
    {
        throw NetworkNotFound(networkId);
    }
    for (const auto& entry : m_tables.ports)
    {
        if (entry.second.networkId == networkId)
        {
            throw NetworkInUse(networkId);
        }
    }
    m_tables.networks.erase(networkId);
    m_tables.bindings.erase(networkId);
    m_tables.networkPortSecurity.erase(networkId);
}

void
InMemoryRecordStore::addNetworkBinding(const NetworkBinding& binding)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_tables.networks.count(binding.networkId))
    {
        throw NetworkNotFound(binding.networkId);
    }
    const auto& provider = binding.binding;
    if (provider.networkType == NetworkType::VLAN && provider.segmentationId)
    {
        auto owner = findNetworkBySegment(provider.physicalNetwork, *provider.segmentationId);
        if (owner && *owner != binding.networkId)
        {
            throw SegmentationIdInUse(*provider.segmentationId,
                                      provider.physicalNetwork.value_or(""));
        }
    }
    m_tables.bindings[binding.networkId] = provider;
}

std::optional<ProviderBinding>
InMemoryRecordStore::getNetworkBinding(const std::string& networkId) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_tables.bindings.find(networkId);
    if (it == m_tables.bindings.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string>
InMemoryRecordStore::findNetworkBySegment(const std::optional<std::string>& physicalNetwork,
                                          int segmentationId) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    for (const auto& [networkId, binding] : m_tables.bindings)
    {
        if (binding.networkType == NetworkType::VLAN && binding.segmentationId == segmentationId &&
            binding.physicalNetwork == physicalNetwork)
        {
            return networkId;
        }
    }
    return std::nullopt;
}

void
InMemoryRecordStore::setNetworkPortSecurity(const std::string& networkId, bool enabled)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_tables.networks.count(networkId))
    {
        throw NetworkNotFound(networkId);
    }
    m_tables.networkPortSecurity[networkId] = enabled;
}

std::optional<bool>
InMemoryRecordStore::getNetworkPortSecurity(const std::string& networkId) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_tables.networkPortSecurity.find(networkId);
    if (it == m_tables.networkPortSecurity.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void
InMemoryRecordStore::setPortPortSecurity(const std::string& portId, bool enabled)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_tables.ports.count(portId))
    {
        throw PortNotFound(portId);
    }
    m_tables.portPortSecurity[portId] = enabled;
}

std::optional<bool>
InMemoryRecordStore::getPortPortSecurity(const std::string& portId) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_tables.portPortSecurity.find(portId);
    if (it == m_tables.portPortSecurity.end())
    {
        return std::nullopt;
    }
    return it->second;
}

LogicalPort
InMemoryRecordStore::createPort(const LogicalPort& port)
{
    if (port.id.empty())
    {
        throw InvalidInput("port id must not be empty");
    }
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_tables.networks.count(port.networkId))
    {
        throw NetworkNotFound(port.networkId);
    }
    if (m_tables.ports.count(port.id))
    {
        throw InvalidInput("port " + port.id + " already exists");
    }
    auto stored = stripPort(port);
    m_tables.ports.emplace(stored.id, stored);
    return stored;
}

LogicalPort
InMemoryRecordStore::getPort(const std::string& portId) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_tables.ports.find(portId);
    if (it == m_tables.ports.end())
    {
        throw PortNotFound(portId);
    }
    return it->second;
}

std::vector<LogicalPort>
InMemoryRecordStore::findPorts(const PortFilters& filters) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    std::vector<LogicalPort> result;
    for (const auto& [id, port] : m_tables.ports)
    {
        if (matches(filters.ids, id) && matches(filters.networkIds, port.networkId) &&
            matches(filters.deviceIds, port.deviceId) && matches(filters.tenantIds, port.tenantId))
        {
            result.push_back(port);
        }
    }
    return result;
}

LogicalPort
InMemoryRecordStore::updatePort(const LogicalPort& port)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    auto it = m_tables.ports.find(port.id);
    if (it == m_tables.ports.end())
    {
        throw PortNotFound(port.id);
    }
    it->second = stripPort(port);
    return it->second;
}

void
InMemoryRecordStore::deletePort(const std::string& portId)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (!m_tables.ports.erase(portId))
    {
        throw PortNotFound(portId);
    }
    m_tables.portPortSecurity.erase(portId);
}
