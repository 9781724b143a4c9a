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

#include "nsync_core/security/PortSecurityBinding.hpp"
#include "nsync_core/store/RecordStore.hpp"

PortSecurityBinding::PortSecurityBinding(RecordStore& store)
    : m_store(store)
{
}

bool
PortSecurityBinding::recordNetwork(const std::string& networkId, const std::optional<bool>& requested)
{
    bool enabled = requested.value_or(DEFAULT_ENABLED);
    m_store.setNetworkPortSecurity(networkId, enabled);
    return enabled;
}

void
PortSecurityBinding::updateNetwork(const std::string& networkId, bool enabled)
{
    m_store.setNetworkPortSecurity(networkId, enabled);
}

bool
PortSecurityBinding::networkFlag(const std::string& networkId) const
{
    return m_store.getNetworkPortSecurity(networkId).value_or(DEFAULT_ENABLED);
}

bool
PortSecurityBinding::resolveForPort(const std::string& networkId,
                                    const std::optional<bool>& requested) const
{
    return requested ? *requested : networkFlag(networkId);
}

void
PortSecurityBinding::recordPort(const std::string& portId, bool enabled)
{
    m_store.setPortPortSecurity(portId, enabled);
}

bool
PortSecurityBinding::updatePort(const std::string& portId, const std::optional<bool>& requested)
{
    if (requested)
    {
        m_store.setPortPortSecurity(portId, *requested);
        return *requested;
    }
    auto stored = m_store.getPortPortSecurity(portId);
    if (stored)
    {
        return *stored;
    }
    return networkFlag(m_store.getPort(portId).networkId);
}

void
PortSecurityBinding::extendNetwork(LogicalNetwork& network) const
{
    network.portSecurityEnabled = networkFlag(network.id);
}

void
PortSecurityBinding::extendPort(LogicalPort& port) const
{
    auto stored = m_store.getPortPortSecurity(port.id);
    port.portSecurityEnabled = stored ? *stored : networkFlag(port.networkId);
}
