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

// nsync_core/security/PortSecurityBinding.hpp
#pragma once

#include "common_types/NetworkTypes.hpp"
#include <optional>
#include <string>

class RecordStore;

/**
 * @brief Port security flags of networks and ports, kept in the record store side tables.
 *
 * A network records its flag at creation (enabled unless requested otherwise). A port takes
 * its explicit flag or inherits the flag of its network. Call these inside the transaction of
 * the operation they belong to.
 */
class PortSecurityBinding
{
  public:
    static constexpr bool DEFAULT_ENABLED = true;

    explicit PortSecurityBinding(RecordStore& store);

    /// Record the flag of a new network; returns the recorded value.
    bool recordNetwork(const std::string& networkId, const std::optional<bool>& requested);

    void updateNetwork(const std::string& networkId, bool enabled);

    /// Flag for a new port on @p networkId: @p requested if set, else the network's flag.
    bool resolveForPort(const std::string& networkId, const std::optional<bool>& requested) const;

    void recordPort(const std::string& portId, bool enabled);

    /// Store @p requested when set; return the port's effective flag.
    bool updatePort(const std::string& portId, const std::optional<bool>& requested);

    void extendNetwork(LogicalNetwork& network) const;
    void extendPort(LogicalPort& port) const;

  private:
    bool networkFlag(const std::string& networkId) const;

    RecordStore& m_store;
};
