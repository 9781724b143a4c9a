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

// nsync_core/allocation/SwitchAllocator.hpp
#pragma once

#include "common_types/BackendTypes.hpp"
#include "common_types/NetworkTypes.hpp"
#include <optional>

class Cluster;

/**
 * @brief Picks the backend switch a new port of a network is placed on.
 *
 * Capacity is read at selection time and not reserved: two concurrent selections may both
 * pick the last free slot of a switch.
 */
class SwitchAllocator
{
  public:
    /**
     * @brief Return a switch of @p network with fewer than @p maxPorts ports.
     *
     * Switches are scanned primary first, then fragments in controller order. When all are
     * full and @p allowFragmentation is set, the primary is tagged multi-switch (once) and a
     * new fragment switch "<network name>-ext-<n>" carrying @p binding is created.
     *
     * @throws CapacityExhausted when all switches are full and fragmentation is disallowed.
     * @throws ResourceNotFound when the network's primary switch is missing on @p cluster.
     * @throws BackendError on controller failures.
     */
    BackendSwitch select(const Cluster& cluster,
                         const LogicalNetwork& network,
                         const std::optional<ProviderBinding>& binding,
                         int maxPorts,
                         bool allowFragmentation) const;
};
