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

#include "nsync_core/allocation/SwitchAllocator.hpp"
#include "common_types/Errors.hpp"
#include "nsync_core/backend/ControllerApi.hpp"
#include "nsync_core/cluster/Cluster.hpp"
#include "utils/Logger.hpp"
#include <algorithm>

BackendSwitch
SwitchAllocator::select(const Cluster& cluster,
                        const LogicalNetwork& network,
                        const std::optional<ProviderBinding>& binding,
                        int maxPorts,
                        bool allowFragmentation) const
{
    std::vector<BackendSwitch> switches = controller_api::getSwitches(cluster, network.id);

    for (const auto& lswitch : switches)
    {
        if (lswitch.portCount < maxPorts)
        {
            return lswitch;
        }
    }
    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "No switch has available ports ({} checked)",
                        switches.size());

    if (!allowFragmentation)
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(),
                            "Maximum number of logical ports reached for logical network {}",
                            network.id);
        throw CapacityExhausted(network.id);
    }

    auto primary = std::find_if(switches.begin(), switches.end(), [&network](const BackendSwitch& s) {
        return s.uuid == network.id;
    });
    if (primary == switches.end())
    {
        throw ResourceNotFound(controller_api::switchPath(network.id));
    }
    if (!findTag(primary->tags, tag_scope::MULTI_SWITCH))
    {
        controller_api::updateSwitch(cluster,
                                     *primary,
                                     network.tenantId,
                                     {{tag_scope::MULTI_SWITCH, "True"}});
    }

    BackendSwitch fragment =
        controller_api::createSwitch(cluster,
                                     network.tenantId,
                                     network.name + "-ext-" + std::to_string(switches.size()),
                                     binding,
                                     network.id);
    bool known = std::any_of(switches.begin(), switches.end(), [&fragment](const BackendSwitch& s) {
        return s.uuid == fragment.uuid;
    });
    if (known)
    {
        throw BackendError("controller returned existing switch " + fragment.uuid +
                           " for a new fragment of network " + network.id);
    }

    SPDLOG_LOGGER_INFO(Logger::instance(),
                       "Network {} extended with switch {} on cluster {}",
                       network.id,
                       fragment.uuid,
                       cluster.name());
    return fragment;
}
