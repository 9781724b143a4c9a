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

// nsync_core/config/SyncConfig.hpp
#pragma once

#include "nsync_core/cluster/ControllerEndpoint.hpp"
#include "setting/AppConfig.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

/// Engine-wide options ("sync" section).
struct SyncOptions
{
    int maxPortsPerBridgedSwitch = AppConfig::MAX_LP_PER_BRIDGED_LS;
    int maxPortsPerOverlaySwitch = AppConfig::MAX_LP_PER_OVERLAY_LS;
    int concurrentConnections = AppConfig::CONCURRENT_CONNECTIONS;
    std::optional<std::string> defaultClusterName;
    bool strictConsistency = false;
    int auditIntervalSeconds = AppConfig::AUDIT_INTERVAL_SECONDS;
    bool useHttps = true;
};

/// One entry of the "clusters" array, before endpoint parsing.
struct ClusterOptions
{
    std::string name;
    std::string defaultTzUuid;
    std::optional<std::string> clusterUuid;
    std::optional<std::string> zoneId;
    EndpointDefaults endpointDefaults;
    std::vector<std::string> controllerConnections;
};

struct SyncConfig
{
    SyncOptions sync;
    std::vector<ClusterOptions> clusters;    // configuration order
    std::map<std::string, std::string> policy; // action -> rule name overrides
};

/**
 * @brief Build a SyncConfig from its JSON document.
 *
 * Structural problems (missing "clusters", a cluster without "name" or "default_tz_uuid",
 * wrong value types) raise InvalidClusterConfig. Controller connection strings are parsed
 * later, by ClusterRegistry::build().
 */
SyncConfig parseSyncConfig(const json& document);

/**
 * @brief Read and parse a JSON configuration file.
 *
 * @throws InvalidClusterConfig if the file cannot be opened or parsed.
 */
SyncConfig loadSyncConfig(const std::string& path);
