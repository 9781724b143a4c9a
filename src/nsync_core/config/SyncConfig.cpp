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

#include "nsync_core/config/SyncConfig.hpp"
#include "common_types/Errors.hpp"
#include "utils/Logger.hpp"
#include <fstream>

namespace
{
const std::string GLOBAL_SECTION = "<global>";

std::optional<std::string>
optionalString(const json& j, const char* key)
{
    if (!j.contains(key) || j.at(key).is_null())
    {
        return std::nullopt;
    }
    return j.at(key).get<std::string>();
}

SyncOptions
parseSyncOptions(const json& j)
{
    SyncOptions options;
    options.maxPortsPerBridgedSwitch =
        j.value("max_lp_per_bridged_ls", options.maxPortsPerBridgedSwitch);
    options.maxPortsPerOverlaySwitch =
        j.value("max_lp_per_overlay_ls", options.maxPortsPerOverlaySwitch);
    options.concurrentConnections =
        j.value("concurrent_connections", options.concurrentConnections);
    options.defaultClusterName = optionalString(j, "default_cluster_name");
    options.strictConsistency = j.value("strict_consistency", options.strictConsistency);
    options.auditIntervalSeconds = j.value("audit_interval_seconds", options.auditIntervalSeconds);
    options.useHttps = j.value("use_https", options.useHttps);

    if (options.maxPortsPerBridgedSwitch < 1 || options.maxPortsPerOverlaySwitch < 1)
    {
        throw InvalidClusterConfig(GLOBAL_SECTION, "port limits per switch must be positive");
    }
    if (options.concurrentConnections < 1)
    {
        throw InvalidClusterConfig(GLOBAL_SECTION, "concurrent_connections must be positive");
    }
    return options;
}

ClusterOptions
parseClusterOptions(const json& j)
{
    ClusterOptions options;
    if (!j.contains("name"))
    {
        throw InvalidClusterConfig("<unnamed>", "cluster entry without name");
    }
    options.name = j.at("name").get<std::string>();

    if (!j.contains("default_tz_uuid"))
    {
        throw InvalidClusterConfig(options.name, "default_tz_uuid is required");
    }
    options.defaultTzUuid = j.at("default_tz_uuid").get<std::string>();
    options.clusterUuid = optionalString(j, "cluster_uuid");
    options.zoneId = optionalString(j, "zone_id");

    options.endpointDefaults.user = optionalString(j, "user");
    options.endpointDefaults.password = optionalString(j, "password");
    options.endpointDefaults.requestTimeout =
        j.value("req_timeout", AppConfig::REQUEST_TIMEOUT_SECONDS);
    options.endpointDefaults.httpTimeout = j.value("http_timeout", AppConfig::HTTP_TIMEOUT_SECONDS);
    options.endpointDefaults.retries = j.value("retries", AppConfig::RETRIES);
    options.endpointDefaults.redirects = j.value("redirects", AppConfig::REDIRECTS);

    options.controllerConnections =
        j.value("controllers", std::vector<std::string>{});
    return options;
}
} // namespace

SyncConfig
parseSyncConfig(const json& document)
{
    SyncConfig config;
    try
    {
        if (document.contains("sync"))
        {
            config.sync = parseSyncOptions(document.at("sync"));
        }

        if (!document.contains("clusters") || !document.at("clusters").is_array())
        {
            throw InvalidClusterConfig(GLOBAL_SECTION, "a 'clusters' array is required");
        }
        for (const auto& clusterJson : document.at("clusters"))
        {
            config.clusters.push_back(parseClusterOptions(clusterJson));
        }

        if (document.contains("policy"))
        {
            config.policy = document.at("policy").get<std::map<std::string, std::string>>();
        }
    }
    catch (const json::exception& e)
    {
        throw InvalidClusterConfig(GLOBAL_SECTION, std::string("malformed document: ") + e.what());
    }

    SPDLOG_LOGGER_DEBUG(Logger::instance(),
                        "Loaded {} cluster definition(s), default cluster '{}'",
                        config.clusters.size(),
                        config.sync.defaultClusterName.value_or(""));
    return config;
}

SyncConfig
loadSyncConfig(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SPDLOG_LOGGER_ERROR(Logger::instance(), "Cannot open configuration file: {}", path);
        throw InvalidClusterConfig(GLOBAL_SECTION, "cannot open configuration file " + path);
    }

    json document;
    try
    {
        file >> document;
    }
    catch (const json::parse_error& err)
    {
        throw InvalidClusterConfig(GLOBAL_SECTION,
                                   "cannot parse " + path + ": " + std::string(err.what()));
    }
    SPDLOG_LOGGER_INFO(Logger::instance(), "Load configuration file {}", path);
    return parseSyncConfig(document);
}
