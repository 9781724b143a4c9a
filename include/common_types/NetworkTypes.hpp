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

// common_types/NetworkTypes.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * @brief Provider network types accepted for a logical network.
 *
 * FLAT and VLAN are bridged onto a physical L2 domain, GRE and STT are overlay tunnels.
 */
enum class NetworkType
{
    FLAT,
    VLAN,
    GRE,
    STT
};

inline std::string
to_string(NetworkType t)
{
    switch (t)
    {
    case NetworkType::FLAT:
        return "flat";
    case NetworkType::VLAN:
        return "vlan";
    case NetworkType::GRE:
        return "gre";
    case NetworkType::STT:
        return "stt";
    }
    return "unknown";
}

/// @return std::nullopt for names outside {flat, vlan, gre, stt}.
inline std::optional<NetworkType>
networkTypeFromString(const std::string& s)
{
    if (s == "flat")
    {
        return NetworkType::FLAT;
    }
    if (s == "vlan")
    {
        return NetworkType::VLAN;
    }
    if (s == "gre")
    {
        return NetworkType::GRE;
    }
    if (s == "stt")
    {
        return NetworkType::STT;
    }
    return std::nullopt;
}

inline bool
isBridged(NetworkType t)
{
    return t == NetworkType::FLAT || t == NetworkType::VLAN;
}

constexpr int MIN_VLAN_TAG = 1;
constexpr int MAX_VLAN_TAG = 4094;

/// Derived operational status of a network or port, copied from the controller.
enum class ResourceStatus
{
    ACTIVE,
    DOWN
};

inline std::string
to_string(ResourceStatus s)
{
    return s == ResourceStatus::ACTIVE ? "ACTIVE" : "DOWN";
}

/**
 * @brief Provider binding of a network: how it maps onto physical transport.
 *
 * physicalNetwork carries the transport zone uuid on the controller side.
 * segmentationId is present only for VLAN bindings.
 */
struct ProviderBinding
{
    NetworkType networkType = NetworkType::STT;
    std::optional<std::string> physicalNetwork;
    std::optional<int> segmentationId;
};

/// Row of the provider binding side table.
struct NetworkBinding
{
    std::string networkId;
    ProviderBinding binding;
};

struct FixedIp
{
    std::string subnetId;
    std::string ipAddress;

    bool operator==(const FixedIp& other) const
    {
        return subnetId == other.subnetId && ipAddress == other.ipAddress;
    }
};

struct LogicalNetwork
{
    std::string id;
    std::string tenantId;
    std::string name;
    bool adminStateUp = true;
    std::optional<std::string> zoneId;

    // Projections filled by the engine, not stored with the record.
    std::optional<ProviderBinding> provider;
    std::optional<bool> portSecurityEnabled;
    std::optional<ResourceStatus> status;
};

struct LogicalPort
{
    std::string id;
    std::string networkId;
    std::string tenantId;
    std::string name;
    std::string deviceId;
    bool adminStateUp = true;
    std::string macAddress;
    std::vector<FixedIp> fixedIps;
    std::optional<std::string> zoneId;
    std::optional<std::string> clusterName; // owning cluster, set at creation

    std::optional<bool> portSecurityEnabled;
    std::optional<ResourceStatus> status;
};

/**
 * @brief Create request for a network.
 *
 * Provider attributes are kept as raw values so the engine can reject unsupported types and
 * inconsistent combinations with InvalidInput.
 */
struct NetworkCreateRequest
{
    std::optional<std::string> tenantId;
    std::string name;
    bool adminStateUp = true;
    std::optional<std::string> networkType;
    std::optional<std::string> physicalNetwork;
    std::optional<int> segmentationId;
    std::optional<bool> portSecurityEnabled;
    std::optional<std::string> zoneId;

    bool hasProviderAttributes() const
    {
        return networkType.has_value() || physicalNetwork.has_value() ||
               segmentationId.has_value();
    }
};

struct NetworkUpdateRequest
{
    std::optional<std::string> name;
    std::optional<bool> adminStateUp;
    std::optional<bool> portSecurityEnabled;
};

struct PortCreateRequest
{
    std::string networkId;
    std::optional<std::string> tenantId;
    std::string name;
    std::string deviceId;
    bool adminStateUp = true;
    std::optional<std::string> macAddress;
    std::vector<FixedIp> fixedIps;
    std::optional<bool> portSecurityEnabled;
    std::optional<std::string> zoneId;
};

struct PortUpdateRequest
{
    std::optional<std::string> name;
    std::optional<std::string> deviceId;
    std::optional<bool> adminStateUp;
    std::optional<std::vector<FixedIp>> fixedIps;
    std::optional<bool> portSecurityEnabled;
};

/// Field-equality filters; an empty vector means "no constraint" on that field.
struct NetworkFilters
{
    std::vector<std::string> ids;
    std::vector<std::string> tenantIds;
    std::vector<std::string> names;
};

struct PortFilters
{
    std::vector<std::string> ids;
    std::vector<std::string> networkIds;
    std::vector<std::string> deviceIds;
    std::vector<std::string> tenantIds;
};

/**
 * @brief Outcome of a cross-reference between local records and controller resources.
 *
 * unmatchedLocal counts local records with no backend counterpart, unclaimedBackend counts
 * backend resources no local record explains.
 */
struct DriftReport
{
    std::size_t unmatchedLocalNetworks = 0;
    std::size_t unclaimedBackendSwitches = 0;
    std::size_t unmatchedLocalPorts = 0;
    std::size_t unclaimedBackendPorts = 0;

    bool inSync() const
    {
        return unmatchedLocalNetworks == 0 && unclaimedBackendSwitches == 0 &&
               unmatchedLocalPorts == 0 && unclaimedBackendPorts == 0;
    }
};

inline void
to_json(json& j, const FixedIp& ip)
{
    j = json{{"subnet_id", ip.subnetId}, {"ip_address", ip.ipAddress}};
}

inline void
from_json(const json& j, FixedIp& ip)
{
    ip.subnetId = j.value("subnet_id", "");
    ip.ipAddress = j.at("ip_address").get<std::string>();
}

inline void
to_json(json& j, const LogicalNetwork& n)
{
    j = json{{"id", n.id},
             {"tenant_id", n.tenantId},
             {"name", n.name},
             {"admin_state_up", n.adminStateUp}};
    if (n.provider)
    {
        j["provider:network_type"] = to_string(n.provider->networkType);
        j["provider:physical_network"] =
            n.provider->physicalNetwork ? json(*n.provider->physicalNetwork) : json(nullptr);
        j["provider:segmentation_id"] =
            n.provider->segmentationId ? json(*n.provider->segmentationId) : json(nullptr);
    }
    if (n.portSecurityEnabled)
    {
        j["port_security_enabled"] = *n.portSecurityEnabled;
    }
    if (n.status)
    {
        j["status"] = to_string(*n.status);
    }
}

inline void
to_json(json& j, const LogicalPort& p)
{
    j = json{{"id", p.id},
             {"network_id", p.networkId},
             {"tenant_id", p.tenantId},
             {"name", p.name},
             {"device_id", p.deviceId},
             {"admin_state_up", p.adminStateUp},
             {"mac_address", p.macAddress},
             {"fixed_ips", p.fixedIps}};
    if (p.portSecurityEnabled)
    {
        j["port_security_enabled"] = *p.portSecurityEnabled;
    }
    if (p.status)
    {
        j["status"] = to_string(*p.status);
    }
}
