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

// common_types/BackendTypes.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * @brief Tag scopes NetSync writes onto controller resources.
 *
 * LOGICAL_PORT_ID is the join key between a local port record and its backend port.
 * DEVICE_ID tags carry the SHA-1 hex digest of the device identifier, not the raw id.
 */
namespace tag_scope
{
inline const std::string TENANT_ID = "tenant-id";
inline const std::string LOGICAL_NETWORK_ID = "logical-network-id";
inline const std::string LOGICAL_PORT_ID = "logical-port-id";
inline const std::string DEVICE_ID = "device-id";
inline const std::string MULTI_SWITCH = "multi-switch";
} // namespace tag_scope

struct Tag
{
    std::string scope;
    std::string value;

    bool operator==(const Tag& other) const
    {
        return scope == other.scope && value == other.value;
    }
};

/// @return the value of the first tag under @p scope, if any.
inline std::optional<std::string>
findTag(const std::vector<Tag>& tags, const std::string& scope)
{
    for (const auto& tag : tags)
    {
        if (tag.scope == scope)
        {
            return tag.value;
        }
    }
    return std::nullopt;
}

/**
 * @brief Controller view of a logical switch (observed, never owned).
 *
 * The primary switch of a network has uuid == network id, fragment switches carry the
 * network id under tag_scope::LOGICAL_NETWORK_ID.
 */
struct BackendSwitch
{
    std::string uuid;
    std::string displayName;
    std::vector<Tag> tags;
    bool fabricStatus = false;
    int portCount = 0;
};

/// Controller view of a logical port (observed, never owned).
struct BackendPort
{
    std::string uuid;
    std::string switchUuid;
    std::string displayName;
    std::vector<Tag> tags;
    bool adminStatusEnabled = true;
    bool fabricStatusUp = false;
};

inline void
to_json(json& j, const Tag& t)
{
    j = json{{"scope", t.scope}, {"tag", t.value}};
}

inline void
from_json(const json& j, Tag& t)
{
    t.scope = j.at("scope").get<std::string>();
    t.value = j.at("tag").get<std::string>();
}

/**
 * Switch documents come back as
 * {"uuid", "display_name", "tags", "_relations": {"LogicalSwitchStatus":
 *  {"fabric_status", "lport_count"}}}; missing status relations read as down/empty.
 */
inline void
from_json(const json& j, BackendSwitch& s)
{
    s.uuid = j.at("uuid").get<std::string>();
    s.displayName = j.value("display_name", "");
    s.tags = j.value("tags", std::vector<Tag>{});
    s.fabricStatus = false;
    s.portCount = 0;
    if (j.contains("_relations") && j["_relations"].contains("LogicalSwitchStatus"))
    {
        const auto& status = j["_relations"]["LogicalSwitchStatus"];
        s.fabricStatus = status.value("fabric_status", false);
        s.portCount = status.value("lport_count", 0);
    }
}

/**
 * Port documents carry their location in "_href"
 * ("/ws.v1/lswitch/<switch uuid>/lport/<port uuid>"); the owning switch uuid is taken from it.
 */
inline void
from_json(const json& j, BackendPort& p)
{
    p.uuid = j.at("uuid").get<std::string>();
    p.displayName = j.value("display_name", "");
    p.tags = j.value("tags", std::vector<Tag>{});
    p.adminStatusEnabled = j.value("admin_status_enabled", true);
    p.fabricStatusUp = false;
    if (j.contains("_relations") && j["_relations"].contains("LogicalPortStatus"))
    {
        p.fabricStatusUp = j["_relations"]["LogicalPortStatus"].value("fabric_status_up", false);
    }

    p.switchUuid.clear();
    const std::string href = j.value("_href", "");
    const std::string marker = "/lswitch/";
    auto begin = href.find(marker);
    if (begin != std::string::npos)
    {
        begin += marker.size();
        auto end = href.find('/', begin);
        p.switchUuid = href.substr(begin, end == std::string::npos ? end : end - begin);
    }
}
