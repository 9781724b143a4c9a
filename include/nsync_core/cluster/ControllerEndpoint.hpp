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

// nsync_core/cluster/ControllerEndpoint.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Connection descriptor of one SDN controller.
 *
 * Immutable once built; owned by its Cluster.
 */
struct ControllerEndpoint
{
    std::string host;
    uint16_t port = 443;
    std::string user;
    std::string password;
    std::chrono::seconds requestTimeout{30}; // whole API request, retries included
    std::chrono::seconds httpTimeout{10};    // one connection attempt
    int retries = 2;
    int redirects = 2;

    std::string address() const
    {
        return host + ":" + std::to_string(port);
    }
};

/// Values applied to "host:port" connection strings that omit credentials and timeouts.
struct EndpointDefaults
{
    std::optional<std::string> user;
    std::optional<std::string> password;
    int requestTimeout = 30;
    int httpTimeout = 10;
    int retries = 2;
    int redirects = 2;
};

/**
 * @brief Parse a controller connection string.
 *
 * Accepted forms:
 *  - "host:port"  (credentials and timeouts taken from @p defaults),
 *  - "host:port:user:password:req_timeout:http_timeout:retries:redirects".
 *
 * @throws std::invalid_argument on a malformed address, port, numeric field, or missing
 *         credentials.
 */
ControllerEndpoint parseControllerConnection(const std::string& connection,
                                             const EndpointDefaults& defaults);
