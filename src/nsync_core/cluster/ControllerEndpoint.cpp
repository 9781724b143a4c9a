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

#include "nsync_core/cluster/ControllerEndpoint.hpp"
#include "utils/Utils.hpp"
#include <stdexcept>
#include <vector>

namespace
{
constexpr std::size_t SHORT_FORM_FIELDS = 2;
constexpr std::size_t FULL_FORM_FIELDS = 8;

std::chrono::seconds
parseTimeout(const std::string& field)
{
    int value = utils::parseIntStrict(field);
    if (value <= 0)
    {
        throw std::invalid_argument("timeout must be positive: " + field);
    }
    return std::chrono::seconds(value);
}

int
parseCount(const std::string& field)
{
    int value = utils::parseIntStrict(field);
    if (value < 0)
    {
        throw std::invalid_argument("count must not be negative: " + field);
    }
    return value;
}
} // namespace

ControllerEndpoint
parseControllerConnection(const std::string& connection, const EndpointDefaults& defaults)
{
    auto fields = utils::splitString(connection, ':');
    if (fields.size() != SHORT_FORM_FIELDS && fields.size() != FULL_FORM_FIELDS)
    {
        throw std::invalid_argument("expected host:port or "
                                    "host:port:user:password:req_timeout:http_timeout:"
                                    "retries:redirects, got '" +
                                    connection + "'");
    }

    ControllerEndpoint endpoint;
    endpoint.host = fields[0];
    if (endpoint.host.empty())
    {
        throw std::invalid_argument("missing controller address in '" + connection + "'");
    }

    int port = utils::parseIntStrict(fields[1]);
    if (port < 1 || port > 65535)
    {
        throw std::invalid_argument("controller port out of range in '" + connection + "'");
    }
    endpoint.port = static_cast<uint16_t>(port);

    if (fields.size() == FULL_FORM_FIELDS)
    {
        endpoint.user = fields[2];
        endpoint.password = fields[3];
        endpoint.requestTimeout = parseTimeout(fields[4]);
        endpoint.httpTimeout = parseTimeout(fields[5]);
        endpoint.retries = parseCount(fields[6]);
        endpoint.redirects = parseCount(fields[7]);
    }
    else
    {
        endpoint.user = defaults.user.value_or("");
        endpoint.password = defaults.password.value_or("");
        endpoint.requestTimeout = parseTimeout(std::to_string(defaults.requestTimeout));
        endpoint.httpTimeout = parseTimeout(std::to_string(defaults.httpTimeout));
        endpoint.retries = parseCount(std::to_string(defaults.retries));
        endpoint.redirects = parseCount(std::to_string(defaults.redirects));
    }

    if (endpoint.user.empty() || endpoint.password.empty())
    {
        throw std::invalid_argument("missing credentials for controller " + endpoint.address());
    }
    return endpoint;
}
