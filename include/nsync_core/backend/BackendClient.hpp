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

// nsync_core/backend/BackendClient.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

/**
 * @brief Tag constraint of a controller query.
 *
 * Filters sharing a scope are OR-ed, filters of different scopes are AND-ed.
 * A filter without value matches any resource carrying a tag under that scope.
 */
struct TagFilter
{
    std::string scope;
    std::optional<std::string> value;
};

/**
 * @brief A collection query against the controller.
 *
 * path addresses a collection (e.g. "/ws.v1/lswitch" or "/ws.v1/lswitch/<uuid>/lport",
 * where "*" stands for every switch). fields and relations restrict and extend the returned
 * documents.
 */
struct QueryRequest
{
    std::string path;
    std::vector<std::string> fields;
    std::vector<std::string> relations;
    std::vector<TagFilter> tags;
};

/// One page of query results; nextCursor is set while more pages remain.
struct QueryPage
{
    std::vector<json> results;
    std::optional<std::string> nextCursor;
};

/**
 * @brief Capability interface to one cluster's controller set.
 *
 * Implementations own retry, redirect, failover, timeout and connection-limit policy; callers
 * treat every call as a single logical operation that either returns or throws.
 *
 * Error contract:
 *  - ResourceNotFound when the controller reports the addressed resource is absent,
 *  - BackendError for every other failure (transport, authentication, HTTP >= 400).
 *
 * Implementations must be safe to call from multiple threads.
 */
class BackendClient
{
  public:
    virtual ~BackendClient() = default;

    /**
     * @brief Fetch one page of a collection.
     *
     * @param request Collection path and filters.
     * @param cursor  Cursor returned by the previous page, std::nullopt for the first page.
     */
    virtual QueryPage query(const QueryRequest& request,
                            const std::optional<std::string>& cursor) = 0;

    /// Read a single resource, optionally expanding relations.
    virtual json read(const std::string& path, const std::vector<std::string>& relations) = 0;

    /// Create a resource under a collection; returns the created document (with "uuid").
    virtual json create(const std::string& path, const json& spec) = 0;

    /// Replace the mutable fields of a resource; returns the updated document.
    virtual json update(const std::string& path, const json& fields) = 0;

    virtual void remove(const std::string& path) = 0;

    /// Set the attachment of a port resource.
    virtual json attach(const std::string& path, const json& attachment) = 0;
};
