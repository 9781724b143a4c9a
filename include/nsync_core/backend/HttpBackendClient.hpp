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

// nsync_core/backend/HttpBackendClient.hpp
#pragma once

#include "nsync_core/backend/BackendClient.hpp"
#include "nsync_core/cluster/ControllerEndpoint.hpp"
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct HttpClientOptions
{
    bool useHttps = true;
    int concurrentConnections = 5;
    int pageLength = 1000;
};

/**
 * @brief BackendClient speaking JSON over HTTP(S) to a cluster's controllers (Boost.Beast).
 *
 * Request policy, all of it owned here and invisible to callers:
 *  - session: a login (POST /ws.v1/login) per endpoint; the session cookie is reused and
 *    refreshed once when the controller answers 401/403;
 *  - failover: transport errors and 5xx answers move the client to the next endpoint
 *    (primary first), up to retries + 1 attempts per request;
 *  - redirects: 3xx answers are followed up to the endpoint's redirect limit;
 *  - timeouts: httpTimeout bounds connecting, requestTimeout bounds each exchange;
 *  - concurrency: at most concurrentConnections requests are in flight per client.
 *
 * Thread-safe.
 */
class HttpBackendClient : public BackendClient
{
  public:
    HttpBackendClient(std::vector<ControllerEndpoint> endpoints, HttpClientOptions options);

    QueryPage query(const QueryRequest& request, const std::optional<std::string>& cursor) override;
    json read(const std::string& path, const std::vector<std::string>& relations) override;
    json create(const std::string& path, const json& spec) override;
    json update(const std::string& path, const json& fields) override;
    void remove(const std::string& path) override;
    json attach(const std::string& path, const json& attachment) override;

    /// Request target (path plus encoded query string) for one page of @p request.
    static std::string buildQueryTarget(const QueryRequest& request,
                                        const std::optional<std::string>& cursor,
                                        int pageLength);

    static std::string urlEncode(const std::string& value);

    /**
     * @brief Apply a redirect Location to @p current and return the new request target.
     *
     * A relative location keeps the endpoint; an absolute one replaces host and port.
     *
     * @throws BackendError if the location has no host or a port outside 1-65535.
     */
    static std::string resolveRedirect(ControllerEndpoint& current, const std::string& location);

  private:
    struct HttpResult
    {
        unsigned status = 0;
        std::string body;
        std::string location;
        std::string setCookie;
    };

    json execute(const std::string& method, const std::string& target, const std::optional<json>& body);

    /// One exchange with redirects followed; throws boost::system::system_error on I/O failure.
    HttpResult send(const ControllerEndpoint& endpoint,
                    const std::string& method,
                    const std::string& target,
                    const std::string& body,
                    const std::string& contentType,
                    const std::string& cookie);

    HttpResult sendOnce(const ControllerEndpoint& endpoint,
                        const std::string& method,
                        const std::string& target,
                        const std::string& body,
                        const std::string& contentType,
                        const std::string& cookie);

    std::string login(std::size_t endpointIndex);
    std::string sessionCookie(std::size_t endpointIndex);
    void failover(std::size_t fromIndex);

    void acquireSlot();
    void releaseSlot();

    std::vector<ControllerEndpoint> m_endpoints;
    HttpClientOptions m_options;

    std::mutex m_stateMutex;
    std::size_t m_activeEndpoint = 0;
    std::vector<std::string> m_cookies;

    std::mutex m_slotMutex;
    std::condition_variable m_slotCv;
    int m_inFlight = 0;
};
