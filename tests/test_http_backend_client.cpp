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

#include "TestSupport.hpp"
#include "common_types/Errors.hpp"
#include "nsync_core/backend/HttpBackendClient.hpp"
#include <catch2/catch.hpp>

using namespace test_support;

TEST_CASE("urlEncode escapes reserved characters", "[http]")
{
    REQUIRE(HttpBackendClient::urlEncode("abc-_.~09") == "abc-_.~09");
    REQUIRE(HttpBackendClient::urlEncode("a b") == "a%20b");
    REQUIRE(HttpBackendClient::urlEncode("x=y&z") == "x%3Dy%26z");
    REQUIRE(HttpBackendClient::urlEncode("/") == "%2F");
}

TEST_CASE("buildQueryTarget encodes fields, relations, tags and paging", "[http]")
{
    QueryRequest request{"/ws.v1/lswitch/*/lport",
                         {"uuid", "tags"},
                         {"LogicalPortStatus"},
                         {{"logical-network-id", std::string("net 1")}, {"logical-port-id", std::nullopt}}};

    SECTION("first page")
    {
        REQUIRE(HttpBackendClient::buildQueryTarget(request, std::nullopt, 1000) ==
                "/ws.v1/lswitch/*/lport?fields=uuid,tags&relations=LogicalPortStatus"
                "&tag=net%201&tag_scope=logical-network-id&tag_scope=logical-port-id"
                "&_page_length=1000");
    }
    SECTION("next page carries the cursor")
    {
        std::string target = HttpBackendClient::buildQueryTarget(request, std::string("c/2"), 10);
        REQUIRE(target.find("&_page_length=10&_page_cursor=c%2F2") != std::string::npos);
    }
    SECTION("bare collection")
    {
        QueryRequest bare{"/ws.v1/lswitch", {}, {}, {}};
        REQUIRE(HttpBackendClient::buildQueryTarget(bare, std::nullopt, 5) ==
                "/ws.v1/lswitch?_page_length=5");
    }
}

TEST_CASE("HttpBackendClient refuses an empty endpoint list", "[http]")
{
    REQUIRE_THROWS_AS(HttpBackendClient({}, HttpClientOptions{}), std::invalid_argument);
}

TEST_CASE("HttpBackendClient fails over and reports unreachable controllers", "[http]")
{
    LogCapture logs;
    EndpointDefaults defaults;
    defaults.user = "admin";
    defaults.password = "secret";
    defaults.httpTimeout = 1;
    defaults.requestTimeout = 1;
    defaults.retries = 1;

    HttpClientOptions options;
    options.useHttps = false;
    HttpBackendClient client({parseControllerConnection("127.0.0.1:1", defaults),
                              parseControllerConnection("127.0.0.1:2", defaults)},
                             options);

    REQUIRE_THROWS_AS(client.read("/ws.v1/lswitch/x", {}), BackendError);
    REQUIRE(logs.contains("127.0.0.1:1"));
    REQUIRE(logs.contains("127.0.0.1:2"));
    REQUIRE(logs.contains("failed after 2 attempt(s)"));
}

TEST_CASE("resolveRedirect follows relative and absolute locations", "[http]")
{
    ControllerEndpoint endpoint = parseControllerConnection("10.0.0.1:443", EndpointDefaults{});

    SECTION("relative location keeps the endpoint")
    {
        REQUIRE(HttpBackendClient::resolveRedirect(endpoint, "/ws.v1/lswitch/s1") == "/ws.v1/lswitch/s1");
        REQUIRE(endpoint.host == "10.0.0.1");
        REQUIRE(endpoint.port == 443);
    }
    SECTION("absolute location with explicit port")
    {
        REQUIRE(HttpBackendClient::resolveRedirect(endpoint, "https://10.0.0.2:8443/ws.v1/x") == "/ws.v1/x");
        REQUIRE(endpoint.host == "10.0.0.2");
        REQUIRE(endpoint.port == 8443);
    }
    SECTION("absolute location without port or path uses the scheme default")
    {
        REQUIRE(HttpBackendClient::resolveRedirect(endpoint, "http://10.0.0.3") == "/");
        REQUIRE(endpoint.host == "10.0.0.3");
        REQUIRE(endpoint.port == 80);
    }
}

TEST_CASE("resolveRedirect rejects malformed locations as backend errors", "[http]")
{
    ControllerEndpoint endpoint = parseControllerConnection("10.0.0.1:443", EndpointDefaults{});

    REQUIRE_THROWS_AS(HttpBackendClient::resolveRedirect(endpoint, "https://10.0.0.2:abc/x"), BackendError);
    REQUIRE_THROWS_AS(HttpBackendClient::resolveRedirect(endpoint, "https://10.0.0.2:/x"), BackendError);
    REQUIRE_THROWS_AS(HttpBackendClient::resolveRedirect(endpoint, "https://10.0.0.2:99999999999/x"),
                      BackendError);
    REQUIRE_THROWS_AS(HttpBackendClient::resolveRedirect(endpoint, "https://10.0.0.2:70000/x"), BackendError);
    REQUIRE_THROWS_AS(HttpBackendClient::resolveRedirect(endpoint, "https://10.0.0.2:0/x"), BackendError);
    REQUIRE_THROWS_AS(HttpBackendClient::resolveRedirect(endpoint, "https://10.0.0.2:+443/x"), BackendError);
    REQUIRE_THROWS_AS(HttpBackendClient::resolveRedirect(endpoint, "https://:443/x"), BackendError);

    // A rejected location leaves the endpoint untouched
    REQUIRE(endpoint.host == "10.0.0.1");
    REQUIRE(endpoint.port == 443);
}

TEST_CASE("HttpBackendClient reports an unencodable body as a backend error", "[http]")
{
    HttpClientOptions options;
    options.useHttps = false;
    HttpBackendClient client({parseControllerConnection("127.0.0.1:1", EndpointDefaults{})}, options);

    json spec{{"display_name", std::string("abc\xc3")}};
    REQUIRE_THROWS_WITH(client.create("/ws.v1/lswitch", spec), Catch::Contains("Cannot encode"));
    REQUIRE_THROWS_AS(client.create("/ws.v1/lswitch", spec), BackendError);
}
