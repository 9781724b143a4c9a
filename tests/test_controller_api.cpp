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
#include "nsync_core/backend/ControllerApi.hpp"
#include "nsync_core/cluster/Cluster.hpp"
#include "utils/Utils.hpp"
#include <catch2/catch.hpp>
#include <algorithm>
#include <deque>

using namespace test_support;

namespace
{
std::shared_ptr<Cluster>
makeCluster(const std::string& name, const std::shared_ptr<BackendClient>& client)
{
    auto cluster = std::make_shared<Cluster>(name, ClusterParameters{"tz-" + name, std::nullopt, std::nullopt});
    cluster->addController(parseControllerConnection("192.0.2.1:443:admin:secret:30:10:2:2", {}));
    cluster->bindClient(client);
    return cluster;
}

/// Replays a fixed sequence of query pages.
class ScriptedClient : public BackendClient
{
  public:
    std::deque<QueryPage> pages;
    std::vector<std::optional<std::string>> cursors;
    std::vector<std::string> lastFields;

    QueryPage query(const QueryRequest& request, const std::optional<std::string>& cursor) override
    {
        cursors.push_back(cursor);
        lastFields = request.fields;
        QueryPage page = pages.front();
        pages.pop_front();
        return page;
    }
    json read(const std::string& path, const std::vector<std::string>&) override
    {
        throw ResourceNotFound(path);
    }
    json create(const std::string&, const json&) override
    {
        return json::object();
    }
    json update(const std::string&, const json&) override
    {
        return json::object();
    }
    void remove(const std::string&) override
    {
    }
    json attach(const std::string&, const json&) override
    {
        return json::object();
    }
};

LogicalPort
samplePort(const std::string& id, const std::string& networkId)
{
    LogicalPort port;
    port.id = id;
    port.networkId = networkId;
    port.tenantId = "tenant-a";
    port.name = "port-" + id;
    port.deviceId = "vm-1";
    port.macAddress = "fa:16:3e:00:00:01";
    port.fixedIps = {FixedIp{"subnet-1", "10.0.0.5"}};
    return port;
}
} // namespace

TEST_CASE("queryAllPages follows cursors and drops duplicate uuids", "[controller_api]")
{
    ScriptedClient client;
    client.pages.push_back(QueryPage{{json{{"uuid", "a"}}, json{{"uuid", "b"}}}, std::string("c1")});
    client.pages.push_back(QueryPage{{json{{"uuid", "b"}}, json{{"uuid", "c"}}}, std::nullopt});

    auto results = controller_api::queryAllPages(client, QueryRequest{"/ws.v1/lswitch", {}, {}, {}});

    REQUIRE(results.size() == 3);
    REQUIRE(results[2]["uuid"] == "c");
    REQUIRE(client.cursors.size() == 2);
    REQUIRE_FALSE(client.cursors[0]);
    REQUIRE(client.cursors[1] == std::optional<std::string>("c1"));
}

TEST_CASE("queryAllPages stops on a repeated cursor", "[controller_api]")
{
    LogCapture logs;
    ScriptedClient client;
    client.pages.push_back(QueryPage{{json{{"uuid", "a"}}}, std::string("same")});
    client.pages.push_back(QueryPage{{json{{"uuid", "b"}}}, std::string("same")});

    auto results = controller_api::queryAllPages(client, QueryRequest{"/ws.v1/lswitch", {}, {}, {}});
    REQUIRE(results.size() == 2);
    REQUIRE(logs.contains("twice"));
}

TEST_CASE("createSwitch encodes the provider binding", "[controller_api]")
{
    auto fake = std::make_shared<FakeBackendClient>();
    auto cluster = makeCluster("c0", fake);

    SECTION("overlay network uses stt on the default transport zone")
    {
        auto lswitch = controller_api::createSwitch(*cluster, "tenant-a", "net", std::nullopt);
        json zones = fake->switchTransportZones(lswitch.uuid);
        REQUIRE(zones[0]["zone_uuid"] == "tz-c0");
        REQUIRE(zones[0]["transport_type"] == "stt");
        REQUIRE(findTag(lswitch.tags, tag_scope::TENANT_ID) == std::optional<std::string>("tenant-a"));
        REQUIRE_FALSE(findTag(lswitch.tags, tag_scope::LOGICAL_NETWORK_ID));
    }
    SECTION("vlan network is bridged with a vlan translation")
    {
        ProviderBinding binding{NetworkType::VLAN, std::string("phys1"), 100};
        auto lswitch = controller_api::createSwitch(*cluster, "tenant-a", "net", binding);
        json zones = fake->switchTransportZones(lswitch.uuid);
        REQUIRE(zones[0]["zone_uuid"] == "phys1");
        REQUIRE(zones[0]["transport_type"] == "bridge");
        REQUIRE(zones[0]["binding_config"]["vlan_translation"][0]["transport"] == 100);
    }
    SECTION("fragment switch is tagged with its network")
    {
        auto lswitch = controller_api::createSwitch(*cluster, "tenant-a", "net-ext-1", std::nullopt,
                                                    std::string("net-id"));
        REQUIRE(findTag(lswitch.tags, tag_scope::LOGICAL_NETWORK_ID) ==
                std::optional<std::string>("net-id"));
    }
}

TEST_CASE("getSwitches returns the primary then its fragments", "[controller_api]")
{
    auto fake = std::make_shared<FakeBackendClient>();
    auto cluster = makeCluster("c0", fake);
    auto primary = controller_api::createSwitch(*cluster, "tenant-a", "net", std::nullopt);

    REQUIRE(controller_api::getSwitches(*cluster, primary.uuid).size() == 1);

    controller_api::updateSwitch(*cluster, primary, "tenant-a", {{tag_scope::MULTI_SWITCH, "True"}});
    auto fragment = controller_api::createSwitch(*cluster, "tenant-a", "net-ext-1", std::nullopt,
                                                 primary.uuid);

    auto switches = controller_api::getSwitches(*cluster, primary.uuid);
    REQUIRE(switches.size() == 2);
    REQUIRE(switches[0].uuid == primary.uuid);
    REQUIRE(switches[1].uuid == fragment.uuid);
    REQUIRE(findTag(switches[0].tags, tag_scope::TENANT_ID) == std::optional<std::string>("tenant-a"));

    REQUIRE_THROWS_AS(controller_api::getSwitches(*cluster, "missing"), ResourceNotFound);
}

TEST_CASE("createPort tags the join key and the hashed device id", "[controller_api]")
{
    auto fake = std::make_shared<FakeBackendClient>();
    auto cluster = makeCluster("c0", fake);
    auto lswitch = controller_api::createSwitch(*cluster, "tenant-a", "net", std::nullopt);

    auto port = samplePort("p1", lswitch.uuid);
    auto backendPort = controller_api::createPort(*cluster, lswitch.uuid, port, true);

    REQUIRE(backendPort.switchUuid == lswitch.uuid);
    REQUIRE(findTag(backendPort.tags, tag_scope::LOGICAL_PORT_ID) == std::optional<std::string>("p1"));
    REQUIRE(findTag(backendPort.tags, tag_scope::DEVICE_ID) ==
            std::optional<std::string>(utils::sha1Hex("vm-1")));

    json document = fake->portDocumentOf(backendPort.uuid);
    REQUIRE(document["allowed_address_pairs"].size() == 1);
    REQUIRE(document["allowed_address_pairs"][0]["ip_address"] == "10.0.0.5");

    controller_api::updatePort(*cluster, backendPort, port, false);
    REQUIRE(fake->portDocumentOf(backendPort.uuid)["allowed_address_pairs"].empty());

    controller_api::plugInterface(*cluster, lswitch.uuid, backendPort.uuid,
                                  controller_api::VIF_ATTACHMENT, "p1");
    REQUIRE(fake->portAttachment(backendPort.uuid)["vif_uuid"] == "p1");
}

TEST_CASE("queryPorts filters by network, device and join tag", "[controller_api]")
{
    auto fake = std::make_shared<FakeBackendClient>();
    auto cluster = makeCluster("c0", fake);
    auto first = controller_api::createSwitch(*cluster, "tenant-a", "n1", std::nullopt);
    auto second = controller_api::createSwitch(*cluster, "tenant-a", "n2", std::nullopt);

    for (int i = 0; i < 3; ++i)
    {
        controller_api::createPort(*cluster, first.uuid, samplePort("a" + std::to_string(i), first.uuid), false);
    }
    auto other = samplePort("b0", second.uuid);
    other.deviceId = "vm-2";
    controller_api::createPort(*cluster, second.uuid, other, false);
    fake->addPort(second.uuid, {{tag_scope::TENANT_ID, "tenant-a"}});

    controller_api::PortQuery all;
    REQUIRE(controller_api::queryPorts(*cluster, all).size() == 4);

    controller_api::PortQuery byNetwork;
    byNetwork.networkIds = {first.uuid};
    REQUIRE(controller_api::queryPorts(*cluster, byNetwork).size() == 3);

    controller_api::PortQuery byDevice;
    byDevice.deviceIds = {"vm-2"};
    auto found = controller_api::queryPorts(*cluster, byDevice);
    REQUIRE(found.size() == 1);
    REQUIRE(found.front().switchUuid == second.uuid);
}

TEST_CASE("findPortByTag scans clusters in order", "[controller_api]")
{
    auto fakeA = std::make_shared<FakeBackendClient>();
    auto fakeB = std::make_shared<FakeBackendClient>();
    auto clusterA = makeCluster("a", fakeA);
    auto clusterB = makeCluster("b", fakeB);
    auto lswitch = controller_api::createSwitch(*clusterB, "tenant-a", "net", std::nullopt);
    auto backendPort = controller_api::createPort(*clusterB, lswitch.uuid, samplePort("p9", lswitch.uuid), true);

    auto found = controller_api::findPortByTag({clusterA, clusterB}, std::nullopt, "p9");
    REQUIRE(found);
    REQUIRE(found->first.uuid == backendPort.uuid);
    REQUIRE(found->second->name() == "b");

    REQUIRE_FALSE(controller_api::findPortByTag({clusterA, clusterB}, std::nullopt, "nope"));

    controller_api::deletePort(*clusterB, found->first);
    REQUIRE(fakeB->portCount() == 0);

    BackendPort detached;
    detached.uuid = "lost";
    REQUIRE_THROWS_AS(controller_api::deletePort(*clusterB, detached), BackendError);
}

TEST_CASE("port lookups decode documents restricted to the requested fields", "[controller_api]")
{
    auto fake = std::make_shared<FakeBackendClient>();
    auto cluster = makeCluster("c0", fake);
    auto lswitch = controller_api::createSwitch(*cluster, "tenant-a", "net", std::nullopt);
    auto created = controller_api::createPort(*cluster, lswitch.uuid, samplePort("p1", lswitch.uuid), true);

    controller_api::PortQuery query;
    query.portId = "p1";
    auto ports = controller_api::queryPorts(*cluster, query);
    REQUIRE(ports.size() == 1);
    REQUIRE(ports.front().uuid == created.uuid);
    REQUIRE(ports.front().switchUuid == lswitch.uuid);
    REQUIRE(ports.front().displayName == "port-p1");
    REQUIRE(findTag(ports.front().tags, tag_scope::LOGICAL_PORT_ID) == std::optional<std::string>("p1"));

    auto found = controller_api::findPortByTag({cluster}, lswitch.uuid, "p1");
    REQUIRE(found);
    REQUIRE(found->first.uuid == created.uuid);

    auto switches = controller_api::querySwitches(*cluster, {"tenant-a"});
    REQUIRE(switches.size() == 1);
    REQUIRE(switches.front().uuid == lswitch.uuid);

    auto scripted = std::make_shared<ScriptedClient>();
    scripted->pages.push_back(QueryPage{{}, std::nullopt});
    controller_api::queryPorts(*makeCluster("s", scripted), query);
    REQUIRE(std::find(scripted->lastFields.begin(), scripted->lastFields.end(), "uuid") !=
            scripted->lastFields.end());
}

TEST_CASE("malformed controller documents surface as backend errors", "[controller_api]")
{
    auto scripted = std::make_shared<ScriptedClient>();
    auto cluster = makeCluster("c0", scripted);
    controller_api::PortQuery query;
    query.portId = "p1";

    SECTION("port without uuid")
    {
        scripted->pages.push_back(QueryPage{{json{{"display_name", "p"}, {"_href", "/ws.v1/lswitch/s/lport/x"}}},
                                            std::nullopt});
        REQUIRE_THROWS_AS(controller_api::queryPorts(*cluster, query), BackendError);
    }
    SECTION("port entry that is not an object")
    {
        scripted->pages.push_back(QueryPage{{json("junk")}, std::nullopt});
        REQUIRE_THROWS_WITH(controller_api::queryPorts(*cluster, query),
                            Catch::Contains("Malformed logical port document"));
    }
    SECTION("switch with mistyped tags")
    {
        scripted->pages.push_back(QueryPage{{json{{"uuid", "s1"}, {"tags", "oops"}}}, std::nullopt});
        REQUIRE_THROWS_AS(controller_api::querySwitches(*cluster, {}), BackendError);
    }
    SECTION("create answered without a uuid")
    {
        REQUIRE_THROWS_AS(controller_api::createSwitch(*cluster, "tenant-a", "net", std::nullopt),
                          BackendError);
    }
    SECTION("lookups across clusters propagate the backend error")
    {
        scripted->pages.push_back(QueryPage{{json{{"tags", json::array()}}}, std::nullopt});
        REQUIRE_THROWS_AS(controller_api::findPortByTag({cluster}, std::nullopt, "p1"), BackendError);
    }
}
