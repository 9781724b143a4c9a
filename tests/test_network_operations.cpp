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
#include <catch2/catch.hpp>

using namespace test_support;

namespace
{
bool
hasSwitch(FakeBackendClient& fake, const std::string& uuid)
{
    auto uuids = fake.switchUuids();
    return std::find(uuids.begin(), uuids.end(), uuid) != uuids.end();
}
} // namespace

TEST_CASE("a network takes the uuid of its logical switch", "[network]")
{
    EngineFixture f;
    auto network = f.engine->createNetwork(f.tenant, overlayNetwork("N1"));

    REQUIRE(hasSwitch(f.fake(), network.id));
    REQUIRE(network.tenantId == "tenant-a");
    REQUIRE(network.portSecurityEnabled == std::optional<bool>(true));
    REQUIRE_FALSE(network.provider);
    REQUIRE(f.store.getNetwork(network.id).name == "N1");

    SECTION("status follows the fabric status of the switch")
    {
        REQUIRE(f.engine->getNetwork(f.tenant, network.id).status == ResourceStatus::ACTIVE);
        f.fake().setSwitchFabricStatus(network.id, false);
        REQUIRE(f.engine->getNetwork(f.tenant, network.id).status == ResourceStatus::DOWN);
    }
    SECTION("a missing switch reads as down")
    {
        f.fake().removeSwitchDirectly(network.id);
        REQUIRE(f.engine->getNetwork(f.tenant, network.id).status == ResourceStatus::DOWN);
    }
    SECTION("controller failures surface as BackendUnavailable")
    {
        f.fake().failWhen = [](const std::string& method, const std::string&) {
            return method == "read";
        };
        REQUIRE_THROWS_AS(f.engine->getNetwork(f.tenant, network.id), BackendUnavailable);
    }
    SECTION("unknown networks are reported")
    {
        REQUIRE_THROWS_AS(f.engine->getNetwork(f.tenant, "missing"), NetworkNotFound);
    }
}

TEST_CASE("a vlan pair can only be bound once", "[network][provider]")
{
    EngineFixture f;
    auto n2 = f.engine->createNetwork(f.admin, vlanNetwork("N2", "phys1", 100));
    REQUIRE(n2.provider);
    REQUIRE(n2.provider->segmentationId == std::optional<int>(100));
    REQUIRE(f.fake().switchTransportZones(n2.id)[0]["transport_type"] == "bridge");

    REQUIRE_THROWS_AS(f.engine->createNetwork(f.admin, vlanNetwork("N3", "phys1", 100)),
                      SegmentationIdInUse);
    REQUIRE(f.fake().switchCount() == 1);
    REQUIRE(f.store.findNetworks({}).size() == 1);

    auto stillThere = f.engine->getNetwork(f.admin, n2.id);
    REQUIRE(stillThere.provider->physicalNetwork == std::optional<std::string>("phys1"));
    REQUIRE(stillThere.status == ResourceStatus::ACTIVE);

    REQUIRE_NOTHROW(f.engine->createNetwork(f.admin, vlanNetwork("N4", "phys2", 100)));
}

TEST_CASE("provider attributes are validated before any controller call", "[network][provider]")
{
    EngineFixture f;
    NetworkCreateRequest request = overlayNetwork("bad");

    SECTION("type is required")
    {
        request.segmentationId = 5;
        REQUIRE_THROWS_WITH(f.engine->createNetwork(f.admin, request),
                            Catch::Contains("provider:network_type required"));
    }
    SECTION("unknown type")
    {
        request.networkType = "vxlan";
        REQUIRE_THROWS_WITH(f.engine->createNetwork(f.admin, request),
                            Catch::Contains("vxlan not supported"));
    }
    SECTION("segmentation id only with vlan")
    {
        request.networkType = "flat";
        request.physicalNetwork = "phys1";
        request.segmentationId = 5;
        REQUIRE_THROWS_AS(f.engine->createNetwork(f.admin, request), InvalidInput);
    }
    SECTION("vlan needs a segmentation id")
    {
        request.networkType = "vlan";
        request.physicalNetwork = "phys1";
        REQUIRE_THROWS_WITH(f.engine->createNetwork(f.admin, request),
                            Catch::Contains("must be specified with vlan"));
    }
    SECTION("vlan tag range")
    {
        REQUIRE_THROWS_WITH(f.engine->createNetwork(f.admin, vlanNetwork("bad", "phys1", 4095)),
                            Catch::Contains("4095 out of range (1 to 4094)"));
        REQUIRE_THROWS_AS(f.engine->createNetwork(f.admin, vlanNetwork("bad", "phys1", 0)),
                          InvalidInput);
    }
    SECTION("only admins set provider attributes")
    {
        REQUIRE_THROWS_AS(f.engine->createNetwork(f.tenant, vlanNetwork("bad", "phys1", 10)),
                          NotAuthorized);
    }

    REQUIRE(f.fake().callCount("create") == 0);
    REQUIRE(f.store.findNetworks({}).empty());
}

TEST_CASE("tenants create networks for themselves only", "[network]")
{
    EngineFixture f;
    NetworkCreateRequest request = overlayNetwork("shared");
    request.tenantId = "tenant-b";

    REQUIRE_THROWS_AS(f.engine->createNetwork(f.tenant, request), NotAuthorized);
    REQUIRE(f.fake().callCount("create") == 0);

    auto network = f.engine->createNetwork(f.admin, request);
    REQUIRE(network.tenantId == "tenant-b");
    REQUIRE(findTag(f.fake().switchInfo(network.id).tags, tag_scope::TENANT_ID) ==
            std::optional<std::string>("tenant-b"));
}

TEST_CASE("networks land on the cluster serving their zone", "[network]")
{
    EngineFixture f(2);
    NetworkCreateRequest request = overlayNetwork("remote");
    request.zoneId = "zone-c1";
    auto network = f.engine->createNetwork(f.tenant, request);

    REQUIRE(hasSwitch(f.fake("c1"), network.id));
    REQUIRE(f.fake("c0").switchCount() == 0);
    REQUIRE(f.engine->getNetwork(f.tenant, network.id).status == ResourceStatus::ACTIVE);

    request.zoneId = "zone-unknown";
    REQUIRE_THROWS_AS(f.engine->createNetwork(f.tenant, request), UnknownZone);
}

TEST_CASE("createNetwork keeps a disabled admin state with a warning", "[network]")
{
    EngineFixture f;
    LogCapture logs;
    NetworkCreateRequest request = overlayNetwork("quiet");
    request.adminStateUp = false;

    auto network = f.engine->createNetwork(f.tenant, request);
    REQUIRE_FALSE(network.adminStateUp);
    REQUIRE(logs.contains("Networks with admin_state_up=False are not supported"));
}

TEST_CASE("createNetwork reports a failing controller", "[network]")
{
    EngineFixture f;
    f.fake().failWhen = [](const std::string& method, const std::string&) {
        return method == "create";
    };
    REQUIRE_THROWS_AS(f.engine->createNetwork(f.tenant, overlayNetwork("N1")), BackendUnavailable);
    REQUIRE(f.store.findNetworks({}).empty());
}

TEST_CASE("getNetworks lists local records and reports controller drift", "[network][drift]")
{
    EngineFixture f;
    auto network = f.engine->createNetwork(f.tenant, overlayNetwork("N1"));
    f.fake().addSwitch("stray-1", {{tag_scope::TENANT_ID, "tenant-x"}});
    f.fake().addSwitch("stray-2", {{tag_scope::TENANT_ID, "tenant-y"}});

    SECTION("unclaimed switches produce one aggregate warning")
    {
        LogCapture logs;
        DriftReport report;
        auto networks = f.engine->getNetworks(f.admin, {}, &report);

        REQUIRE(networks.size() == 1);
        REQUIRE(networks.front().id == network.id);
        REQUIRE(networks.front().status == ResourceStatus::ACTIVE);
        REQUIRE(logs.count("Found 2 logical switches not bound to local networks") == 1);
        REQUIRE(report.unclaimedBackendSwitches == 2);
        REQUIRE(report.unmatchedLocalNetworks == 0);
    }
    SECTION("the controller name wins for matched networks")
    {
        f.fake().update("/ws.v1/lswitch/" + network.id, json{{"display_name", "renamed"}});
        REQUIRE(f.engine->getNetworks(f.admin, {}).front().name == "renamed");
    }
    SECTION("fragments are claimed by their network and feed its status")
    {
        f.fake().addSwitch("N1-ext-1", {{tag_scope::TENANT_ID, "tenant-a"},
                                        {tag_scope::LOGICAL_NETWORK_ID, network.id}},
                           false);
        DriftReport report;
        auto networks = f.engine->getNetworks(f.admin, {}, &report);
        REQUIRE(networks.front().status == ResourceStatus::DOWN);
        REQUIRE(report.unclaimedBackendSwitches == 2);
    }
    SECTION("filters narrow what counts as drift")
    {
        NetworkFilters filters;
        filters.ids = {network.id};
        DriftReport report;
        REQUIRE(f.engine->getNetworks(f.admin, filters, &report).size() == 1);
        REQUIRE(report.inSync());
    }
    SECTION("tenants only see drift in their own switches")
    {
        DriftReport report;
        f.engine->getNetworks(f.tenant, {}, &report);
        REQUIRE(report.unclaimedBackendSwitches == 0);
    }
    SECTION("strict consistency turns drift into an error")
    {
        EngineFixture strict(1, EngineOptions{64, 5000, true});
        strict.fake().addSwitch("stray", {{tag_scope::TENANT_ID, "tenant-x"}});
        try
        {
            strict.engine->getNetworks(strict.admin, {});
            FAIL("expected OutOfSync");
        }
        catch (const OutOfSync& e)
        {
            REQUIRE(e.count() == 1);
        }
    }
    SECTION("local networks without a switch are kept and reported")
    {
        LogCapture logs;
        f.fake().removeSwitchDirectly(network.id);
        DriftReport report;
        auto networks = f.engine->getNetworks(f.admin, {}, &report);
        REQUIRE(networks.size() == 1);
        REQUIRE_FALSE(networks.front().status);
        REQUIRE(report.unmatchedLocalNetworks == 1);
        REQUIRE(logs.contains("Network " + network.id + " has no logical switch on any cluster"));
    }
    SECTION("paging covers every switch")
    {
        for (int i = 0; i < 5; ++i)
        {
            f.fake().addSwitch("more-" + std::to_string(i), {{tag_scope::TENANT_ID, "tenant-z"}});
        }
        DriftReport report;
        f.engine->getNetworks(f.admin, {}, &report);
        REQUIRE(report.unclaimedBackendSwitches == 7);
    }
}

TEST_CASE("provider attributes are only shown to admins", "[network][provider]")
{
    EngineFixture f;
    NetworkCreateRequest request = vlanNetwork("N1", "phys1", 42);
    request.tenantId = "tenant-a";
    auto network = f.engine->createNetwork(f.admin, request);

    REQUIRE(f.engine->getNetwork(f.admin, network.id).provider);
    REQUIRE_FALSE(f.engine->getNetwork(f.tenant, network.id).provider);
}

TEST_CASE("updateNetwork changes local fields and renames the switch", "[network]")
{
    EngineFixture f;
    auto network = f.engine->createNetwork(f.tenant, overlayNetwork("N1"));

    SECTION("disabling the admin state is not supported")
    {
        NetworkUpdateRequest request;
        request.adminStateUp = false;
        REQUIRE_THROWS_AS(f.engine->updateNetwork(f.tenant, network.id, request), NotSupported);
    }
    SECTION("rename and port security")
    {
        NetworkUpdateRequest request;
        request.name = "N1-renamed";
        request.portSecurityEnabled = false;
        auto updated = f.engine->updateNetwork(f.tenant, network.id, request);

        REQUIRE(updated.name == "N1-renamed");
        REQUIRE(updated.portSecurityEnabled == std::optional<bool>(false));
        REQUIRE(f.fake().switchInfo(network.id).displayName == "N1-renamed");
        REQUIRE(findTag(f.fake().switchInfo(network.id).tags, tag_scope::TENANT_ID) ==
                std::optional<std::string>("tenant-a"));
    }
    SECTION("a failed rename on the controller keeps the local change")
    {
        LogCapture logs;
        f.fake().failWhen = [](const std::string& method, const std::string&) {
            return method == "update";
        };
        NetworkUpdateRequest request;
        request.name = "other";
        REQUIRE(f.engine->updateNetwork(f.tenant, network.id, request).name == "other");
        REQUIRE(f.store.getNetwork(network.id).name == "other");
        REQUIRE(logs.contains("Unable to rename logical switch"));
    }
    SECTION("unknown network")
    {
        REQUIRE_THROWS_AS(f.engine->updateNetwork(f.tenant, "missing", NetworkUpdateRequest{}),
                          NetworkNotFound);
    }
}

TEST_CASE("deleteNetwork removes the record and every switch", "[network]")
{
    EngineFixture f;
    auto network = f.engine->createNetwork(f.admin, vlanNetwork("N1", "phys1", 10));

    SECTION("unknown on every cluster")
    {
        REQUIRE_THROWS_AS(f.engine->deleteNetwork(f.admin, "missing"), NetworkNotFound);
        REQUIRE(f.fake().callCount("remove") == 0);
    }
    SECTION("record and switches go away together")
    {
        auto fragment = f.fake().addSwitch("N1-ext-1", {{tag_scope::LOGICAL_NETWORK_ID, network.id}});
        f.fake().update("/ws.v1/lswitch/" + network.id,
                        json{{"tags", json::array({{{"scope", tag_scope::MULTI_SWITCH}, {"tag", "True"}}})}});

        f.engine->deleteNetwork(f.admin, network.id);
        REQUIRE_FALSE(hasSwitch(f.fake(), network.id));
        REQUIRE_FALSE(hasSwitch(f.fake(), fragment));
        REQUIRE_THROWS_AS(f.store.getNetwork(network.id), NetworkNotFound);
        REQUIRE_FALSE(f.store.findNetworkBySegment(std::string("phys1"), 10));
    }
    SECTION("networks with ports stay")
    {
        f.engine->createPort(f.admin, portOn(network.id, "p1"));
        REQUIRE_THROWS_AS(f.engine->deleteNetwork(f.admin, network.id), NetworkInUse);
        REQUIRE(hasSwitch(f.fake(), network.id));
        REQUIRE(f.store.getNetwork(network.id).id == network.id);
    }
    SECTION("a failing lookup leaves everything in place")
    {
        f.fake().failWhen = [](const std::string& method, const std::string&) {
            return method == "read";
        };
        REQUIRE_THROWS_AS(f.engine->deleteNetwork(f.admin, network.id), BackendUnavailable);
        REQUIRE(f.store.getNetwork(network.id).id == network.id);
    }
    SECTION("a failing switch delete is logged after the record is gone")
    {
        LogCapture logs;
        f.fake().failWhen = [](const std::string& method, const std::string&) {
            return method == "remove";
        };
        REQUIRE_NOTHROW(f.engine->deleteNetwork(f.admin, network.id));
        REQUIRE_THROWS_AS(f.store.getNetwork(network.id), NetworkNotFound);
        REQUIRE(logs.contains("Local store and controller diverge"));
    }
}

TEST_CASE("checkConsistency counts drift on both sides", "[network][drift]")
{
    EngineFixture f(1, EngineOptions{64, 5000, true});
    auto network = f.engine->createNetwork(f.tenant, overlayNetwork("N1"));
    f.engine->createPort(f.tenant, portOn(network.id, "p1"));
    REQUIRE(f.engine->checkConsistency().inSync());

    f.fake().addSwitch("stray", {{tag_scope::TENANT_ID, "tenant-x"}});
    f.fake().addPort(network.id, {{tag_scope::LOGICAL_NETWORK_ID, network.id},
                                  {tag_scope::LOGICAL_PORT_ID, "ghost"}});

    DriftReport report = f.engine->checkConsistency();
    REQUIRE(report.unclaimedBackendSwitches == 1);
    REQUIRE(report.unclaimedBackendPorts == 1);
    REQUIRE(report.unmatchedLocalNetworks == 0);
    REQUIRE(report.unmatchedLocalPorts == 0);
}

TEST_CASE("long names with multi-byte characters are truncated on a character boundary", "[network]")
{
    EngineFixture f;
    const std::string name = std::string(39, 'a') + "\xc3\xa9";

    auto network = f.engine->createNetwork(f.tenant, overlayNetwork(name));
    REQUIRE(network.name == name);
    const std::string displayName = f.fake().switchInfo(network.id).displayName;
    REQUIRE(displayName == std::string(39, 'a'));
    REQUIRE_NOTHROW(json(displayName).dump());

    auto port = f.engine->createPort(f.tenant, portOn(network.id, name));
    REQUIRE(f.store.getPort(port.id).name == name);
    REQUIRE(f.fake().portsOf(port.id).front().displayName == std::string(39, 'a'));
}
