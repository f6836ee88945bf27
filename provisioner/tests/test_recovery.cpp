/**
WiFi Provisioner Network Service
Copyright (C)  2025 Seneral <contact@seneral.dev> and contributors

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU Lesser General Public License as
published by the Free Software Foundation, either version 3 of the
License, or (at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "fakes.hpp"

static ConnectedNetwork homeNetwork()
{
	return ConnectedNetwork{ "Home", "wlan0", SECURITY_WPA2, "Home" };
}

TEST(Recovery, RestoresPersistedConnection)
{
	ProvisionerHarness h;
	h.backend.addStation("Home", "Home");
	ASSERT_FALSE(h.store.save(PERSIST_CONNECTED, homeNetwork()));

	ASSERT_FALSE(h.workflow.recoverOnStartup());
	EXPECT_TRUE(h.backend.isActive("Home"));
	EXPECT_EQ(h.modes.mode(), OperatingMode::Station("Home"));
	EXPECT_FALSE(h.backend.isActive("connectInterface"));

	auto state = h.store.load();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->mode, PERSIST_CONNECTED);
	ASSERT_TRUE(state->connectedNetwork.has_value());
	EXPECT_EQ(state->connectedNetwork->ssid, "Home");
}

TEST(Recovery, RestoresPersistedAccessPoint)
{
	ProvisionerHarness h;
	ASSERT_FALSE(h.store.save(PERSIST_DIRECT));

	ASSERT_FALSE(h.workflow.recoverOnStartup());
	EXPECT_TRUE(h.backend.isActive("directInterface"));
	EXPECT_TRUE(h.modes.mode().isAccessPoint(AP_DIRECT));
	EXPECT_TRUE(h.helper.isRunning);
}

TEST(Recovery, RemovesStaleAccessPointsFirst)
{
	ProvisionerHarness h;
	h.backend.addAccessPoint("directInterface", "WiFiDirect", true);
	h.backend.addAccessPoint("connectInterface", "WiFi Connect", false);
	ASSERT_FALSE(h.store.save(PERSIST_DIRECT));

	ASSERT_FALSE(h.workflow.recoverOnStartup());
	int deactivate = h.log.find("deactivate:directInterface");
	int removeDirect = h.log.find("delete:directInterface");
	int removeConnect = h.log.find("delete:connectInterface");
	int orphans = h.log.find("helper.stopOrphaned");
	int recreate = h.log.find("create:directInterface");
	ASSERT_GE(deactivate, 0);
	EXPECT_GT(removeDirect, deactivate);
	EXPECT_GE(removeConnect, 0);
	EXPECT_GT(orphans, removeDirect);
	EXPECT_GT(recreate, orphans);
	EXPECT_TRUE(h.backend.isActive("directInterface"));
}

TEST(Recovery, KeepsConnectionMadeByNetworkManager)
{
	ProvisionerHarness h;
	h.backend.addStation("Home", "Home", "", {}, true);

	ASSERT_FALSE(h.workflow.recoverOnStartup());
	EXPECT_EQ(h.modes.mode(), OperatingMode::Station("Home"));
	EXPECT_FALSE(h.log.contains("activate:connectInterface"));

	auto state = h.store.load();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->mode, PERSIST_CONNECTED);
}

TEST(Recovery, FallsBackToConnectAccessPointWithWarmCache)
{
	ProvisionerHarness h;
	h.backend.visible = { makeNetwork("Cafe"), makeNetwork("Library"), makeNetwork("Office") };

	ASSERT_FALSE(h.workflow.recoverOnStartup());
	EXPECT_TRUE(h.backend.isActive("connectInterface"));
	EXPECT_TRUE(h.modes.mode().isAccessPoint(AP_CONNECT));
	EXPECT_LT(h.log.find("listNetworks"), h.log.find("activate:connectInterface"));

	// The networks seen before the radio went into access point mode remain available
	ASSERT_NE(h.cache.lastKnown(), nullptr);
	EXPECT_EQ(h.cache.lastKnown()->records.size(), 3u);

	auto state = h.store.load();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->mode, PERSIST_CONNECT);
}

TEST(Recovery, FallsBackWhenPersistedConnectionIsGone)
{
	ProvisionerHarness h;
	ASSERT_FALSE(h.store.save(PERSIST_CONNECTED, homeNetwork()));

	ASSERT_FALSE(h.workflow.recoverOnStartup());
	EXPECT_TRUE(h.log.contains("activate:Home"));
	EXPECT_TRUE(h.backend.isActive("connectInterface"));
}

TEST(Recovery, FallbackFailurePersistsDisconnected)
{
	ProvisionerHarness h;
	h.backend.failActivate.insert("connectInterface");

	auto error = h.workflow.recoverOnStartup();
	ASSERT_TRUE(error.has_value());
	auto state = h.store.load();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->mode, PERSIST_DISCONNECTED);
}

TEST(Recovery, DisabledCheckOnlyCleansUp)
{
	WorkflowSettings settings = testWorkflowSettings();
	settings.startupCheck = false;
	ProvisionerHarness h(settings);
	h.backend.addAccessPoint("connectInterface", "WiFi Connect", true);

	ASSERT_FALSE(h.workflow.recoverOnStartup());
	EXPECT_TRUE(h.log.contains("delete:connectInterface"));
	EXPECT_FALSE(h.log.contains("listNetworks"));
	EXPECT_FALSE(h.backend.isActive("connectInterface"));
	EXPECT_EQ(h.modes.mode(), OperatingMode::Idle());
}

TEST(Recovery, MissingInterfaceIsReported)
{
	ProvisionerHarness h;
	h.backend.devices = { { "lo", "loopback" } };

	auto error = h.workflow.recoverOnStartup();
	ASSERT_TRUE(error.has_value());
	EXPECT_TRUE(error->is(ERROR_HARDWARE_UNAVAILABLE));
	EXPECT_FALSE(h.log.contains("activate:connectInterface"));
}
