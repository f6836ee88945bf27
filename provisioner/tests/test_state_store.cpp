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

#include "config.hpp" // writeJSON

#include <fstream>

class StateStoreTest : public ::testing::Test
{
protected:
	std::filesystem::path directory;
	std::string path;

	void SetUp() override
	{
		SetLogLevel(LWarn);
		directory = testDirectory();
		path = (directory / "state" / "wifi_state.json").string();
	}

	void TearDown() override
	{
		std::error_code ec;
		std::filesystem::remove_all(directory, ec);
	}
};

TEST_F(StateStoreTest, RoundTripsConnectedNetwork)
{
	StateStore store(path, 86400);
	ConnectedNetwork network{ "Home: 5G", "wlan0", SECURITY_WPA3, "Home 5G" };
	ASSERT_FALSE(store.save(PERSIST_CONNECTED, network));
	EXPECT_TRUE(std::filesystem::exists(path));

	auto state = store.load();
	ASSERT_TRUE(state.has_value());
	EXPECT_EQ(state->mode, PERSIST_CONNECTED);
	EXPECT_NEAR(state->savedAt, getWallTime(), 60);
	ASSERT_TRUE(state->connectedNetwork.has_value());
	EXPECT_EQ(state->connectedNetwork->ssid, "Home: 5G");
	EXPECT_EQ(state->connectedNetwork->interface, "wlan0");
	EXPECT_EQ(state->connectedNetwork->security, SECURITY_WPA3);
	EXPECT_EQ(state->connectedNetwork->connectionName, "Home 5G");
}

TEST_F(StateStoreTest, WritesDocumentedLayout)
{
	StateStore store(path, 86400);
	ASSERT_FALSE(store.save(PERSIST_DIRECT));

	json data;
	ASSERT_FALSE(readJSON(path, data));
	EXPECT_EQ(data["state"].get<std::string>(), "direct");
	EXPECT_TRUE(data["timestamp"].is_number());
	EXPECT_TRUE(data["connected_network"].is_null());
}

TEST_F(StateStoreTest, MissingFileIsAbsent)
{
	StateStore store(path, 86400);
	EXPECT_FALSE(store.load().has_value());
}

TEST_F(StateStoreTest, ExpiredStateIsDeleted)
{
	PersistedState old;
	old.mode = PERSIST_CONNECT;
	old.savedAt = getWallTime() - 120;
	ASSERT_FALSE(writeJSON(path, stateToJSON(old)));

	StateStore store(path, 60);
	EXPECT_FALSE(store.load().has_value());
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(StateStoreTest, CorruptStateIsDeleted)
{
	std::filesystem::create_directories(std::filesystem::path(path).parent_path());
	{
		std::ofstream fs(path);
		fs << "{ \"state\": \"connected\", \"timest";
	}
	StateStore store(path, 86400);
	EXPECT_FALSE(store.load().has_value());
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(StateStoreTest, UnknownModeIsDeleted)
{
	ASSERT_FALSE(writeJSON(path, json{ { "state", "bridged" }, { "timestamp", getWallTime() } }));
	StateStore store(path, 86400);
	EXPECT_FALSE(store.load().has_value());
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(StateStoreTest, ConnectionNameDefaultsToSsid)
{
	json data = {
		{ "state", "connected" },
		{ "timestamp", getWallTime() },
		{ "connected_network", { { "ssid", "Home" }, { "interface", "wlan0" }, { "security", "wpa2" } } }
	};
	PersistedState state;
	ASSERT_FALSE(stateFromJSON(data, state));
	ASSERT_TRUE(state.connectedNetwork.has_value());
	EXPECT_EQ(state.connectedNetwork->connectionName, "Home");
	EXPECT_EQ(state.connectedNetwork->security, SECURITY_WPA2);
}

TEST_F(StateStoreTest, ClearRemovesFile)
{
	StateStore store(path, 86400);
	ASSERT_FALSE(store.save(PERSIST_CONNECT));
	store.clear();
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(StateStoreTest, WriteFailureIsPersistenceError)
{
	StateStore store("/proc/provisioner-test/wifi_state.json", 86400);
	auto error = store.save(PERSIST_DISCONNECTED);
	ASSERT_TRUE(error.has_value());
	EXPECT_TRUE(error->is(ERROR_PERSISTENCE));
}
