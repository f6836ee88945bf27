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

#include "comm/api.hpp"

#include <fstream>

class ControlApiTest : public ::testing::Test
{
protected:
	ProvisionerHarness h;
	ProvisionerConfig config;
	std::unique_ptr<ControlApi> api;

	void SetUp() override
	{
		std::filesystem::path ui = h.directory / "ui";
		std::filesystem::create_directories(ui / "assets");
		std::ofstream(ui / "index.html") << "<html>setup</html>";
		std::ofstream(ui / "assets" / "app.js") << "console.log('ui');";
		std::ofstream(h.directory / "secret.txt") << "secret";
		config.server.uiDirectory = ui.string();
		api = std::make_unique<ControlApi>(h.workflow, h.backend, config);
	}

	HttpResponse get(const std::string &path, const std::map<std::string, std::string> &query = {})
	{
		HttpRequest request;
		request.method = "GET";
		request.path = path;
		request.version = "HTTP/1.1";
		request.query = query;
		return api->handle(request);
	}

	HttpResponse post(const std::string &path, const std::string &body)
	{
		HttpRequest request;
		request.method = "POST";
		request.path = path;
		request.version = "HTTP/1.1";
		request.headers["content-type"] = "application/json";
		request.body = body;
		return api->handle(request);
	}

	static json body(const HttpResponse &response)
	{
		return json::parse(response.body);
	}

	static std::string header(const HttpResponse &response, const std::string &name)
	{
		for (auto &entry : response.headers)
			if (entry.first == name) return entry.second;
		return "";
	}
};

TEST_F(ControlApiTest, HealthReflectsNetworkManager)
{
	HttpResponse response = get("/health");
	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(body(response)["status"], "healthy");

	h.backend.available = false;
	response = get("/health");
	EXPECT_EQ(response.status, 503);
	EXPECT_EQ(body(response)["detail"], "NetworkManager not available");
}

TEST_F(ControlApiTest, ListsNetworks)
{
	NetworkRecord home = makeNetwork("Home", 82, std::string("AA:BB:CC:DD:EE:01"));
	home.isActive = true;
	h.backend.visible = { home, makeNetwork("Cafe", 40) };

	HttpResponse response = get("/list-networks", { { "force_scan", "true" } });
	ASSERT_EQ(response.status, 200);
	json networks = body(response)["networks"];
	ASSERT_EQ(networks.size(), 2u);
	EXPECT_EQ(networks[0]["ssid"], "Home");
	EXPECT_EQ(networks[0]["security"], "wpa2");
	EXPECT_EQ(networks[0]["signal_strength"], 82);
	EXPECT_EQ(networks[0]["frequency_band"], "2.4GHz");
	EXPECT_EQ(networks[0]["active"], true);
	EXPECT_EQ(networks[0]["bssid"], "AA:BB:CC:DD:EE:01");
	EXPECT_TRUE(networks[1]["bssid"].is_null());
}

TEST_F(ControlApiTest, ListNetworksUsesCacheByDefault)
{
	h.cache.put({ makeNetwork("Cafe"), makeNetwork("Library") });
	HttpResponse response = get("/list-networks");
	ASSERT_EQ(response.status, 200);
	EXPECT_EQ(body(response)["networks"].size(), 2u);
	EXPECT_FALSE(h.log.contains("listNetworks"));

	get("/list-networks", { { "use_cache", "false" } });
	EXPECT_TRUE(h.log.contains("listNetworks"));
}

TEST_F(ControlApiTest, ScanErrorsAreStructured)
{
	h.backend.devices = { { "eth0", "ethernet" } };
	HttpResponse response = get("/list-networks", { { "force_scan", "1" } });
	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(body(response)["error"], "no_wifi_interface");
	EXPECT_TRUE(body(response)["message"].is_string());
}

TEST_F(ControlApiTest, ListsConnectedAndSaved)
{
	HttpResponse response = get("/list-connected");
	EXPECT_TRUE(body(response)["connected"].is_null());

	h.backend.addStation("Home", "Home", "", {}, true);
	h.backend.addStation("Work", "Work");
	h.backend.addAccessPoint("connectInterface", "WiFi Connect", false);

	response = get("/list-connected");
	json connected = body(response)["connected"];
	EXPECT_EQ(connected["ssid"], "Home");
	EXPECT_EQ(connected["interface"], "wlan0");
	EXPECT_EQ(connected["connection_name"], "Home");

	response = get("/list-saved");
	json saved = body(response)["saved_networks"];
	ASSERT_EQ(saved.size(), 2u);
	EXPECT_EQ(saved[0]["ssid"], "Home");
	EXPECT_EQ(saved[1]["ssid"], "Work");
}

TEST_F(ControlApiTest, ConnectReportsOutcome)
{
	HttpResponse response = post("/connect", R"({"ssid":"Cafe","passphrase":"password1"})");
	ASSERT_EQ(response.status, 200);
	EXPECT_EQ(body(response)["success"], true);
	EXPECT_EQ(body(response)["message"], "Connected to Cafe");

	h.backend.failConnect = true;
	response = post("/connect", R"({"ssid":"Library"})");
	ASSERT_EQ(response.status, 200);
	EXPECT_EQ(body(response)["success"], false);
	EXPECT_TRUE(body(response)["message"].get<std::string>().starts_with("Failed to connect to network: "));
}

TEST_F(ControlApiTest, ConnectValidatesBody)
{
	EXPECT_EQ(post("/connect", R"({"passphrase":"password1"})").status, 422);
	EXPECT_EQ(post("/connect", "[1, 2]").status, 422);
	EXPECT_EQ(post("/connect", "{ not json").status, 422);
	EXPECT_FALSE(h.log.contains("listActive"));
}

TEST_F(ControlApiTest, ForgetVariants)
{
	h.backend.addStation("Home", "Home");
	h.backend.addStation("Work", "Work", "AA:BB:CC:DD:EE:09");

	HttpResponse response = post("/forget-network", R"({"network_name":"Home"})");
	EXPECT_EQ(body(response)["success"], true);
	EXPECT_EQ(body(response)["message"], "Successfully deleted 1 network(s) with SSID 'Home'");

	response = post("/forget", R"({"ssid":"Unknown"})");
	EXPECT_EQ(body(response)["success"], false);
	EXPECT_EQ(body(response)["message"], "No networks with SSID 'Unknown' found");

	response = post("/forget", "{}");
	EXPECT_EQ(body(response)["success"], false);

	response = post("/forget", R"({"bssid":"aa:bb:cc:dd:ee:09"})");
	EXPECT_EQ(body(response)["success"], true);
	EXPECT_TRUE(h.backend.isActive("connectInterface"));
}

TEST_F(ControlApiTest, ForgetAll)
{
	h.backend.addStation("Home", "Home");
	HttpResponse response = post("/forget-all", "");
	EXPECT_EQ(body(response)["success"], true);
	EXPECT_EQ(body(response)["message"], "Successfully deleted 1 network(s)");
}

TEST_F(ControlApiTest, AccessPointToggles)
{
	HttpResponse response = post("/set-wifi-direct", R"({"value":true})");
	ASSERT_EQ(response.status, 200);
	EXPECT_EQ(body(response)["value"], true);
	EXPECT_EQ(body(get("/get-wifi-direct"))["value"], true);
	EXPECT_EQ(body(get("/get-wifi-connect"))["value"], false);

	response = post("/set-wifi-connect", R"({"value":"true"})");
	ASSERT_EQ(response.status, 200);
	EXPECT_EQ(body(get("/get-wifi-direct"))["value"], false);
	EXPECT_EQ(body(get("/get-wifi-connect"))["value"], true);

	json status = body(get("/scan-status"));
	EXPECT_EQ(status["hotspot_active"], true);
	EXPECT_EQ(status["hotspot_type"], "connect");
	EXPECT_EQ(status["can_scan"], true);
	EXPECT_EQ(status["cache_valid"], false);
	EXPECT_TRUE(status["warning_message"].is_string());

	response = post("/set-wifi-connect", R"({"value":false})");
	EXPECT_EQ(body(response)["value"], false);
	EXPECT_EQ(body(get("/get-wifi-connect"))["value"], false);
	EXPECT_TRUE(body(get("/scan-status"))["warning_message"].is_null());
}

TEST_F(ControlApiTest, AccessPointFailureIsServerError)
{
	h.helper.failStart = true;
	HttpResponse response = post("/set-wifi-connect", R"({"value":true})");
	EXPECT_EQ(response.status, 500);
	EXPECT_TRUE(body(response)["detail"].is_string());
	EXPECT_EQ(post("/set-wifi-connect", "{}").status, 422);
}

TEST_F(ControlApiTest, UnknownRoutesAndMethods)
{
	EXPECT_EQ(get("/does-not-exist").status, 404);
	EXPECT_EQ(get("/connect").status, 405);
	EXPECT_EQ(post("/list-networks", "").status, 405);
}

TEST_F(ControlApiTest, PreflightAndCors)
{
	HttpRequest request;
	request.method = "OPTIONS";
	request.path = "/connect";
	request.headers["origin"] = "http://192.168.42.1";
	HttpResponse response = api->handle(request);
	EXPECT_EQ(response.status, 204);
	EXPECT_EQ(header(response, "Access-Control-Allow-Origin"), "*");
	EXPECT_NE(header(response, "Access-Control-Allow-Methods").find("POST"), std::string::npos);

	config.cors.origins = { "http://portal.local" };
	api = std::make_unique<ControlApi>(h.workflow, h.backend, config);
	request.headers["origin"] = "http://portal.local";
	response = api->handle(request);
	EXPECT_EQ(header(response, "Access-Control-Allow-Origin"), "http://portal.local");
	EXPECT_EQ(header(response, "Vary"), "Origin");

	request.headers["origin"] = "http://evil.local";
	response = api->handle(request);
	EXPECT_EQ(header(response, "Access-Control-Allow-Origin"), "");
}

TEST_F(ControlApiTest, ServesUserInterface)
{
	HttpResponse response = get("/");
	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.body, "<html>setup</html>");
	EXPECT_EQ(response.contentType, "text/html; charset=utf-8");

	response = get("/ui/assets/app.js");
	EXPECT_EQ(response.status, 200);
	EXPECT_EQ(response.contentType, "text/javascript; charset=utf-8");

	EXPECT_EQ(get("/ui/../secret.txt").status, 404);
	EXPECT_EQ(get("/ui/missing.css").status, 404);
}
