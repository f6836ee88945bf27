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

#include "network/parsing.hpp"

#include "gtest/gtest.h"

TEST(Parsing, SplitsTerseLinesWithEscapes)
{
	auto fields = splitTerseLine("yes:My\\:Net:AA\\:BB\\:CC\\:DD\\:EE\\:FF:WPA2:6:80");
	ASSERT_EQ(fields.size(), 6u);
	EXPECT_EQ(fields[0], "yes");
	EXPECT_EQ(fields[1], "My:Net");
	EXPECT_EQ(fields[2], "AA:BB:CC:DD:EE:FF");
	EXPECT_EQ(fields[5], "80");

	fields = splitTerseLine("back\\\\slash::");
	ASSERT_EQ(fields.size(), 3u);
	EXPECT_EQ(fields[0], "back\\slash");
	EXPECT_EQ(fields[1], "");
}

TEST(Parsing, ClassifiesSecurity)
{
	EXPECT_EQ(parseSecurity(""), SECURITY_OPEN);
	EXPECT_EQ(parseSecurity("--"), SECURITY_OPEN);
	EXPECT_EQ(parseSecurity("WEP"), SECURITY_WEP);
	EXPECT_EQ(parseSecurity("WPA1"), SECURITY_WPA);
	EXPECT_EQ(parseSecurity("WPA1 WPA2"), SECURITY_WPA2);
	EXPECT_EQ(parseSecurity("wpa-psk"), SECURITY_WPA2);
	EXPECT_EQ(parseSecurity("WPA2 WPA3"), SECURITY_WPA3);
	EXPECT_EQ(parseSecurity("sae"), SECURITY_WPA3);
}

TEST(Parsing, NormalisesSignal)
{
	EXPECT_EQ(parseSignal("75"), 75);
	EXPECT_EQ(parseSignal("120"), 100);
	EXPECT_EQ(parseSignal("-70 dBm"), 60);
	EXPECT_EQ(parseSignal("-40"), 100);
	EXPECT_EQ(parseSignal("-100"), 0);
	EXPECT_EQ(parseSignal("strong"), 0);
	EXPECT_EQ(parseSignal(""), 0);
}

TEST(Parsing, DerivesBandFromChannel)
{
	EXPECT_EQ(parseBand("1"), BAND_2_4GHZ);
	EXPECT_EQ(parseBand("11"), BAND_2_4GHZ);
	EXPECT_EQ(parseBand("36"), BAND_5GHZ);
	EXPECT_EQ(parseBand("149"), BAND_5GHZ);
	EXPECT_EQ(parseBand("181"), BAND_6GHZ);
	EXPECT_EQ(parseBand("--"), BAND_UNKNOWN);
	EXPECT_EQ(parseBand("0"), BAND_UNKNOWN);
}

TEST(Parsing, ParsesNetworkList)
{
	std::string output =
		"yes:Home:AA\\:BB\\:CC\\:DD\\:EE\\:01:WPA2:6:82\n"
		"no:Cafe:AA\\:BB\\:CC\\:DD\\:EE\\:02::36:40\n"
		"no::AA\\:BB\\:CC\\:DD\\:EE\\:03:WPA2:11:60\n"
		"no:--:AA\\:BB\\:CC\\:DD\\:EE\\:04:WPA2:11:60\n"
		"no:Home:AA\\:BB\\:CC\\:DD\\:EE\\:01:WPA2:6:50\n"
		"no:Home:AA\\:BB\\:CC\\:DD\\:EE\\:05:WPA3:149:30\n"
		"garbage\n"
		"\n";
	auto records = parseNetworkList(output);
	ASSERT_EQ(records.size(), 3u);

	EXPECT_EQ(records[0].ssid, "Home");
	EXPECT_TRUE(records[0].isActive);
	EXPECT_EQ(records[0].signalPercent, 82);
	EXPECT_EQ(records[0].band, BAND_2_4GHZ);
	EXPECT_EQ(records[0].security, SECURITY_WPA2);
	ASSERT_TRUE(records[0].bssid.has_value());
	EXPECT_EQ(*records[0].bssid, "AA:BB:CC:DD:EE:01");

	EXPECT_EQ(records[1].ssid, "Cafe");
	EXPECT_FALSE(records[1].isActive);
	EXPECT_EQ(records[1].security, SECURITY_OPEN);
	EXPECT_EQ(records[1].band, BAND_5GHZ);

	EXPECT_EQ(records[2].ssid, "Home");
	EXPECT_EQ(records[2].security, SECURITY_WPA3);
}

TEST(Parsing, DeduplicatesBySsidWithoutBssid)
{
	auto records = parseNetworkList("*:Cafe::WPA2:1:70\nno:Cafe::WPA2:1:20\n");
	ASSERT_EQ(records.size(), 1u);
	EXPECT_TRUE(records[0].isActive);
	EXPECT_EQ(records[0].signalPercent, 70);
	EXPECT_FALSE(records[0].bssid.has_value());
}

TEST(Parsing, ParsesDevicesAndActiveConnections)
{
	auto devices = parseDeviceList("eth0:ethernet\nwlan0:wifi\nlo:loopback\n");
	ASSERT_EQ(devices.size(), 3u);
	EXPECT_EQ(devices[1].device, "wlan0");
	EXPECT_EQ(devices[1].type, "wifi");

	auto active = parseActiveConnections("Wired connection 1:activated\nconnectInterface:activated\n");
	ASSERT_EQ(active.size(), 2u);
	EXPECT_EQ(active[0].name, "Wired connection 1");
	EXPECT_EQ(active[1].name, "connectInterface");
	EXPECT_EQ(active[1].state, "activated");
}

TEST(Parsing, ParsesConnectionDetails)
{
	std::string output =
		"802-11-wireless.ssid:Home\n"
		"802-11-wireless-security.key-mgmt:wpa-psk\n"
		"802-11-wireless.bssid:--\n"
		"802-11-wireless.seen-bssids:AA\\:BB\\:CC\\:DD\\:EE\\:01,AA\\:BB\\:CC\\:DD\\:EE\\:02\n"
		"802-11-wireless.mode:infrastructure\n"
		"connection.interface-name:wlan0\n";
	SavedConnectionProfile profile;
	ASSERT_TRUE(parseConnectionDetails(output, profile));
	EXPECT_EQ(profile.ssid, "Home");
	EXPECT_EQ(profile.security, SECURITY_WPA2);
	EXPECT_EQ(profile.bssid, "");
	ASSERT_EQ(profile.seenBssids.size(), 2u);
	EXPECT_EQ(profile.seenBssids[1], "AA:BB:CC:DD:EE:02");
	EXPECT_FALSE(profile.isAccessPoint);
	EXPECT_EQ(profile.interface, "wlan0");
}

TEST(Parsing, FlagsAccessPointProfiles)
{
	SavedConnectionProfile profile;
	ASSERT_TRUE(parseConnectionDetails("802-11-wireless.ssid:WiFi Connect\n802-11-wireless.mode:ap\n", profile));
	EXPECT_TRUE(profile.isAccessPoint);
}

TEST(Parsing, RejectsNonWirelessDetails)
{
	SavedConnectionProfile profile;
	EXPECT_FALSE(parseConnectionDetails("connection.interface-name:eth0\n", profile));
}

TEST(Parsing, SmallResultsLookIncomplete)
{
	EXPECT_TRUE(resultLooksIncomplete({}));
	EXPECT_TRUE(resultLooksIncomplete({ NetworkRecord{} }));
	EXPECT_FALSE(resultLooksIncomplete({ NetworkRecord{}, NetworkRecord{} }));
}
