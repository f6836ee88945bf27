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

#ifndef NETWORK_H
#define NETWORK_H

#include "util/util.hpp" // TimePoint_t

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

/**
 * Data model shared by all network components
 */

enum SecurityKind : uint8_t
{
	SECURITY_OPEN = 0,
	SECURITY_WEP,
	SECURITY_WPA,
	SECURITY_WPA2,
	SECURITY_WPA3
};

enum FrequencyBand : uint8_t
{
	BAND_UNKNOWN = 0,
	BAND_2_4GHZ,
	BAND_5GHZ,
	BAND_6GHZ
};

struct NetworkRecord
{
	std::string ssid;
	SecurityKind security = SECURITY_OPEN;
	int signalPercent = 0; // 0-100
	FrequencyBand band = BAND_UNKNOWN;
	bool isActive = false;
	std::optional<std::string> bssid;

	// Uniqueness key is bssid when present, else ssid
	const std::string &key() const { return bssid? *bssid : ssid; }
};

struct ScanCacheEntry
{
	std::vector<NetworkRecord> records;
	TimePoint_t capturedAt;
};

enum AccessPointKind : uint8_t
{
	AP_DIRECT = 0,	// Isolated, DHCP only, no default route offered
	AP_CONNECT,		// Provisioning portal with normal routing
	AP_KIND_MAX
};

/**
 * A durable profile owned by NetworkManager
 * Only ever created, activated, deactivated and deleted by name, never edited in place
 */
struct SavedConnectionProfile
{
	std::string name;
	std::string ssid;
	SecurityKind security = SECURITY_OPEN;
	std::string interface;
	std::string bssid;
	std::vector<std::string> seenBssids;
	bool isAccessPoint = false;
};

struct ConnectedNetwork
{
	std::string ssid;
	std::string interface;
	SecurityKind security = SECURITY_OPEN;
	std::string connectionName;
};

struct OperatingMode
{
	enum Type : uint8_t
	{
		IDLE = 0,
		STATION,
		ACCESS_POINT
	};

	Type type = IDLE;
	std::string connectionRef; // Station: connection profile name, AccessPoint: fixed AP connection name
	AccessPointKind apKind = AP_CONNECT;

	static OperatingMode Idle() { return {}; }
	static OperatingMode Station(std::string connection) { return { STATION, std::move(connection), AP_CONNECT }; }
	static OperatingMode AccessPoint(AccessPointKind kind, std::string name) { return { ACCESS_POINT, std::move(name), kind }; }

	bool isAccessPoint() const { return type == ACCESS_POINT; }
	bool isAccessPoint(AccessPointKind kind) const { return type == ACCESS_POINT && apKind == kind; }
	bool operator==(const OperatingMode &other) const = default;
};

enum PersistedMode : uint8_t
{
	PERSIST_DISCONNECTED = 0,
	PERSIST_CONNECTED,
	PERSIST_DIRECT,
	PERSIST_CONNECT
};

struct PersistedState
{
	PersistedMode mode = PERSIST_DISCONNECTED;
	double savedAt = 0; // Wall time in seconds since epoch
	std::optional<ConnectedNetwork> connectedNetwork;
};

/* String conversions, names match the JSON and nmcli vocabulary */

const char* getSecurityName(SecurityKind security);
const char* getBandName(FrequencyBand band);
const char* getAccessPointKindName(AccessPointKind kind); // "direct" / "connect"
const char* getAccessPointModeName(AccessPointKind kind); // "WiFi Direct" / "WiFi Connect"
const char* getPersistedModeName(PersistedMode mode);
std::string describeMode(const OperatingMode &mode);

std::optional<AccessPointKind> parseAccessPointKind(const std::string &name);
std::optional<PersistedMode> parsePersistedMode(const std::string &name);
std::optional<SecurityKind> parseSecurityName(const std::string &name);

inline PersistedMode getPersistedMode(AccessPointKind kind)
{
	return kind == AP_DIRECT? PERSIST_DIRECT : PERSIST_CONNECT;
}

#endif // NETWORK_H
