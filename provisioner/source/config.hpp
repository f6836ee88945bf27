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

#ifndef CONFIG_H
#define CONFIG_H

#include "network/network.hpp"

#include "util/error.hpp"

#include "nlohmann/json.hpp"
using json = nlohmann::json;

#include <string>
#include <vector>
#include <optional>

/**
 * Parsing and writing of the service configuration and other JSON files
 */


/* Structures */

struct ServerConfig
{
	std::string host = "0.0.0.0";
	int port = 8000;
	std::string logLevel = "info";
	std::string uiDirectory = "ui";
	std::string logFile; // Empty for stdout only
};

struct WifiConfig
{
	std::optional<std::string> interface; // Discovered if not set
	std::string stateFile = "wifi_state.json";
	float stateMaxAge = 86400;
	// Durations in seconds
	float commandTimeout = 30;
	float connectTimeout = 30;
	float rescanDelay = 2;
	int scanRetries = 3;
	float hotspotDisableDelay = 3;
	float connectSettleDelay = 2;
	float helperSettleDelay = 1;
	float helperGrace = 5;
	float cacheTTL = 300;
	bool startupCheck = true;
	int startupScanRetries = 5;
	std::string gateway = "192.168.42.1";
	std::string dhcpRange = "192.168.42.2,192.168.42.20";
	std::string helperLogFile = "/var/log/dnsmasq.log";
	std::string helperBinary = "dnsmasq";
	std::string helperPidFile = "/run/wifi-provisioner-dnsmasq.pid";
};

struct AccessPointConfig
{
	std::string connectionName;
	std::string hotspotName;
	std::string passphrase; // Empty for an open access point
};

struct CorsConfig
{
	bool enabled = true;
	std::vector<std::string> origins = { "*" };
};

struct ProvisionerConfig
{
	ServerConfig server;
	WifiConfig wifi;
	AccessPointConfig accessPoints[AP_KIND_MAX] = {
		{ "directInterface", "WiFiDirect", "" },
		{ "connectInterface", "WiFi Connect", "" }
	};
	CorsConfig cors;

	const AccessPointConfig &accessPoint(AccessPointKind kind) const { return accessPoints[kind]; }
};

static inline int toMS(float seconds)
{
	return (int)(seconds*1000.0f);
}


/* Functions */

HANDLE_ERROR writeJSON(const std::string &path, const json &data);
HANDLE_ERROR readJSON(const std::string &path, json &data);

json configToJSON(const ProvisionerConfig &config);
HANDLE_ERROR configFromJSON(const json &cfg, ProvisionerConfig &config);

/**
 * Merges the config file over the current values
 * A missing file is reported with code ERROR_NOT_FOUND
 */
HANDLE_ERROR parseConfigFile(const std::string &path, ProvisionerConfig &config);
HANDLE_ERROR storeConfigFile(const std::string &path, const ProvisionerConfig &config);

// Applies the WIFI_* environment variables, invalid values are skipped with a warning
void applyEnvironmentOverrides(ProvisionerConfig &config);

HANDLE_ERROR validateConfig(const ProvisionerConfig &config);

/**
 * Merges the config file and then the environment over the current values
 * An unparsable config file is ignored with a warning
 */
void loadConfig(const std::string &path, ProvisionerConfig &config);

#endif // CONFIG_H
