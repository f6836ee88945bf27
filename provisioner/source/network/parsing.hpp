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

#ifndef PARSING_H
#define PARSING_H

#include "network.hpp"

#include <string>
#include <vector>

/**
 * Parsing of nmcli terse (-t) output into the network data model
 */

struct DeviceEntry
{
	std::string device;
	std::string type;
};

struct ActiveConnectionEntry
{
	std::string name;
	std::string state;
};

// Splits a terse line on unescaped ':' and unescapes "\:" and "\\"
std::vector<std::string> splitTerseLine(const std::string &line);

SecurityKind parseSecurity(const std::string &security);
int parseSignal(const std::string &signal);
FrequencyBand parseBand(const std::string &channel);

/**
 * Parses ACTIVE,SSID,BSSID,SECURITY,CHAN,SIGNAL lines
 * Skips hidden networks (empty or "--" SSID), duplicate BSSIDs keep the first occurrence
 */
std::vector<NetworkRecord> parseNetworkList(const std::string &output);

// Parses DEVICE,TYPE lines
std::vector<DeviceEntry> parseDeviceList(const std::string &output);

// Parses NAME,STATE lines
std::vector<ActiveConnectionEntry> parseActiveConnections(const std::string &output);

/**
 * Parses the "field:value" lines of `nmcli -t -f ... connection show NAME` into a profile
 * Returns false if the output did not describe a wireless profile
 */
bool parseConnectionDetails(const std::string &output, SavedConnectionProfile &profile);

/**
 * A scan result this small usually means the radio has not finished rescanning yet
 * Kept as a named predicate since the threshold is heuristic and platform dependent
 */
inline bool resultLooksIncomplete(const std::vector<NetworkRecord> &records)
{
	return records.size() <= 1;
}

#endif // PARSING_H
