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

#include "parsing.hpp"

#include "util/util.hpp"

#include <sstream>
#include <algorithm>
#include <unordered_set>
#include <cstdlib>

std::vector<std::string> splitTerseLine(const std::string &line)
{
	std::vector<std::string> fields(1);
	for (std::size_t i = 0; i < line.size(); i++)
	{
		char c = line[i];
		if (c == '\\' && i+1 < line.size() && (line[i+1] == ':' || line[i+1] == '\\'))
			fields.back().push_back(line[++i]);
		else if (c == ':')
			fields.emplace_back();
		else
			fields.back().push_back(c);
	}
	return fields;
}

static bool parseInteger(const std::string &str, int &value)
{
	if (str.empty()) return false;
	char *end;
	long val = std::strtol(str.c_str(), &end, 10);
	if (end == str.c_str() || *end != '\0') return false;
	value = (int)val;
	return true;
}

SecurityKind parseSecurity(const std::string &security)
{
	std::string sec = toLower(trimString(security));
	if (sec.empty() || sec == "--")
		return SECURITY_OPEN;
	if (sec.find("wpa3") != std::string::npos || sec.find("sae") != std::string::npos)
		return SECURITY_WPA3;
	if (sec.find("wpa2") != std::string::npos || sec.find("wpa-psk") != std::string::npos)
		return SECURITY_WPA2;
	if (sec.find("wpa") != std::string::npos)
		return SECURITY_WPA;
	if (sec.find("wep") != std::string::npos)
		return SECURITY_WEP;
	return SECURITY_OPEN;
}

int parseSignal(const std::string &signal)
{
	std::string sig = trimString(signal);
	std::size_t unit = sig.find("dBm");
	if (unit != std::string::npos)
		sig = trimString(sig.substr(0, unit));
	int value;
	if (!parseInteger(sig, value))
		return 0;
	if (value >= 0)
		return std::min(value, 100);
	// dBm: -100 => 0%, -50 => 100%
	if (value <= -100) return 0;
	if (value >= -50) return 100;
	return (value + 100) * 2;
}

FrequencyBand parseBand(const std::string &channel)
{
	int chan;
	if (!parseInteger(trimString(channel), chan))
		return BAND_UNKNOWN;
	if (chan >= 1 && chan <= 14)
		return BAND_2_4GHZ;
	if ((chan >= 36 && chan <= 64) || (chan >= 100 && chan <= 165))
		return BAND_5GHZ;
	if (chan >= 1 && chan <= 233)
		return BAND_6GHZ;
	return BAND_UNKNOWN;
}

std::vector<NetworkRecord> parseNetworkList(const std::string &output)
{
	std::vector<NetworkRecord> records;
	std::unordered_set<std::string> seen;
	std::stringstream ss(output);
	std::string line;
	while (std::getline(ss, line, '\n'))
	{
		line = trimString(line);
		if (line.empty() || line.starts_with("Warning:")) continue;
		std::vector<std::string> fields = splitTerseLine(line);
		if (fields.size() < 6) continue;

		NetworkRecord record;
		record.ssid = fields[1];
		if (record.ssid.empty() || record.ssid == "--")
			continue; // Hidden network
		record.isActive = toLower(fields[0]) == "yes" || fields[0] == "*";
		if (!fields[2].empty() && fields[2] != "--")
			record.bssid = fields[2];
		record.security = parseSecurity(fields[3]);
		record.band = parseBand(fields[4]);
		record.signalPercent = parseSignal(fields[5]);

		if (!seen.insert(record.key()).second)
			continue; // Duplicate, first occurrence wins
		records.push_back(std::move(record));
	}
	return records;
}

std::vector<DeviceEntry> parseDeviceList(const std::string &output)
{
	std::vector<DeviceEntry> devices;
	std::stringstream ss(output);
	std::string line;
	while (std::getline(ss, line, '\n'))
	{
		line = trimString(line);
		if (line.empty() || line.starts_with("Warning:")) continue;
		std::vector<std::string> fields = splitTerseLine(line);
		if (fields.size() < 2) continue;
		devices.push_back({ fields[0], fields[1] });
	}
	return devices;
}

std::vector<ActiveConnectionEntry> parseActiveConnections(const std::string &output)
{
	std::vector<ActiveConnectionEntry> connections;
	std::stringstream ss(output);
	std::string line;
	while (std::getline(ss, line, '\n'))
	{
		line = trimString(line);
		if (line.empty() || line.starts_with("Warning:")) continue;
		std::vector<std::string> fields = splitTerseLine(line);
		connections.push_back({ fields[0], fields.size() > 1? fields[1] : "" });
	}
	return connections;
}

static std::string unescapeTerse(const std::string &value)
{
	std::string out;
	out.reserve(value.size());
	for (std::size_t i = 0; i < value.size(); i++)
	{
		if (value[i] == '\\' && i+1 < value.size() && (value[i+1] == ':' || value[i+1] == '\\'))
			i++;
		out.push_back(value[i]);
	}
	return out;
}

bool parseConnectionDetails(const std::string &output, SavedConnectionProfile &profile)
{
	bool isWireless = false;
	std::stringstream ss(output);
	std::string line;
	while (std::getline(ss, line, '\n'))
	{
		line = trimString(line);
		if (line.empty() || line.starts_with("Warning:")) continue;
		std::size_t sep = line.find(':');
		if (sep == std::string::npos) continue;
		std::string key = toLower(trimString(line.substr(0, sep)));
		std::string value = unescapeTerse(trimString(line.substr(sep+1)));
		if (key == "802-11-wireless.ssid")
		{
			profile.ssid = value;
			isWireless = true;
		}
		else if (key == "802-11-wireless-security.key-mgmt")
			profile.security = parseSecurity(value);
		else if (key == "802-11-wireless.bssid")
			profile.bssid = value == "--"? "" : value;
		else if (key == "802-11-wireless.seen-bssids")
		{
			profile.seenBssids.clear();
			if (value.empty() || value == "--") continue;
			std::stringstream bs(value);
			std::string bssid;
			while (std::getline(bs, bssid, ','))
			{
				bssid = trimString(bssid);
				if (!bssid.empty()) profile.seenBssids.push_back(bssid);
			}
		}
		else if (key == "802-11-wireless.mode")
			profile.isAccessPoint = toLower(value) == "ap";
		else if (key == "connection.interface-name" || key == "general.devices")
		{
			if (!value.empty() && value != "--")
				profile.interface = value;
		}
	}
	return isWireless;
}
