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

#include "network.hpp"

const char* getSecurityName(SecurityKind security)
{
	switch (security)
	{
		case SECURITY_WEP: return "wep";
		case SECURITY_WPA: return "wpa";
		case SECURITY_WPA2: return "wpa2";
		case SECURITY_WPA3: return "wpa3";
		default: return "open";
	}
}

const char* getBandName(FrequencyBand band)
{
	switch (band)
	{
		case BAND_2_4GHZ: return "2.4GHz";
		case BAND_5GHZ: return "5GHz";
		case BAND_6GHZ: return "6GHz";
		default: return "unknown";
	}
}

const char* getAccessPointKindName(AccessPointKind kind)
{
	return kind == AP_DIRECT? "direct" : "connect";
}

const char* getAccessPointModeName(AccessPointKind kind)
{
	return kind == AP_DIRECT? "WiFi Direct" : "WiFi Connect";
}

const char* getPersistedModeName(PersistedMode mode)
{
	switch (mode)
	{
		case PERSIST_CONNECTED: return "connected";
		case PERSIST_DIRECT: return "direct";
		case PERSIST_CONNECT: return "connect";
		default: return "disconnected";
	}
}

std::string describeMode(const OperatingMode &mode)
{
	switch (mode.type)
	{
		case OperatingMode::STATION:
			return asprintf_s("Station(%s)", mode.connectionRef.c_str());
		case OperatingMode::ACCESS_POINT:
			return asprintf_s("AccessPoint(%s, %s)", getAccessPointKindName(mode.apKind), mode.connectionRef.c_str());
		default:
			return "Idle";
	}
}

std::optional<AccessPointKind> parseAccessPointKind(const std::string &name)
{
	if (name == "direct") return AP_DIRECT;
	if (name == "connect") return AP_CONNECT;
	return std::nullopt;
}

std::optional<PersistedMode> parsePersistedMode(const std::string &name)
{
	if (name == "connected") return PERSIST_CONNECTED;
	if (name == "direct") return PERSIST_DIRECT;
	if (name == "connect") return PERSIST_CONNECT;
	if (name == "disconnected") return PERSIST_DISCONNECTED;
	return std::nullopt;
}

std::optional<SecurityKind> parseSecurityName(const std::string &name)
{
	if (name == "open") return SECURITY_OPEN;
	if (name == "wep") return SECURITY_WEP;
	if (name == "wpa") return SECURITY_WPA;
	if (name == "wpa2") return SECURITY_WPA2;
	if (name == "wpa3") return SECURITY_WPA3;
	return std::nullopt;
}
