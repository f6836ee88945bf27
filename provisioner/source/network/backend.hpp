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

#ifndef BACKEND_H
#define BACKEND_H

#include "network.hpp"
#include "parsing.hpp"

#include "util/error.hpp"

#include <string>
#include <vector>

struct AccessPointProfile
{
	std::string connectionName;
	std::string ssid;
	std::string interface;
	std::string gateway; // Address of the AP itself, a /24 subnet is assumed
	std::string passphrase; // Empty for an open access point
	bool isolated = false;
};

/**
 * The OS network-management subsystem
 * Every operation is a bounded, blocking call returning an error with diagnostic text on failure
 */
class NetworkBackend
{
public:
	virtual ~NetworkBackend() = default;

	// Probe whether the subsystem is usable at all, returns its version
	[[nodiscard]] virtual std::optional<ErrorMessage> checkAvailable(std::string &version) = 0;

	[[nodiscard]] virtual std::optional<ErrorMessage> listDevices(std::vector<DeviceEntry> &devices) = 0;

	[[nodiscard]] virtual std::optional<ErrorMessage> requestScan(const std::string &interface) = 0;
	[[nodiscard]] virtual std::optional<ErrorMessage> listNetworks(const std::string &interface, std::vector<NetworkRecord> &records) = 0;

	virtual bool connectionExists(const std::string &name) = 0;
	[[nodiscard]] virtual std::optional<ErrorMessage> createAccessPoint(const AccessPointProfile &profile) = 0;
	[[nodiscard]] virtual std::optional<ErrorMessage> setAutoconnect(const std::string &name, bool enabled) = 0;
	[[nodiscard]] virtual std::optional<ErrorMessage> activateConnection(const std::string &name, int timeoutMS) = 0;
	[[nodiscard]] virtual std::optional<ErrorMessage> deactivateConnection(const std::string &name) = 0;
	[[nodiscard]] virtual std::optional<ErrorMessage> deleteConnection(const std::string &name) = 0;
	// Creates a new station profile for the network and activates it
	[[nodiscard]] virtual std::optional<ErrorMessage> connectNetwork(const std::string &interface, const std::string &ssid,
		const std::string &passphrase, int timeoutMS) = 0;

	[[nodiscard]] virtual std::optional<ErrorMessage> listActiveConnectionNames(std::vector<std::string> &names) = 0;
	// Wireless profiles including their details, access point profiles are flagged, not filtered
	[[nodiscard]] virtual std::optional<ErrorMessage> listWifiConnections(bool activeOnly, std::vector<SavedConnectionProfile> &profiles) = 0;
};

#endif // BACKEND_H
