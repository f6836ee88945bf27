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

#ifndef NMCLI_H
#define NMCLI_H

#include "backend.hpp"
#include "system/command.hpp"

/**
 * NetworkManager backend driving nmcli in terse mode
 */
class NmcliBackend : public NetworkBackend
{
public:
	NmcliBackend(CommandRunner &runner, int commandTimeoutMS)
		: runner(runner), commandTimeoutMS(commandTimeoutMS) {}

	HANDLE_ERROR checkAvailable(std::string &version) override;
	HANDLE_ERROR listDevices(std::vector<DeviceEntry> &devices) override;
	HANDLE_ERROR requestScan(const std::string &interface) override;
	HANDLE_ERROR listNetworks(const std::string &interface, std::vector<NetworkRecord> &records) override;
	bool connectionExists(const std::string &name) override;
	HANDLE_ERROR createAccessPoint(const AccessPointProfile &profile) override;
	HANDLE_ERROR setAutoconnect(const std::string &name, bool enabled) override;
	HANDLE_ERROR activateConnection(const std::string &name, int timeoutMS) override;
	HANDLE_ERROR deactivateConnection(const std::string &name) override;
	HANDLE_ERROR deleteConnection(const std::string &name) override;
	HANDLE_ERROR connectNetwork(const std::string &interface, const std::string &ssid,
		const std::string &passphrase, int timeoutMS) override;
	HANDLE_ERROR listActiveConnectionNames(std::vector<std::string> &names) override;
	HANDLE_ERROR listWifiConnections(bool activeOnly, std::vector<SavedConnectionProfile> &profiles) override;

private:
	CommandRunner &runner;
	int commandTimeoutMS;

	CommandResult nmcli(const std::vector<std::string> &args, int timeoutMS = -1);
};

#endif // NMCLI_H
