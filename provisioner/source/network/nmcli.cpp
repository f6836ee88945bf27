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

#include "nmcli.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include <sstream>
#include <algorithm>

// nmcli waits on activation itself (-w), the process gets some headroom on top
static const int activationHeadroomMS = 5000;

// nmcli exit status when the -w timeout expired
static const int nmcliExitTimeout = 3;

static ErrorMessage activationError(const CommandResult &result, const std::string &context)
{
	ErrorMessage error = result.toError(context);
	if (result.exitStatus == nmcliExitTimeout)
		error.code = ERROR_TIMEOUT;
	return error;
}

CommandResult NmcliBackend::nmcli(const std::vector<std::string> &args, int timeoutMS)
{
	std::vector<std::string> cmd;
	cmd.reserve(args.size()+1);
	cmd.push_back("nmcli");
	cmd.insert(cmd.end(), args.begin(), args.end());
	return runner.run(cmd, timeoutMS < 0? commandTimeoutMS : timeoutMS);
}

std::optional<ErrorMessage> NmcliBackend::checkAvailable(std::string &version)
{
	CommandResult result = nmcli({ "--version" });
	if (!result.success)
		return ErrorMessage(asprintf_s("NetworkManager not available: %s", result.diagnostic().c_str()),
			ERROR_HARDWARE_UNAVAILABLE);
	version = result.output;
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::listDevices(std::vector<DeviceEntry> &devices)
{
	CommandResult result = nmcli({ "-t", "-f", "DEVICE,TYPE", "device", "status" });
	if (!result.success)
		return result.toError("Failed to list network devices");
	devices = parseDeviceList(result.output);
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::requestScan(const std::string &interface)
{
	CommandResult result = nmcli({ "device", "wifi", "rescan", "ifname", interface });
	if (!result.success)
		return result.toError("Failed to request rescan");
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::listNetworks(const std::string &interface, std::vector<NetworkRecord> &records)
{
	CommandResult result = nmcli({ "-t", "-f", "ACTIVE,SSID,BSSID,SECURITY,CHAN,SIGNAL",
		"device", "wifi", "list", "ifname", interface });
	if (!result.success)
		return result.toError("Failed to list networks");
	records = parseNetworkList(result.output);
	return std::nullopt;
}

bool NmcliBackend::connectionExists(const std::string &name)
{
	return nmcli({ "connection", "show", name }).success;
}

std::optional<ErrorMessage> NmcliBackend::createAccessPoint(const AccessPointProfile &profile)
{
	CommandResult result = nmcli({ "connection", "add", "type", "wifi",
		"ifname", profile.interface,
		"con-name", profile.connectionName,
		"ssid", profile.ssid });
	if (!result.success)
		return result.toError(asprintf_s("Failed to create access point '%s'", profile.connectionName.c_str()));

	std::vector<std::string> modify = { "connection", "modify", profile.connectionName,
		"802-11-wireless.mode", "ap",
		"802-11-wireless.band", "bg",
		"ipv4.never-default", "yes",
		"connection.autoconnect", "no",
		"ipv4.method", "manual",
		"ipv4.addresses", profile.gateway + "/24" };
	if (profile.isolated)
		modify.insert(modify.end(), { "802-11-wireless.powersave", "0" });
	if (!profile.passphrase.empty())
		modify.insert(modify.end(), { "wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.psk", profile.passphrase });
	result = nmcli(modify);
	if (!result.success)
	{
		ErrorMessage error = result.toError(asprintf_s("Failed to configure access point '%s'", profile.connectionName.c_str()));
		// Do not leave a half-configured profile behind
		CommandResult cleanup = nmcli({ "connection", "delete", profile.connectionName });
		if (!cleanup.success)
			LOG(LCommand, LWarn, "Failed to remove half-configured profile '%s': %s",
				profile.connectionName.c_str(), cleanup.diagnostic().c_str());
		return error;
	}
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::setAutoconnect(const std::string &name, bool enabled)
{
	CommandResult result = nmcli({ "connection", "modify", name, "connection.autoconnect", enabled? "yes" : "no" });
	if (!result.success)
		return result.toError(asprintf_s("Failed to set autoconnect of '%s'", name.c_str()));
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::activateConnection(const std::string &name, int timeoutMS)
{
	int waitS = std::max(1, timeoutMS/1000);
	CommandResult result = nmcli({ "-w", std::to_string(waitS), "connection", "up", name },
		timeoutMS + activationHeadroomMS);
	if (!result.success)
		return activationError(result, asprintf_s("Failed to activate '%s'", name.c_str()));
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::deactivateConnection(const std::string &name)
{
	CommandResult result = nmcli({ "connection", "down", name });
	if (!result.success)
		return result.toError(asprintf_s("Failed to deactivate '%s'", name.c_str()));
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::deleteConnection(const std::string &name)
{
	CommandResult result = nmcli({ "connection", "delete", name });
	if (!result.success)
		return result.toError(asprintf_s("Failed to delete '%s'", name.c_str()));
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::connectNetwork(const std::string &interface, const std::string &ssid,
	const std::string &passphrase, int timeoutMS)
{
	int waitS = std::max(1, timeoutMS/1000);
	std::vector<std::string> args = { "-w", std::to_string(waitS), "device", "wifi", "connect", ssid };
	if (!passphrase.empty())
		args.insert(args.end(), { "password", passphrase });
	args.insert(args.end(), { "ifname", interface });
	CommandResult result = nmcli(args, timeoutMS + activationHeadroomMS);
	if (!result.success)
		return activationError(result, asprintf_s("Failed to connect to '%s'", ssid.c_str()));
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::listActiveConnectionNames(std::vector<std::string> &names)
{
	CommandResult result = nmcli({ "-t", "-f", "NAME,STATE", "connection", "show", "--active" });
	if (!result.success)
		return result.toError("Failed to list active connections");
	names.clear();
	for (auto &entry : parseActiveConnections(result.output))
		names.push_back(entry.name);
	return std::nullopt;
}

std::optional<ErrorMessage> NmcliBackend::listWifiConnections(bool activeOnly, std::vector<SavedConnectionProfile> &profiles)
{
	std::vector<std::string> args = { "-t", "-f", "NAME,TYPE,DEVICE", "connection", "show" };
	if (activeOnly)
		args.push_back("--active");
	CommandResult result = nmcli(args);
	if (!result.success)
		return result.toError("Failed to list connections");

	profiles.clear();
	std::stringstream ss(result.output);
	std::string line;
	while (std::getline(ss, line, '\n'))
	{
		line = trimString(line);
		if (line.empty() || line.starts_with("Warning:")) continue;
		std::vector<std::string> fields = splitTerseLine(line);
		if (fields.size() < 3) continue;
		const std::string &name = fields[0], &type = fields[1], &device = fields[2];
		if (type != "wifi" && type != "802-11-wireless") continue;
		bool hasDevice = !device.empty() && device != "--";
		if (activeOnly && !hasDevice) continue;

		CommandResult details = nmcli({ "-t", "-f",
			"802-11-wireless.ssid,802-11-wireless-security.key-mgmt,802-11-wireless.bssid,"
			"802-11-wireless.seen-bssids,802-11-wireless.mode,connection.interface-name",
			"connection", "show", name });
		if (!details.success)
		{
			LOG(LCommand, LDarn, "Failed to read details of connection '%s': %s", name.c_str(), details.diagnostic().c_str());
			continue;
		}
		SavedConnectionProfile profile;
		profile.name = name;
		if (!parseConnectionDetails(details.output, profile))
			continue;
		if (profile.interface.empty() && hasDevice)
			profile.interface = device;
		profiles.push_back(std::move(profile));
	}
	return std::nullopt;
}
