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

#ifndef FAKES_H
#define FAKES_H

#include "network/backend.hpp"
#include "network/interface.hpp"
#include "network/scan_cache.hpp"
#include "network/modes.hpp"
#include "network/workflow.hpp"
#include "system/command.hpp"
#include "system/dhcp_helper.hpp"
#include "state_store.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include "gtest/gtest.h"

#include <map>
#include <set>
#include <deque>
#include <mutex>
#include <functional>
#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <filesystem>
#include <unistd.h>

/**
 * Shared fakes for the provisioner tests
 * The fake backend models NetworkManager on a single radio: activating a connection replaces the active one
 */

class CallLog
{
public:
	void add(std::string call)
	{
		std::unique_lock lock(access);
		calls.push_back(std::move(call));
	}
	int size()
	{
		std::unique_lock lock(access);
		return (int)calls.size();
	}
	void clear() { calls.clear(); }
	const std::vector<std::string> &all() const { return calls; }

	bool contains(const std::string &call) const
	{
		return std::find(calls.begin(), calls.end(), call) != calls.end();
	}
	int count(const std::string &call) const
	{
		return (int)std::count(calls.begin(), calls.end(), call);
	}
	// Position of the first matching call at or after from, -1 if none
	int find(const std::string &call, int from = 0) const
	{
		for (int i = std::max(from, 0); i < (int)calls.size(); i++)
			if (calls[i] == call) return i;
		return -1;
	}

private:
	std::mutex access;
	std::vector<std::string> calls;
};

inline NetworkRecord makeNetwork(const std::string &ssid, int signal = 50, std::optional<std::string> bssid = std::nullopt)
{
	NetworkRecord record;
	record.ssid = ssid;
	record.security = SECURITY_WPA2;
	record.signalPercent = signal;
	record.band = BAND_2_4GHZ;
	record.bssid = std::move(bssid);
	return record;
}

class FakeNetworkBackend : public NetworkBackend
{
public:
	struct Profile
	{
		SavedConnectionProfile profile;
		bool autoconnect = false;
	};

	CallLog &log;

	bool available = true;
	bool failDevices = false;
	std::vector<DeviceEntry> devices = { { "eth0", "ethernet" }, { "wlan0", "wifi" } };

	std::vector<NetworkRecord> visible;
	std::deque<std::vector<NetworkRecord>> scanQueue; // Consumed before visible is used
	bool failListNetworks = false;
	bool failActiveList = false;
	std::function<void()> onListNetworks; // Runs inside the listing, e.g. to hold a scan in progress

	bool failCreate = false;
	bool failConnect = false;
	std::optional<std::string> connectLandsOn; // connectNetwork ends up on this SSID instead
	std::set<std::string> failActivate, failDeactivate, failDelete;

	std::map<std::string, Profile> profiles;
	std::map<std::string, AccessPointProfile> createdAccessPoints;
	std::vector<std::string> active;

	FakeNetworkBackend(CallLog &log) : log(log) {}

	void addStation(const std::string &name, const std::string &ssid, const std::string &bssid = "",
		std::vector<std::string> seen = {}, bool isActive = false)
	{
		Profile entry;
		entry.profile.name = name;
		entry.profile.ssid = ssid;
		entry.profile.security = SECURITY_WPA2;
		entry.profile.interface = "wlan0";
		entry.profile.bssid = bssid;
		entry.profile.seenBssids = std::move(seen);
		profiles[name] = entry;
		if (isActive) active = { name };
	}

	void addAccessPoint(const std::string &name, const std::string &ssid, bool isActive)
	{
		Profile entry;
		entry.profile.name = name;
		entry.profile.ssid = ssid;
		entry.profile.interface = "wlan0";
		entry.profile.isAccessPoint = true;
		profiles[name] = entry;
		if (isActive) active = { name };
	}

	bool isActive(const std::string &name) const
	{
		return std::find(active.begin(), active.end(), name) != active.end();
	}

	bool autoconnect(const std::string &name) const
	{
		auto it = profiles.find(name);
		return it != profiles.end() && it->second.autoconnect;
	}

	HANDLE_ERROR checkAvailable(std::string &version) override
	{
		log.add("checkAvailable");
		if (!available)
			return ErrorMessage("nmcli not found", ERROR_HARDWARE_UNAVAILABLE);
		version = "nmcli tool, version 1.42.4";
		return std::nullopt;
	}

	HANDLE_ERROR listDevices(std::vector<DeviceEntry> &result) override
	{
		log.add("listDevices");
		if (failDevices)
			return ErrorMessage("Error: NetworkManager is not running.", ERROR_COMMAND_FAILED);
		result = devices;
		return std::nullopt;
	}

	HANDLE_ERROR requestScan(const std::string &interface) override
	{
		log.add("requestScan:" + interface);
		return std::nullopt;
	}

	HANDLE_ERROR listNetworks(const std::string &interface, std::vector<NetworkRecord> &records) override
	{
		log.add("listNetworks");
		if (onListNetworks)
			onListNetworks();
		if (failListNetworks)
			return ErrorMessage("Error: Scanning not allowed while unavailable", ERROR_COMMAND_FAILED);
		if (!scanQueue.empty())
		{
			records = scanQueue.front();
			scanQueue.pop_front();
		}
		else
			records = visible;
		return std::nullopt;
	}

	bool connectionExists(const std::string &name) override
	{
		log.add("exists:" + name);
		return profiles.find(name) != profiles.end();
	}

	HANDLE_ERROR createAccessPoint(const AccessPointProfile &profile) override
	{
		log.add("create:" + profile.connectionName);
		if (failCreate)
			return ErrorMessage("Error: Failed to add connection", ERROR_COMMAND_FAILED);
		addAccessPoint(profile.connectionName, profile.ssid, false);
		createdAccessPoints[profile.connectionName] = profile;
		return std::nullopt;
	}

	HANDLE_ERROR setAutoconnect(const std::string &name, bool enabled) override
	{
		log.add("autoconnect:" + name + (enabled? ":yes" : ":no"));
		auto it = profiles.find(name);
		if (it == profiles.end())
			return ErrorMessage("Error: unknown connection '" + name + "'", ERROR_COMMAND_FAILED);
		it->second.autoconnect = enabled;
		return std::nullopt;
	}

	HANDLE_ERROR activateConnection(const std::string &name, int) override
	{
		log.add("activate:" + name);
		if (profiles.find(name) == profiles.end())
			return ErrorMessage("Error: unknown connection '" + name + "'", ERROR_COMMAND_FAILED);
		if (failActivate.count(name))
		{ // The radio has one device, its current connection is torn down before the attempt
			active.clear();
			return ErrorMessage("Error: Connection activation failed", ERROR_COMMAND_FAILED);
		}
		active = { name };
		return std::nullopt;
	}

	HANDLE_ERROR deactivateConnection(const std::string &name) override
	{
		log.add("deactivate:" + name);
		if (failDeactivate.count(name) || !isActive(name))
			return ErrorMessage("Error: '" + name + "' is not an active connection", ERROR_COMMAND_FAILED);
		active.erase(std::remove(active.begin(), active.end(), name), active.end());
		return std::nullopt;
	}

	HANDLE_ERROR deleteConnection(const std::string &name) override
	{
		log.add("delete:" + name);
		if (failDelete.count(name) || profiles.find(name) == profiles.end())
			return ErrorMessage("Error: unknown connection '" + name + "'", ERROR_COMMAND_FAILED);
		profiles.erase(name);
		active.erase(std::remove(active.begin(), active.end(), name), active.end());
		return std::nullopt;
	}

	HANDLE_ERROR connectNetwork(const std::string &interface, const std::string &ssid,
		const std::string &, int) override
	{
		log.add("connectNetwork:" + ssid);
		if (failConnect)
			return ErrorMessage("Error: Connection activation failed: secrets were required", ERROR_TIMEOUT);
		std::string joined = connectLandsOn.value_or(ssid);
		addStation(joined, joined, "", {}, true);
		profiles[joined].profile.interface = interface;
		return std::nullopt;
	}

	HANDLE_ERROR listActiveConnectionNames(std::vector<std::string> &names) override
	{
		log.add("listActive");
		if (failActiveList)
			return ErrorMessage("Error: NetworkManager is not running.", ERROR_COMMAND_FAILED);
		names = active;
		return std::nullopt;
	}

	HANDLE_ERROR listWifiConnections(bool activeOnly, std::vector<SavedConnectionProfile> &result) override
	{
		log.add(activeOnly? "listWifi:active" : "listWifi");
		result.clear();
		for (auto &entry : profiles)
		{
			if (activeOnly && !isActive(entry.first)) continue;
			result.push_back(entry.second.profile);
		}
		return std::nullopt;
	}
};

class FakeDhcpHelper : public DhcpHelper
{
public:
	CallLog &log;
	bool isRunning = false;
	bool failStart = false;
	std::optional<DhcpHelperConfig> lastConfig;

	FakeDhcpHelper(CallLog &log) : log(log) {}

	HANDLE_ERROR start(const DhcpHelperConfig &config) override
	{
		log.add(config.isolated? "helper.start:isolated" : "helper.start:routed");
		if (failStart)
			return ErrorMessage("DHCP helper failed to start: address already in use", ERROR_COMMAND_FAILED);
		isRunning = true;
		lastConfig = config;
		return std::nullopt;
	}

	bool stop() override
	{
		log.add("helper.stop");
		isRunning = false;
		return true;
	}

	bool running() override { return isRunning; }

	bool stopOrphaned() override
	{
		log.add("helper.stopOrphaned");
		return true;
	}
};

/**
 * Answers commands by their formatted command line, exact matches before prefixes
 * Unmatched commands succeed without output
 */
class ScriptedCommandRunner : public CommandRunner
{
public:
	std::vector<std::vector<std::string>> calls;
	std::vector<int> timeouts;

	static CommandResult ok(const std::string &output = "")
	{
		CommandResult result;
		result.success = true;
		result.exitStatus = 0;
		result.output = output;
		return result;
	}

	static CommandResult fail(int exitStatus, const std::string &error)
	{
		CommandResult result;
		result.exitStatus = exitStatus;
		result.error = error;
		return result;
	}

	void respond(const std::string &prefix, CommandResult result)
	{
		responses.emplace_back(prefix, std::move(result));
	}

	void respondExact(const std::string &line, CommandResult result)
	{
		exactResponses[line] = std::move(result);
	}

	std::string line(int index) const { return formatCommandLine(calls.at(index)); }

	bool ran(const std::string &line) const
	{
		return std::any_of(calls.begin(), calls.end(),
			[&](const std::vector<std::string> &args) { return formatCommandLine(args) == line; });
	}

	CommandResult run(const std::vector<std::string> &args, int timeoutMS, const std::string *) override
	{
		calls.push_back(args);
		timeouts.push_back(timeoutMS);
		std::string cmd = formatCommandLine(args);
		auto exact = exactResponses.find(cmd);
		if (exact != exactResponses.end())
			return exact->second;
		for (auto &response : responses)
			if (cmd.starts_with(response.first)) return response.second;
		return ok();
	}

private:
	std::map<std::string, CommandResult> exactResponses;
	std::vector<std::pair<std::string, CommandResult>> responses;
};

// Per-test scratch directory, removed by the owner
inline std::filesystem::path testDirectory()
{
	const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
	std::filesystem::path dir = std::filesystem::temp_directory_path() /
		asprintf_s("provisioner_%d_%s_%s", (int)getpid(), info->test_suite_name(), info->name());
	std::filesystem::create_directories(dir);
	return dir;
}

inline ModeSettings testModeSettings()
{
	ModeSettings settings;
	settings.accessPoints[AP_DIRECT] = { "directInterface", "WiFiDirect", "" };
	settings.accessPoints[AP_CONNECT] = { "connectInterface", "WiFi Connect", "" };
	settings.activationTimeoutMS = 1000;
	settings.helperSettleMS = 0;
	return settings;
}

inline WorkflowSettings testWorkflowSettings()
{
	WorkflowSettings settings;
	settings.rescanDelayMS = 0;
	settings.scanRetries = 3;
	settings.suspendSettleMS = 0;
	settings.connectSettleMS = 0;
	settings.connectTimeoutMS = 1000;
	settings.startupCheck = true;
	settings.startupScanRetries = 2;
	return settings;
}

/**
 * The full component graph on top of the fakes, with all delays disabled
 */
struct ProvisionerHarness
{
	std::filesystem::path directory;
	CallLog log;
	FakeNetworkBackend backend;
	FakeDhcpHelper helper;
	InterfaceResolver resolver;
	ScanCache cache;
	StateStore store;
	ModeOrchestrator modes;
	ConnectivityWorkflow workflow;

	ProvisionerHarness(WorkflowSettings settings = testWorkflowSettings())
		: directory(testDirectory()), backend(log), helper(log), resolver(backend), cache(300000),
		store((directory / "wifi_state.json").string(), 86400),
		modes(backend, helper, resolver, cache, store, testModeSettings()),
		workflow(backend, modes, resolver, cache, store, helper, settings)
	{
		SetLogLevel(LWarn);
	}

	~ProvisionerHarness()
	{
		std::error_code ec;
		std::filesystem::remove_all(directory, ec);
	}
};

#endif // FAKES_H
