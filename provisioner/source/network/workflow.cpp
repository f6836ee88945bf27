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

#include "workflow.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include <algorithm>

/**
 * Restores the suspended access point when leaving scope
 * The scan itself may fail, the access point comes back regardless
 */
class AccessPointResume
{
public:
	AccessPointResume(ModeOrchestrator &modes, AccessPointKind kind) : modes(modes), kind(kind) {}
	~AccessPointResume()
	{
		if (!done)
		{
			auto error = resume();
			if (error)
				LOG(LScan, LError, "Failed to restore %s after scan: %s", getAccessPointModeName(kind), error->c_str());
		}
	}

	HANDLE_ERROR resume()
	{
		done = true;
		LOG(LScan, LInfo, "Restoring %s after scan", getAccessPointModeName(kind));
		return modes.enterAccessPoint(kind);
	}

private:
	ModeOrchestrator &modes;
	AccessPointKind kind;
	bool done = false;
};

std::optional<ErrorMessage> ConnectivityWorkflow::resolveInterface(std::string &interface)
{
	auto error = resolver.resolve(interface);
	if (!error) return std::nullopt;
	resolver.invalidate();
	return resolver.resolve(interface);
}

std::optional<AccessPointKind> ConnectivityWorkflow::probeAccessPoint()
{
	std::optional<AccessPointKind> kind;
	auto error = modes.activeAccessPoint(kind);
	if (!error) return kind;
	LOG(LWorkflow, LWarn, "Failed to probe access point status, using tracked mode: %s", error->c_str());
	OperatingMode mode = modes.mode();
	if (mode.isAccessPoint()) return mode.apKind;
	return std::nullopt;
}

void ConnectivityWorkflow::restoreAccessPoint(std::optional<AccessPointKind> kind)
{
	if (!kind) return;
	LOG(LWorkflow, LInfo, "Restarting %s hotspot", getAccessPointModeName(*kind));
	auto error = modes.enterAccessPoint(*kind);
	if (error)
		LOG(LWorkflow, LError, "Failed to restart %s hotspot: %s", getAccessPointModeName(*kind), error->c_str());
}


/* Scan */

std::optional<ErrorMessage> ConnectivityWorkflow::liveScan(int attempts, std::vector<NetworkRecord> &records)
{
	std::string interface;
	if (auto error = resolveInterface(interface))
		return error;

	std::optional<ErrorMessage> lastError;
	for (int attempt = 0; attempt < attempts; attempt++)
	{
		auto scanError = backend.requestScan(interface);
		if (scanError)
			LOG(LScan, LWarn, "Rescan request failed: %s", scanError->c_str());
		else
			sleepMS(settings.rescanDelayMS);

		lastError = backend.listNetworks(interface, records);
		if (lastError)
		{
			LOG(LScan, LWarn, "Failed to list networks (%d/%d): %s", attempt+1, attempts, lastError->c_str());
			continue;
		}
		if (resultLooksIncomplete(records) && attempt < attempts-1)
		{
			LOG(LScan, LInfo, "Only %d network(s) found, rescanning (%d/%d)", (int)records.size(), attempt+1, attempts);
			continue;
		}
		LOG(LScan, LInfo, "Found %d networks", (int)records.size());
		return std::nullopt;
	}
	return lastError;
}

std::optional<ErrorMessage> ConnectivityWorkflow::suspendScanResume(AccessPointKind kind, std::vector<NetworkRecord> &records)
{
	LOG(LScan, LInfo, "%s is active, temporarily disabling it for a network scan", getAccessPointModeName(kind));
	auto transient = modes.transient();

	if (auto error = modes.leaveAccessPoint(kind))
	{
		LOG(LScan, LError, "Failed to temporarily disable %s for scanning: %s", getAccessPointModeName(kind), error->c_str());
		// Leaving may have stopped the helper before failing
		restoreAccessPoint(kind);
		return error;
	}

	AccessPointResume resume(modes, kind);
	sleepMS(settings.suspendSettleMS);
	auto scanError = liveScan(settings.scanRetries, records);
	if (!scanError)
		cache.put(records);

	auto resumeError = resume.resume();
	if (resumeError)
		LOG(LScan, LError, "Failed to restore %s after scan: %s", getAccessPointModeName(kind), resumeError->c_str());
	return scanError;
}

std::optional<ErrorMessage> ConnectivityWorkflow::scan(ScanMode mode, ScanResult &result)
{
	std::unique_lock lock(mutex);
	result = {};

	if (mode == SCAN_CACHED)
	{
		result.entry = cache.lastKnown();
		if (result.entry)
		{
			result.fromCache = true;
			LOG(LScan, LDebug, "Returning %d cached networks", (int)result.entry->records.size());
			return std::nullopt;
		}
		LOG(LScan, LDebug, "No cached networks, scanning");
	}

	std::vector<NetworkRecord> records;
	std::optional<ErrorMessage> error;
	std::optional<AccessPointKind> active = probeAccessPoint();
	if (active)
	{
		result.suspended = active;
		error = suspendScanResume(*active, records);
	}
	else
	{
		error = liveScan(settings.scanRetries, records);
		if (!error)
			cache.put(records);
	}

	if (error)
	{
		if (mode != SCAN_FORCE_LIVE && !error->is(ERROR_HARDWARE_UNAVAILABLE))
		{
			result.entry = cache.lastKnown();
			if (result.entry)
			{
				LOG(LScan, LWarn, "Live scan failed, returning last known networks: %s", error->c_str());
				result.fromCache = true;
				return std::nullopt;
			}
		}
		LOG(LScan, LError, "Failed to scan networks: %s", error->c_str());
		return error;
	}
	result.entry = cache.lastKnown();
	if (!result.entry)
	{ // Cache was invalidated concurrently, hand out the fresh records directly
		auto entry = std::make_shared<ScanCacheEntry>();
		entry->records = std::move(records);
		entry->capturedAt = sclock::now();
		result.entry = entry;
	}
	return std::nullopt;
}

ScanStatus ConnectivityWorkflow::scanStatus()
{
	ScanStatus status;
	status.cacheFresh = cache.get() != nullptr;
	std::optional<AccessPointKind> kind;
	auto error = modes.activeAccessPoint(kind);
	if (error)
	{
		LOG(LWorkflow, LError, "Error getting scan status: %s", error->c_str());
		status.canScan = false;
		status.warning = "Unable to determine scan status";
		return status;
	}
	status.accessPointActive = kind.has_value();
	status.kind = kind;
	if (kind)
		status.warning = asprintf_s("Scanning will temporarily disconnect clients from %s hotspot", getAccessPointModeName(*kind));
	return status;
}


/* Connect */

std::optional<ErrorMessage> ConnectivityWorkflow::readConnectedNetwork(std::optional<ConnectedNetwork> &network)
{
	std::vector<SavedConnectionProfile> profiles;
	if (auto error = backend.listWifiConnections(true, profiles))
		return error;
	network.reset();
	for (auto &profile : profiles)
	{
		if (profile.isAccessPoint || modes.isAccessPointProfile(profile.name)) continue;
		network = ConnectedNetwork{ profile.ssid, profile.interface, profile.security, profile.name };
		break;
	}
	return std::nullopt;
}

std::optional<ErrorMessage> ConnectivityWorkflow::connectedNetwork(std::optional<ConnectedNetwork> &network)
{
	std::unique_lock lock(mutex);
	return readConnectedNetwork(network);
}

std::optional<ErrorMessage> ConnectivityWorkflow::connect(const std::string &ssid, const std::string &passphrase)
{
	if (ssid.empty())
		return ErrorMessage("SSID is required", ERROR_INVALID_ARGUMENT);
	std::unique_lock lock(mutex);
	LOG(LWorkflow, LInfo, "Connecting to network '%s'", ssid.c_str());

	std::optional<AccessPointKind> previous = probeAccessPoint();
	if (previous)
	{
		LOG(LWorkflow, LInfo, "Disabling %s hotspot before connecting", getAccessPointModeName(*previous));
		if (auto error = modes.leaveAccessPoint(*previous))
		{
			restoreAccessPoint(previous);
			return error;
		}
		sleepMS(settings.connectSettleMS);
	}

	// Best effort, hidden or intermittent networks may not show up
	std::vector<NetworkRecord> records;
	auto scanError = liveScan(settings.scanRetries, records);
	if (scanError)
		LOG(LWorkflow, LWarn, "Scan before connecting failed: %s", scanError->c_str());
	else
	{
		cache.put(records);
		bool found = std::any_of(records.begin(), records.end(),
			[&](const NetworkRecord &record) { return record.ssid == ssid; });
		if (!found)
			LOG(LWorkflow, LWarn, "Network '%s' not found in scan, trying anyway", ssid.c_str());
	}

	auto attempt = [&]() -> std::optional<ErrorMessage>
	{
		std::string interface;
		if (auto error = resolveInterface(interface))
			return error;
		if (backend.connectionExists(ssid))
		{
			LOG(LWorkflow, LInfo, "Activating saved connection '%s'", ssid.c_str());
			if (auto error = backend.activateConnection(ssid, settings.connectTimeoutMS))
				return error;
		}
		else
		{
			LOG(LWorkflow, LInfo, "Creating new connection for '%s'", ssid.c_str());
			if (auto error = backend.connectNetwork(interface, ssid, passphrase, settings.connectTimeoutMS))
				return error;
		}
		return std::nullopt;
	};

	auto error = attempt();
	std::optional<ConnectedNetwork> network;
	if (!error)
	{
		error = readConnectedNetwork(network);
		if (!error && (!network || network->ssid != ssid))
		{
			error = ErrorMessage(asprintf_s("Connected network '%s' does not match requested '%s'",
				network? network->ssid.c_str() : "", ssid.c_str()), ERROR_VERIFICATION_MISMATCH);
		}
	}
	if (error)
	{
		LOG(LWorkflow, LError, "Failed to connect to '%s': %s", ssid.c_str(), error->c_str());
		if (previous)
			restoreAccessPoint(previous);
		else
			modes.markIdle();
		return error;
	}

	modes.markStation(network->connectionName);
	cache.invalidate();
	if (auto persistError = store.save(PERSIST_CONNECTED, network))
		LOG(LWorkflow, LWarn, "Connected, but failed to persist: %s", persistError->c_str());
	if (previous)
		LOG(LWorkflow, LInfo, "Connection successful, %s hotspot will remain stopped", getAccessPointModeName(*previous));
	LOG(LWorkflow, LInfo, "Connected to '%s'", ssid.c_str());
	return std::nullopt;
}


/* Forget */

std::optional<ErrorMessage> ConnectivityWorkflow::readSavedNetworks(std::vector<SavedConnectionProfile> &profiles)
{
	std::vector<SavedConnectionProfile> all;
	if (auto error = backend.listWifiConnections(false, all))
		return error;
	profiles.clear();
	for (auto &profile : all)
	{
		if (profile.isAccessPoint || modes.isAccessPointProfile(profile.name))
		{
			LOG(LWorkflow, LTrace, "Skipping access point connection '%s'", profile.name.c_str());
			continue;
		}
		profiles.push_back(std::move(profile));
	}
	return std::nullopt;
}

std::optional<ErrorMessage> ConnectivityWorkflow::savedNetworks(std::vector<SavedConnectionProfile> &profiles)
{
	std::unique_lock lock(mutex);
	return readSavedNetworks(profiles);
}

void ConnectivityWorkflow::deleteProfiles(const std::vector<std::string> &names, ForgetReport &report)
{
	OperatingMode mode = modes.mode();
	for (auto &name : names)
	{
		auto error = backend.deleteConnection(name);
		if (error)
		{
			LOG(LWorkflow, LError, "Failed to delete connection '%s': %s", name.c_str(), error->c_str());
			report.failed.push_back(name);
			continue;
		}
		LOG(LWorkflow, LInfo, "Deleted connection '%s'", name.c_str());
		report.deleted.push_back(name);
		if (mode.type == OperatingMode::STATION && mode.connectionRef == name)
			modes.markIdle();
	}
}

void ConnectivityWorkflow::ensureReachable(ForgetReport &report)
{
	std::vector<SavedConnectionProfile> remaining;
	if (auto error = readSavedNetworks(remaining))
	{
		LOG(LWorkflow, LWarn, "Could not check for remaining networks: %s", error->c_str());
		return;
	}
	if (!remaining.empty())
	{
		LOG(LWorkflow, LDebug, "%d saved networks remaining", (int)remaining.size());
		return;
	}

	LOG(LWorkflow, LInfo, "No saved networks remaining, starting %s mode", getAccessPointModeName(AP_CONNECT));
	report.fallbackAttempted = true;
	bool active = false;
	auto error = modes.status(AP_CONNECT, active);
	if (!error && active)
	{
		LOG(LWorkflow, LInfo, "%s mode is already active", getAccessPointModeName(AP_CONNECT));
		report.fallbackActivated = true;
		return;
	}
	error = setAccessPointLocked(AP_CONNECT, true);
	if (error)
	{
		LOG(LWorkflow, LWarn, "Failed to start %s mode: %s", getAccessPointModeName(AP_CONNECT), error->c_str());
		if (auto persistError = store.save(PERSIST_DISCONNECTED))
			LOG(LWorkflow, LWarn, "%s", persistError->c_str());
		return;
	}
	report.fallbackActivated = true;
}

static bool matchesBssid(const SavedConnectionProfile &profile, const std::string &bssid)
{
	std::string target = toLower(bssid);
	if (toLower(profile.bssid) == target) return true;
	return std::any_of(profile.seenBssids.begin(), profile.seenBssids.end(),
		[&](const std::string &seen) { return toLower(seen) == target; });
}

std::optional<ErrorMessage> ConnectivityWorkflow::forget(const std::string &ssid, const std::string &bssid, ForgetReport &report)
{
	report = {};
	if (ssid.empty() && bssid.empty())
		return ErrorMessage("Either SSID or BSSID must be provided", ERROR_INVALID_ARGUMENT);
	std::unique_lock lock(mutex);

	const char *idType = bssid.empty()? "SSID" : "BSSID";
	const std::string &id = bssid.empty()? ssid : bssid;

	std::vector<SavedConnectionProfile> profiles;
	if (auto error = readSavedNetworks(profiles))
		return ErrorMessage(asprintf_s("Failed to get connection list: %s", error->c_str()), error->code);

	std::vector<std::string> matches;
	for (auto &profile : profiles)
	{
		bool match = bssid.empty()? profile.ssid == ssid : matchesBssid(profile, bssid);
		if (match) matches.push_back(profile.name);
	}
	if (matches.empty())
	{
		report.message = asprintf_s("No networks with %s '%s' found", idType, id.c_str());
		return ErrorMessage(report.message, ERROR_NOT_FOUND);
	}

	deleteProfiles(matches, report);
	ensureReachable(report);

	if (!report.failed.empty())
	{
		report.message = asprintf_s("Deleted %d network(s) with %s '%s'. Failed to delete: %s",
			(int)report.deleted.size(), idType, id.c_str(), joinStrings(report.failed, ", ").c_str());
		return ErrorMessage(report.message, ERROR_COMMAND_FAILED);
	}
	report.message = asprintf_s("Successfully deleted %d network(s) with %s '%s'",
		(int)report.deleted.size(), idType, id.c_str());
	return std::nullopt;
}

std::optional<ErrorMessage> ConnectivityWorkflow::forgetAll(ForgetReport &report)
{
	report = {};
	std::unique_lock lock(mutex);

	std::vector<SavedConnectionProfile> profiles;
	if (auto error = readSavedNetworks(profiles))
		return ErrorMessage(asprintf_s("Failed to get connection list: %s", error->c_str()), error->code);

	std::vector<std::string> names;
	for (auto &profile : profiles)
		names.push_back(profile.name);
	LOG(LWorkflow, LInfo, "Forgetting all %d saved networks", (int)names.size());
	deleteProfiles(names, report);
	ensureReachable(report);

	if (!report.failed.empty())
	{
		report.message = asprintf_s("Deleted %d network(s). Failed to delete: %s",
			(int)report.deleted.size(), joinStrings(report.failed, ", ").c_str());
		return ErrorMessage(report.message, ERROR_COMMAND_FAILED);
	}
	if (report.deleted.empty())
		report.message = "No saved networks to forget";
	else
		report.message = asprintf_s("Successfully deleted %d network(s)", (int)report.deleted.size());
	return std::nullopt;
}


/* Access points */

std::optional<ErrorMessage> ConnectivityWorkflow::setAccessPointLocked(AccessPointKind kind, bool enable)
{
	if (!enable)
	{
		auto error = modes.leaveAccessPoint(kind);
		if (error) return error;
		// Refresh the list the UI shows now that the radio can see again
		std::vector<NetworkRecord> records;
		auto scanError = liveScan(settings.scanRetries, records);
		if (scanError)
			LOG(LWorkflow, LWarn, "Scan after disabling %s failed: %s", getAccessPointModeName(kind), scanError->c_str());
		else
			cache.put(std::move(records));
		return std::nullopt;
	}

	AccessPointKind other = kind == AP_DIRECT? AP_CONNECT : AP_DIRECT;
	if (auto error = modes.leaveAccessPoint(other))
	{
		LOG(LWorkflow, LError, "Failed to disable %s before enabling %s: %s",
			getAccessPointModeName(other), getAccessPointModeName(kind), error->c_str());
		return error;
	}
	return modes.enterAccessPoint(kind);
}

std::optional<ErrorMessage> ConnectivityWorkflow::setAccessPoint(AccessPointKind kind, bool enable)
{
	std::unique_lock lock(mutex);
	return setAccessPointLocked(kind, enable);
}

std::optional<ErrorMessage> ConnectivityWorkflow::accessPointStatus(AccessPointKind kind, bool &active)
{
	std::unique_lock lock(mutex);
	return modes.status(kind, active);
}


/* Shutdown */

void ConnectivityWorkflow::shutdown()
{
	std::unique_lock lock(mutex);
	LOG(LWorkflow, LInfo, "Saving WiFi state before shutdown");

	std::optional<ConnectedNetwork> network;
	auto error = readConnectedNetwork(network);
	if (error)
		LOG(LWorkflow, LWarn, "Could not determine connected network: %s", error->c_str());

	std::optional<ErrorMessage> persistError;
	if (network)
		persistError = store.save(PERSIST_CONNECTED, network);
	else
	{
		std::optional<AccessPointKind> kind = probeAccessPoint();
		persistError = store.save(kind? getPersistedMode(*kind) : PERSIST_DISCONNECTED);
	}
	if (persistError)
		LOG(LWorkflow, LWarn, "Failed to save state on shutdown: %s", persistError->c_str());

	if (!helper.stop())
		LOG(LWorkflow, LWarn, "DHCP helper did not stop cleanly");
}
