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

/**
 * Startup recovery of the connectivity state
 */

void ConnectivityWorkflow::cleanupStaleAccessPoints()
{
	LOG(LWorkflow, LInfo, "Cleaning up access point connections from previous run");
	for (int k = 0; k < AP_KIND_MAX; k++)
	{
		const std::string &name = modes.accessPoint((AccessPointKind)k).connectionName;
		if (!backend.connectionExists(name)) continue;
		LOG(LWorkflow, LInfo, "Found existing %s connection '%s', removing it",
			getAccessPointModeName((AccessPointKind)k), name.c_str());
		bool active = false;
		if (modes.status((AccessPointKind)k, active) || active)
		{
			auto error = backend.deactivateConnection(name);
			if (error)
				LOG(LWorkflow, LDebug, "%s", error->c_str());
		}
		auto error = backend.deleteConnection(name);
		if (error)
			LOG(LWorkflow, LWarn, "Failed to remove stale connection: %s", error->c_str());
	}
	if (!helper.stopOrphaned())
		LOG(LWorkflow, LWarn, "Failed to stop orphaned DHCP helper");
	modes.markIdle();
}

std::optional<ErrorMessage> ConnectivityWorkflow::recoverOnStartup()
{
	std::unique_lock lock(mutex);
	cleanupStaleAccessPoints();

	if (!settings.startupCheck)
	{
		LOG(LWorkflow, LInfo, "Startup WiFi check is disabled");
		return std::nullopt;
	}
	LOG(LWorkflow, LInfo, "Performing startup WiFi connectivity check...");

	std::string interface;
	if (auto error = resolveInterface(interface))
	{
		LOG(LWorkflow, LWarn, "No WiFi interface available, skipping startup check");
		return error;
	}

	// Restore the persisted mode
	std::optional<PersistedState> state = store.load();
	if (state && state->mode == PERSIST_CONNECTED && state->connectedNetwork)
	{
		ConnectedNetwork network = *state->connectedNetwork;
		LOG(LWorkflow, LInfo, "Attempting to restore connection to '%s'", network.ssid.c_str());
		auto error = backend.activateConnection(network.connectionName, settings.connectTimeoutMS);
		if (!error)
		{
			LOG(LWorkflow, LInfo, "Successfully restored connection to '%s'", network.ssid.c_str());
			modes.markStation(network.connectionName);
			if (auto persistError = store.save(PERSIST_CONNECTED, network))
				LOG(LWorkflow, LWarn, "%s", persistError->c_str());
			return std::nullopt;
		}
		LOG(LWorkflow, LWarn, "Failed to restore connection to '%s': %s", network.ssid.c_str(), error->c_str());
	}
	else if (state && (state->mode == PERSIST_DIRECT || state->mode == PERSIST_CONNECT))
	{
		AccessPointKind kind = state->mode == PERSIST_DIRECT? AP_DIRECT : AP_CONNECT;
		LOG(LWorkflow, LInfo, "Restoring %s mode", getAccessPointModeName(kind));
		auto error = modes.enterAccessPoint(kind);
		if (!error)
		{
			LOG(LWorkflow, LInfo, "%s mode restored successfully", getAccessPointModeName(kind));
			return std::nullopt;
		}
		LOG(LWorkflow, LWarn, "Failed to restore %s mode: %s", getAccessPointModeName(kind), error->c_str());
	}

	// Maybe NetworkManager already connected on its own
	std::optional<ConnectedNetwork> network;
	if (auto error = readConnectedNetwork(network))
		LOG(LWorkflow, LWarn, "Could not check connected status: %s", error->c_str());
	if (network)
	{
		LOG(LWorkflow, LInfo, "WiFi network already connected to '%s'", network->ssid.c_str());
		modes.markStation(network->connectionName);
		if (auto persistError = store.save(PERSIST_CONNECTED, network))
			LOG(LWorkflow, LWarn, "%s", persistError->c_str());
		return std::nullopt;
	}

	LOG(LWorkflow, LInfo, "No WiFi connection found, performing network scan...");
	// Keep the warmed cache for the UI, the fallback transition would otherwise clear it
	auto transient = modes.transient();
	std::vector<NetworkRecord> records;
	if (auto error = liveScan(settings.startupScanRetries, records))
		LOG(LWorkflow, LWarn, "Startup scan failed: %s", error->c_str());
	else
	{
		LOG(LWorkflow, LInfo, "Found %d available networks, but none connected", (int)records.size());
		cache.put(std::move(records));
	}

	LOG(LWorkflow, LInfo, "Starting %s mode as fallback", getAccessPointModeName(AP_CONNECT));
	if (auto error = modes.enterAccessPoint(AP_CONNECT))
	{
		LOG(LWorkflow, LError, "Failed to start %s mode: %s", getAccessPointModeName(AP_CONNECT), error->c_str());
		if (auto persistError = store.save(PERSIST_DISCONNECTED))
			LOG(LWorkflow, LWarn, "%s", persistError->c_str());
		return error;
	}
	if (auto persistError = store.save(PERSIST_CONNECT))
		LOG(LWorkflow, LWarn, "%s", persistError->c_str());
	return std::nullopt;
}
