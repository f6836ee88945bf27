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

#ifndef WORKFLOW_H
#define WORKFLOW_H

#include "network.hpp"
#include "backend.hpp"
#include "interface.hpp"
#include "scan_cache.hpp"
#include "modes.hpp"

#include "system/dhcp_helper.hpp"
#include "state_store.hpp"

#include "util/error.hpp"

#include <mutex>
#include <memory>
#include <optional>

enum ScanMode : uint8_t
{
	SCAN_CACHED = 0,		// Last known result regardless of age, live scan if none exists
	SCAN_LIVE_IF_POSSIBLE,	// Live scan, falls back to the last known result if it fails
	SCAN_FORCE_LIVE			// Live scan, errors are returned
};

struct ScanResult
{
	std::shared_ptr<const ScanCacheEntry> entry;
	bool fromCache = false;
	std::optional<AccessPointKind> suspended; // Access point suspended for the scan
};

struct ForgetReport
{
	std::vector<std::string> deleted;
	std::vector<std::string> failed;
	bool fallbackAttempted = false;
	bool fallbackActivated = false;
	std::string message;
};

struct ScanStatus
{
	bool accessPointActive = false;
	std::optional<AccessPointKind> kind;
	bool canScan = true;
	bool cacheFresh = false; // Last scan result is younger than the cache TTL
	std::string warning;
};

struct WorkflowSettings
{
	int rescanDelayMS = 2000;
	int scanRetries = 3;
	int suspendSettleMS = 3000;
	int connectSettleMS = 2000;
	int connectTimeoutMS = 30000;
	bool startupCheck = true;
	int startupScanRetries = 5;
};

/**
 * Connect, forget and scan use cases on top of the mode orchestrator
 * All operations needing the radio are serialised, an access point that was active
 * before a failing operation is restored before the error is returned
 */
class ConnectivityWorkflow
{
public:
	ConnectivityWorkflow(NetworkBackend &backend, ModeOrchestrator &modes, InterfaceResolver &resolver,
		ScanCache &cache, StateStore &store, DhcpHelper &helper, WorkflowSettings settings)
		: backend(backend), modes(modes), resolver(resolver), cache(cache), store(store), helper(helper),
		settings(settings) {}

	HANDLE_ERROR scan(ScanMode mode, ScanResult &result);

	HANDLE_ERROR connect(const std::string &ssid, const std::string &passphrase);

	/**
	 * Deletes all saved station profiles matching the bssid, or the ssid if no bssid is given
	 * Enters the provisioning access point if no saved profiles remain
	 */
	HANDLE_ERROR forget(const std::string &ssid, const std::string &bssid, ForgetReport &report);
	HANDLE_ERROR forgetAll(ForgetReport &report);

	// Enabling one kind leaves the other first
	HANDLE_ERROR setAccessPoint(AccessPointKind kind, bool enable);
	HANDLE_ERROR accessPointStatus(AccessPointKind kind, bool &active);

	HANDLE_ERROR connectedNetwork(std::optional<ConnectedNetwork> &network);
	HANDLE_ERROR savedNetworks(std::vector<SavedConnectionProfile> &profiles);
	ScanStatus scanStatus();

	/**
	 * Cleans up after a previous run and restores the persisted mode
	 * Falls back to the provisioning access point so the device stays reachable
	 * Defined in recovery.cpp
	 */
	HANDLE_ERROR recoverOnStartup();

	// Stops the DHCP helper and persists the current mode
	void shutdown();

private:
	NetworkBackend &backend;
	ModeOrchestrator &modes;
	InterfaceResolver &resolver;
	ScanCache &cache;
	StateStore &store;
	DhcpHelper &helper;
	WorkflowSettings settings;

	std::mutex mutex;

	HANDLE_ERROR resolveInterface(std::string &interface);
	std::optional<AccessPointKind> probeAccessPoint();
	HANDLE_ERROR liveScan(int attempts, std::vector<NetworkRecord> &records);
	HANDLE_ERROR suspendScanResume(AccessPointKind kind, std::vector<NetworkRecord> &records);
	HANDLE_ERROR readConnectedNetwork(std::optional<ConnectedNetwork> &network);
	HANDLE_ERROR readSavedNetworks(std::vector<SavedConnectionProfile> &profiles);
	HANDLE_ERROR setAccessPointLocked(AccessPointKind kind, bool enable);
	void deleteProfiles(const std::vector<std::string> &names, ForgetReport &report);
	void ensureReachable(ForgetReport &report);
	void restoreAccessPoint(std::optional<AccessPointKind> kind);

	void cleanupStaleAccessPoints();
};

#endif // WORKFLOW_H
