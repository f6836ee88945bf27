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

#ifndef MODES_H
#define MODES_H

#include "network.hpp"
#include "backend.hpp"
#include "interface.hpp"
#include "scan_cache.hpp"

#include "system/dhcp_helper.hpp"
#include "state_store.hpp"

#include "util/error.hpp"

#include <mutex>
#include <atomic>
#include <optional>

struct ModeSettings
{
	struct AccessPoint
	{
		std::string connectionName;
		std::string ssid;
		std::string passphrase;
	} accessPoints[AP_KIND_MAX];
	std::string gateway = "192.168.42.1";
	std::string dhcpRange = "192.168.42.2,192.168.42.20";
	int activationTimeoutMS = 30000;
	int helperSettleMS = 1000;
};

/**
 * Enforces mutual exclusion between station and access point mode
 * Owns the lifecycle of the DHCP helper bound to access point mode
 * Transitions never throw, failures are returned so callers can roll back
 */
class ModeOrchestrator
{
public:
	ModeOrchestrator(NetworkBackend &backend, DhcpHelper &helper, InterfaceResolver &resolver,
		ScanCache &cache, StateStore &store, ModeSettings settings)
		: backend(backend), helper(helper), resolver(resolver), cache(cache), store(store),
		settings(std::move(settings)) {}

	/**
	 * Creates the fixed profile of the kind if missing, activates it and starts the DHCP helper
	 * Refuses with ERROR_MODE_CONFLICT while the other kind is active
	 * On failure the previous mode is restored
	 */
	HANDLE_ERROR enterAccessPoint(AccessPointKind kind);

	// Leaves whichever access point is active, succeeds trivially if none is
	HANDLE_ERROR leaveAccessPoint();
	HANDLE_ERROR leaveAccessPoint(AccessPointKind kind);

	// Read-only probe of the active connection profiles
	HANDLE_ERROR status(AccessPointKind kind, bool &active);
	// Probes which access point kind is active, if any
	HANDLE_ERROR activeAccessPoint(std::optional<AccessPointKind> &kind);

	OperatingMode mode();
	void markStation(const std::string &connection);
	void markIdle();

	const ModeSettings::AccessPoint &accessPoint(AccessPointKind kind) const { return settings.accessPoints[kind]; }
	bool isAccessPointProfile(const std::string &connectionName) const;

	/**
	 * While alive, transitions neither invalidate the scan cache nor persist state
	 * Used when a transition is temporary (suspended for a scan) or while warming up on startup
	 */
	class TransientScope
	{
	public:
		TransientScope(ModeOrchestrator &orchestrator) : orchestrator(&orchestrator)
		{
			orchestrator.transientDepth++;
		}
		TransientScope(TransientScope &&other) : orchestrator(other.orchestrator)
		{
			other.orchestrator = nullptr;
		}
		TransientScope(const TransientScope &) = delete;
		TransientScope& operator=(const TransientScope &) = delete;
		~TransientScope()
		{
			if (orchestrator) orchestrator->transientDepth--;
		}
	private:
		ModeOrchestrator *orchestrator;
	};
	TransientScope transient() { return TransientScope(*this); }
	bool isTransient() const { return transientDepth > 0; }

private:
	NetworkBackend &backend;
	DhcpHelper &helper;
	InterfaceResolver &resolver;
	ScanCache &cache;
	StateStore &store;
	ModeSettings settings;

	std::recursive_mutex mutex;
	OperatingMode current;
	std::atomic<int> transientDepth = 0;

	HANDLE_ERROR resolveInterface(std::string &interface);
	void rollbackAccessPoint(AccessPointKind kind, const OperatingMode &previous);
	void transitioned(PersistedMode persist);
};

#endif // MODES_H
