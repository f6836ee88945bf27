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

#include "modes.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include <algorithm>

std::optional<ErrorMessage> ModeOrchestrator::resolveInterface(std::string &interface)
{
	auto error = resolver.resolve(interface);
	if (!error) return std::nullopt;
	// One re-resolution in case the cached interface went away
	resolver.invalidate();
	error = resolver.resolve(interface);
	if (error)
		return ErrorMessage(error->str(), ERROR_HARDWARE_UNAVAILABLE);
	return std::nullopt;
}

bool ModeOrchestrator::isAccessPointProfile(const std::string &connectionName) const
{
	for (auto &ap : settings.accessPoints)
		if (ap.connectionName == connectionName) return true;
	return false;
}

OperatingMode ModeOrchestrator::mode()
{
	std::unique_lock lock(mutex);
	return current;
}

void ModeOrchestrator::markStation(const std::string &connection)
{
	std::unique_lock lock(mutex);
	current = OperatingMode::Station(connection);
	LOG(LMode, LDebug, "Mode is now %s", describeMode(current).c_str());
}

void ModeOrchestrator::markIdle()
{
	std::unique_lock lock(mutex);
	current = OperatingMode::Idle();
	LOG(LMode, LDebug, "Mode is now Idle");
}

void ModeOrchestrator::transitioned(PersistedMode persist)
{
	if (isTransient())
	{
		LOG(LMode, LDebug, "Transient transition, keeping scan cache and persisted state");
		return;
	}
	cache.invalidate();
	auto error = store.save(persist);
	if (error)
		LOG(LMode, LWarn, "Continuing without persisted state: %s", error->c_str());
}

std::optional<ErrorMessage> ModeOrchestrator::status(AccessPointKind kind, bool &active)
{
	std::vector<std::string> names;
	auto error = backend.listActiveConnectionNames(names);
	if (error) return error;
	const std::string &name = settings.accessPoints[kind].connectionName;
	active = std::find(names.begin(), names.end(), name) != names.end();
	return std::nullopt;
}

std::optional<ErrorMessage> ModeOrchestrator::activeAccessPoint(std::optional<AccessPointKind> &kind)
{
	std::vector<std::string> names;
	auto error = backend.listActiveConnectionNames(names);
	if (error) return error;
	kind.reset();
	for (int k = 0; k < AP_KIND_MAX; k++)
	{
		if (std::find(names.begin(), names.end(), settings.accessPoints[k].connectionName) != names.end())
		{
			kind = (AccessPointKind)k;
			break;
		}
	}
	return std::nullopt;
}

std::optional<ErrorMessage> ModeOrchestrator::enterAccessPoint(AccessPointKind kind)
{
	std::unique_lock lock(mutex);
	const char *modeName = getAccessPointModeName(kind);
	const ModeSettings::AccessPoint &ap = settings.accessPoints[kind];
	LOG(LMode, LInfo, "Enabling %s mode", modeName);

	std::string interface;
	if (auto error = resolveInterface(interface))
		return error;

	// Only one access point kind at a time, the caller has to leave the other first
	AccessPointKind other = kind == AP_DIRECT? AP_CONNECT : AP_DIRECT;
	bool otherActive = current.isAccessPoint(other);
	if (!otherActive)
	{
		auto error = status(other, otherActive);
		if (error)
			LOG(LMode, LWarn, "Could not probe %s mode: %s", getAccessPointModeName(other), error->c_str());
	}
	if (otherActive)
	{
		LOG(LMode, LError, "Cannot enable %s mode while %s mode is active", modeName, getAccessPointModeName(other));
		return ErrorMessage(asprintf_s("Cannot enable %s while %s is active", modeName, getAccessPointModeName(other)), ERROR_MODE_CONFLICT);
	}

	OperatingMode previous = current;

	if (!backend.connectionExists(ap.connectionName))
	{
		LOG(LMode, LInfo, "Creating new %s connection '%s'", modeName, ap.connectionName.c_str());
		AccessPointProfile profile;
		profile.connectionName = ap.connectionName;
		profile.ssid = ap.ssid;
		profile.interface = interface;
		profile.gateway = settings.gateway;
		profile.passphrase = ap.passphrase;
		profile.isolated = kind == AP_DIRECT;
		if (auto error = backend.createAccessPoint(profile))
		{
			LOG(LMode, LError, "Failed to create %s hotspot: %s", modeName, error->c_str());
			return error;
		}
	}

	if (auto error = backend.setAutoconnect(ap.connectionName, true))
	{
		LOG(LMode, LError, "Failed to enable autoconnect of %s hotspot: %s", modeName, error->c_str());
		return error;
	}

	if (auto error = backend.activateConnection(ap.connectionName, settings.activationTimeoutMS))
	{
		// NetworkManager takes the device down before bringing the profile up
		LOG(LMode, LError, "Failed to start %s hotspot, rolling back: %s", modeName, error->c_str());
		rollbackAccessPoint(kind, previous);
		return error;
	}

	// The helper is bound to the interface address, restart it for the new mode
	LOG(LMode, LDebug, "Restarting DHCP helper for %s mode", modeName);
	if (!helper.stop())
		LOG(LMode, LWarn, "Previous DHCP helper did not stop cleanly");
	sleepMS(settings.helperSettleMS);
	DhcpHelperConfig helperConfig;
	helperConfig.interface = interface;
	helperConfig.gateway = settings.gateway;
	helperConfig.dhcpRange = settings.dhcpRange;
	helperConfig.isolated = kind == AP_DIRECT;
	if (auto error = helper.start(helperConfig))
	{
		LOG(LMode, LError, "Failed to start DHCP helper for %s mode, rolling back: %s", modeName, error->c_str());
		rollbackAccessPoint(kind, previous);
		return error;
	}

	current = OperatingMode::AccessPoint(kind, ap.connectionName);
	transitioned(getPersistedMode(kind));
	LOG(LMode, LInfo, "%s mode enabled successfully", modeName);
	return std::nullopt;
}

void ModeOrchestrator::rollbackAccessPoint(AccessPointKind kind, const OperatingMode &previous)
{
	const std::string &name = settings.accessPoints[kind].connectionName;
	if (!helper.stop())
		LOG(LMode, LWarn, "Rollback: DHCP helper did not stop cleanly");
	if (auto error = backend.setAutoconnect(name, false))
		LOG(LMode, LWarn, "Rollback: %s", error->c_str());
	if (auto error = backend.deactivateConnection(name))
		LOG(LMode, LWarn, "Rollback: %s", error->c_str());
	current = previous;
	if (previous.type == OperatingMode::STATION)
	{
		LOG(LMode, LInfo, "Rollback: reactivating station connection '%s'", previous.connectionRef.c_str());
		if (auto error = backend.activateConnection(previous.connectionRef, settings.activationTimeoutMS))
		{
			LOG(LMode, LError, "Rollback: failed to reactivate '%s': %s", previous.connectionRef.c_str(), error->c_str());
			current = OperatingMode::Idle();
		}
	}
}

std::optional<ErrorMessage> ModeOrchestrator::leaveAccessPoint()
{
	std::unique_lock lock(mutex);
	if (current.isAccessPoint())
		return leaveAccessPoint(current.apKind);

	// Tracked mode may be stale, e.g. an access point restored by NetworkManager itself
	std::optional<AccessPointKind> active;
	if (auto error = activeAccessPoint(active))
		return error;
	if (!active)
	{
		LOG(LMode, LDebug, "No access point active, nothing to leave");
		return std::nullopt;
	}
	return leaveAccessPoint(*active);
}

std::optional<ErrorMessage> ModeOrchestrator::leaveAccessPoint(AccessPointKind kind)
{
	std::unique_lock lock(mutex);
	const char *modeName = getAccessPointModeName(kind);
	const std::string &name = settings.accessPoints[kind].connectionName;

	bool active = current.isAccessPoint(kind);
	if (!active)
	{
		if (auto error = status(kind, active))
			return error;
	}
	if (!active)
	{
		LOG(LMode, LDebug, "%s mode is not active, nothing to leave", modeName);
		return std::nullopt;
	}

	LOG(LMode, LInfo, "Disabling %s mode", modeName);
	if (!helper.stop())
		LOG(LMode, LWarn, "DHCP helper did not stop cleanly");
	if (auto error = backend.setAutoconnect(name, false))
		LOG(LMode, LWarn, "Failed to disable autoconnect of %s hotspot: %s", modeName, error->c_str());
	if (auto error = backend.deactivateConnection(name))
	{
		LOG(LMode, LError, "Failed to stop %s hotspot: %s", modeName, error->c_str());
		return error;
	}

	current = OperatingMode::Idle();
	transitioned(PERSIST_DISCONNECTED);
	LOG(LMode, LInfo, "%s mode disabled successfully", modeName);
	return std::nullopt;
}
