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

#include "interface.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

std::optional<ErrorMessage> InterfaceResolver::resolve(std::string &result)
{
	std::unique_lock lock(mutex);
	if (interface)
	{
		result = *interface;
		return std::nullopt;
	}
	if (overrideName && !overrideName->empty())
	{
		LOG(LInterface, LInfo, "Using configured wireless interface '%s'", overrideName->c_str());
		interface = *overrideName;
		result = *interface;
		return std::nullopt;
	}

	std::vector<DeviceEntry> devices;
	if (auto error = backend.listDevices(devices))
	{
		LOG(LInterface, LError, "Failed to query network devices: %s", error->c_str());
		return ErrorMessage(asprintf_s("No wireless interface: %s", error->c_str()), ERROR_HARDWARE_UNAVAILABLE);
	}
	for (auto &device : devices)
	{
		if (device.type != "wifi") continue;
		LOG(LInterface, LInfo, "Found wireless interface '%s'", device.device.c_str());
		interface = device.device;
		result = *interface;
		return std::nullopt;
	}
	LOG(LInterface, LError, "No wireless interface found among %d devices", (int)devices.size());
	return ErrorMessage("No wireless interface found", ERROR_HARDWARE_UNAVAILABLE);
}

void InterfaceResolver::invalidate()
{
	std::unique_lock lock(mutex);
	if (interface)
		LOG(LInterface, LDebug, "Invalidated wireless interface '%s'", interface->c_str());
	interface.reset();
}

std::optional<std::string> InterfaceResolver::cached()
{
	std::unique_lock lock(mutex);
	return interface;
}
