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

#ifndef INTERFACE_H
#define INTERFACE_H

#include "backend.hpp"

#include "util/error.hpp"

#include <mutex>
#include <string>
#include <optional>

/**
 * Discovers and caches the wireless interface
 * All other components go through this instead of querying the OS directly
 */
class InterfaceResolver
{
public:
	InterfaceResolver(NetworkBackend &backend, std::optional<std::string> overrideName = std::nullopt)
		: backend(backend), overrideName(std::move(overrideName)) {}

	// Returns the cached interface, resolving it once if not known yet
	HANDLE_ERROR resolve(std::string &interface);

	// Forget the cached interface after an operation found it missing, next resolve re-queries once
	void invalidate();

	std::optional<std::string> cached();

private:
	NetworkBackend &backend;
	std::optional<std::string> overrideName;
	std::mutex mutex;
	std::optional<std::string> interface;
};

#endif // INTERFACE_H
