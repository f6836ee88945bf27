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

#ifndef STATE_STORE_H
#define STATE_STORE_H

#include "network/network.hpp"

#include "util/error.hpp"

#include "nlohmann/json.hpp"
using json = nlohmann::json;

#include <mutex>
#include <string>
#include <optional>

json stateToJSON(const PersistedState &state);
HANDLE_ERROR stateFromJSON(const json &data, PersistedState &state);

/**
 * Persists the last known mode across restarts
 * Write failures are non-fatal, the in-memory state stays authoritative
 */
class StateStore
{
public:
	StateStore(std::string path, double maxAgeS) : path(std::move(path)), maxAgeS(maxAgeS) {}

	// Returns the persisted state, a stale or corrupt file is deleted and treated as absent
	std::optional<PersistedState> load();

	HANDLE_ERROR save(const PersistedState &state);
	HANDLE_ERROR save(PersistedMode mode, std::optional<ConnectedNetwork> network = std::nullopt);

	void clear();

	const std::string &getPath() const { return path; }

private:
	std::string path;
	double maxAgeS;
	std::mutex mutex;

	void remove(const char *reason);
};

#endif // STATE_STORE_H
