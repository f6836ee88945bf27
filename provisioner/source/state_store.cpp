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

#include "state_store.hpp"

#include "config.hpp" // writeJSON, readJSON

#include "util/util.hpp"
#include "util/log.hpp"

#include <filesystem>

json stateToJSON(const PersistedState &state)
{
	json data;
	data["state"] = getPersistedModeName(state.mode);
	data["timestamp"] = state.savedAt;
	if (state.connectedNetwork)
	{
		const ConnectedNetwork &network = *state.connectedNetwork;
		data["connected_network"] = {
			{ "ssid", network.ssid },
			{ "interface", network.interface },
			{ "security", getSecurityName(network.security) },
			{ "connection_name", network.connectionName }
		};
	}
	else
		data["connected_network"] = nullptr;
	return data;
}

std::optional<ErrorMessage> stateFromJSON(const json &data, PersistedState &state)
{
	if (!data.is_object())
		return ErrorMessage("State is not a JSON object", ERROR_INVALID_ARGUMENT);
	if (!data.contains("state") || !data["state"].is_string())
		return ErrorMessage("State has no mode", ERROR_INVALID_ARGUMENT);
	auto mode = parsePersistedMode(data["state"].get<std::string>());
	if (!mode)
		return ErrorMessage(asprintf_s("Unknown state mode '%s'", data["state"].get<std::string>().c_str()), ERROR_INVALID_ARGUMENT);
	state.mode = *mode;
	if (!data.contains("timestamp") || !data["timestamp"].is_number())
		return ErrorMessage("State has no timestamp", ERROR_INVALID_ARGUMENT);
	state.savedAt = data["timestamp"].get<double>();

	state.connectedNetwork.reset();
	if (data.contains("connected_network") && data["connected_network"].is_object())
	{
		auto &net = data["connected_network"];
		ConnectedNetwork network;
		network.ssid = net.value("ssid", "");
		network.interface = net.value("interface", "");
		network.security = parseSecurityName(net.value("security", "open")).value_or(SECURITY_OPEN);
		network.connectionName = net.value("connection_name", "");
		if (network.connectionName.empty())
			network.connectionName = network.ssid;
		state.connectedNetwork = network;
	}
	return std::nullopt;
}

void StateStore::remove(const char *reason)
{
	std::error_code ec;
	if (std::filesystem::remove(path, ec))
		LOG(LState, LInfo, "Removed %s state file '%s'", reason, path.c_str());
	if (ec)
		LOG(LState, LWarn, "Failed to remove %s state file '%s': %s", reason, path.c_str(), ec.message().c_str());
}

std::optional<PersistedState> StateStore::load()
{
	std::unique_lock lock(mutex);
	json data;
	auto error = readJSON(path, data);
	if (error && error->is(ERROR_NOT_FOUND))
	{
		LOG(LState, LDebug, "No state file found");
		return std::nullopt;
	}
	PersistedState state;
	if (!error)
		error = stateFromJSON(data, state);
	if (error)
	{
		LOG(LState, LError, "Invalid state file '%s': %s", path.c_str(), error->c_str());
		remove("corrupted");
		return std::nullopt;
	}

	double age = getWallTime() - state.savedAt;
	if (age > maxAgeS)
	{
		LOG(LState, LInfo, "State file is too old (%.0fs), ignoring", age);
		remove("old");
		return std::nullopt;
	}
	LOG(LState, LInfo, "Loaded WiFi state '%s' from '%s'", getPersistedModeName(state.mode), path.c_str());
	return state;
}

std::optional<ErrorMessage> StateStore::save(const PersistedState &state)
{
	std::unique_lock lock(mutex);
	auto error = writeJSON(path, stateToJSON(state));
	if (error)
	{
		LOG(LState, LError, "Failed to save WiFi state: %s", error->c_str());
		return ErrorMessage(error->str(), ERROR_PERSISTENCE);
	}
	LOG(LState, LInfo, "Saved WiFi state '%s' to '%s'", getPersistedModeName(state.mode), path.c_str());
	return std::nullopt;
}

std::optional<ErrorMessage> StateStore::save(PersistedMode mode, std::optional<ConnectedNetwork> network)
{
	PersistedState state;
	state.mode = mode;
	state.savedAt = getWallTime();
	state.connectedNetwork = std::move(network);
	return save(state);
}

void StateStore::clear()
{
	std::unique_lock lock(mutex);
	remove("cleared");
}
