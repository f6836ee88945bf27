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

#include "config.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#define JSON_PARSE_TRY_BLOCK try
#define JSON_PARSE_CATCH_BLOCK \
	catch(const json::exception &e) \
	{ \
		LOG(LConfig, LWarn, "Failed to fully parse JSON '%s': %s", path.c_str(), e.what()); \
		return ErrorMessage(asprintf_s("Failed to parse '%s'!", path.c_str()), ERROR_INVALID_ARGUMENT); \
	}

#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <cstdlib>
#include <arpa/inet.h>

std::optional<ErrorMessage> writeJSON(const std::string &path, const json &data)
{
	// Serialise JSON
	std::stringstream ss;
	ss << std::setfill('\t') << std::setw(1) << data;
	// Create directories
	std::error_code ec;
	std::filesystem::path parent = std::filesystem::path(path).parent_path();
	if (!parent.empty())
		std::filesystem::create_directories(parent, ec);
	if (ec) return asprintf_s("Failed to create directory '%s': %s", parent.c_str(), ec.message().c_str());
	// Write file
	std::ofstream fs(path);
	if (!fs.is_open()) return asprintf_s("Failed to open '%s' for writing!", path.c_str());
	fs << ss.rdbuf();
	if (fs.fail()) return asprintf_s("Failed to write '%s'!", path.c_str());
	fs.close();
	if (fs.fail()) return asprintf_s("Failed to close '%s' after writing!", path.c_str());
	return std::nullopt;
}

std::optional<ErrorMessage> readJSON(const std::string &path, json &data)
{
	// Read file
	std::ifstream fs(path);
	if (!fs.is_open()) return ErrorMessage(asprintf_s("Failed to open '%s' for reading!", path.c_str()), ERROR_NOT_FOUND);
	data = json::parse(fs, nullptr, false);
	if (data.is_discarded()) return ErrorMessage(asprintf_s("Failed to parse '%s'!", path.c_str()), ERROR_INVALID_ARGUMENT);
	fs.close();
	return std::nullopt;
}

json configToJSON(const ProvisionerConfig &config)
{
	json cfg;
	cfg["server"] = {
		{ "host", config.server.host },
		{ "port", config.server.port },
		{ "log_level", config.server.logLevel },
		{ "ui_directory", config.server.uiDirectory },
		{ "log_file", config.server.logFile }
	};
	auto &wifi = cfg["wifi"];
	wifi["interface"] = config.wifi.interface? json(*config.wifi.interface) : json(nullptr);
	wifi["state_file"] = config.wifi.stateFile;
	wifi["state_max_age"] = config.wifi.stateMaxAge;
	wifi["command_timeout"] = config.wifi.commandTimeout;
	wifi["connect_timeout"] = config.wifi.connectTimeout;
	wifi["rescan_delay"] = config.wifi.rescanDelay;
	wifi["scan_retries"] = config.wifi.scanRetries;
	wifi["hotspot_disable_delay"] = config.wifi.hotspotDisableDelay;
	wifi["connect_settle_delay"] = config.wifi.connectSettleDelay;
	wifi["helper_settle_delay"] = config.wifi.helperSettleDelay;
	wifi["helper_grace"] = config.wifi.helperGrace;
	wifi["cache_ttl"] = config.wifi.cacheTTL;
	wifi["startup_check"] = config.wifi.startupCheck;
	wifi["startup_scan_retries"] = config.wifi.startupScanRetries;
	wifi["gateway"] = config.wifi.gateway;
	wifi["dhcp_range"] = config.wifi.dhcpRange;
	wifi["helper_log_file"] = config.wifi.helperLogFile;
	wifi["helper_binary"] = config.wifi.helperBinary;
	wifi["helper_pid_file"] = config.wifi.helperPidFile;
	for (int k = 0; k < AP_KIND_MAX; k++)
	{
		const AccessPointConfig &ap = config.accessPoints[k];
		cfg[getAccessPointKindName((AccessPointKind)k)] = {
			{ "connection_name", ap.connectionName },
			{ "hotspot_name", ap.hotspotName },
			{ "passphrase", ap.passphrase }
		};
	}
	cfg["cors"] = {
		{ "enabled", config.cors.enabled },
		{ "origins", config.cors.origins }
	};
	return cfg;
}

std::optional<ErrorMessage> configFromJSON(const json &cfg, ProvisionerConfig &config)
{
	const std::string path = "config";
	JSON_PARSE_TRY_BLOCK
	{
		if (cfg.contains("server") && cfg["server"].is_object())
		{
			auto &server = cfg["server"];
			if (server.contains("host"))
				config.server.host = server["host"].get<std::string>();
			if (server.contains("port"))
			{ // Accept numeric strings as written by hand
				if (server["port"].is_string())
					config.server.port = std::atoi(server["port"].get<std::string>().c_str());
				else
					config.server.port = server["port"].get<int>();
			}
			if (server.contains("log_level"))
				config.server.logLevel = server["log_level"].get<std::string>();
			if (server.contains("ui_directory"))
				config.server.uiDirectory = server["ui_directory"].get<std::string>();
			if (server.contains("log_file"))
				config.server.logFile = server["log_file"].get<std::string>();
		}
		if (cfg.contains("wifi") && cfg["wifi"].is_object())
		{
			auto &wifi = cfg["wifi"];
			if (wifi.contains("interface"))
			{
				if (wifi["interface"].is_string() && !wifi["interface"].get<std::string>().empty())
					config.wifi.interface = wifi["interface"].get<std::string>();
				else
					config.wifi.interface.reset();
			}
			auto readFloat = [&](const char *key, float &value)
			{
				if (wifi.contains(key)) value = wifi[key].get<float>();
			};
			auto readInt = [&](const char *key, int &value)
			{
				if (wifi.contains(key)) value = wifi[key].get<int>();
			};
			auto readString = [&](const char *key, std::string &value)
			{
				if (wifi.contains(key)) value = wifi[key].get<std::string>();
			};
			readString("state_file", config.wifi.stateFile);
			readFloat("state_max_age", config.wifi.stateMaxAge);
			readFloat("command_timeout", config.wifi.commandTimeout);
			readFloat("connect_timeout", config.wifi.connectTimeout);
			readFloat("rescan_delay", config.wifi.rescanDelay);
			readInt("scan_retries", config.wifi.scanRetries);
			readFloat("hotspot_disable_delay", config.wifi.hotspotDisableDelay);
			readFloat("connect_settle_delay", config.wifi.connectSettleDelay);
			readFloat("helper_settle_delay", config.wifi.helperSettleDelay);
			readFloat("helper_grace", config.wifi.helperGrace);
			readFloat("cache_ttl", config.wifi.cacheTTL);
			if (wifi.contains("startup_check"))
				config.wifi.startupCheck = wifi["startup_check"].get<bool>();
			readInt("startup_scan_retries", config.wifi.startupScanRetries);
			readString("gateway", config.wifi.gateway);
			readString("dhcp_range", config.wifi.dhcpRange);
			readString("helper_log_file", config.wifi.helperLogFile);
			readString("helper_binary", config.wifi.helperBinary);
			readString("helper_pid_file", config.wifi.helperPidFile);
		}
		for (int k = 0; k < AP_KIND_MAX; k++)
		{
			const char *name = getAccessPointKindName((AccessPointKind)k);
			if (!cfg.contains(name) || !cfg[name].is_object()) continue;
			auto &section = cfg[name];
			AccessPointConfig &ap = config.accessPoints[k];
			if (section.contains("connection_name"))
				ap.connectionName = section["connection_name"].get<std::string>();
			if (section.contains("hotspot_name"))
				ap.hotspotName = section["hotspot_name"].get<std::string>();
			if (section.contains("passphrase"))
				ap.passphrase = section["passphrase"].get<std::string>();
		}
		if (cfg.contains("cors") && cfg["cors"].is_object())
		{
			auto &cors = cfg["cors"];
			if (cors.contains("enabled"))
				config.cors.enabled = cors["enabled"].get<bool>();
			if (cors.contains("origins"))
			{
				if (cors["origins"].is_string())
					config.cors.origins = { cors["origins"].get<std::string>() };
				else
					config.cors.origins = cors["origins"].get<std::vector<std::string>>();
			}
		}
	}
	JSON_PARSE_CATCH_BLOCK

	return std::nullopt;
}

std::optional<ErrorMessage> parseConfigFile(const std::string &path, ProvisionerConfig &config)
{
	json cfg;
	auto error = readJSON(path, cfg);
	if (error) return error;
	if (!cfg.is_object())
		return ErrorMessage(asprintf_s("Config '%s' is not a JSON object!", path.c_str()), ERROR_INVALID_ARGUMENT);

	// Parse into a copy so a partially invalid file leaves the config untouched
	ProvisionerConfig merged = config;
	error = configFromJSON(cfg, merged);
	if (error) return ErrorMessage(asprintf_s("Invalid config '%s': %s", path.c_str(), error->c_str()), ERROR_INVALID_ARGUMENT);
	config = std::move(merged);
	return std::nullopt;
}

std::optional<ErrorMessage> storeConfigFile(const std::string &path, const ProvisionerConfig &config)
{
	return writeJSON(path, configToJSON(config));
}

static bool parseEnvInt(const char *var, const char *value, int &out)
{
	char *end;
	long val = std::strtol(value, &end, 10);
	if (end == value || *end != '\0')
	{
		LOG(LConfig, LWarn, "Invalid integer value for %s: '%s'", var, value);
		return false;
	}
	out = (int)val;
	return true;
}

static bool parseEnvFloat(const char *var, const char *value, float &out)
{
	char *end;
	float val = std::strtof(value, &end);
	if (end == value || *end != '\0')
	{
		LOG(LConfig, LWarn, "Invalid number value for %s: '%s'", var, value);
		return false;
	}
	out = val;
	return true;
}

void applyEnvironmentOverrides(ProvisionerConfig &config)
{
	const char *value;
	if ((value = std::getenv("WIFI_SERVER_HOST")))
		config.server.host = value;
	if ((value = std::getenv("WIFI_SERVER_PORT")))
		parseEnvInt("WIFI_SERVER_PORT", value, config.server.port);
	if ((value = std::getenv("WIFI_SERVER_LOG_LEVEL")))
		config.server.logLevel = value;
	if ((value = std::getenv("WIFI_INTERFACE")) && *value != '\0')
		config.wifi.interface = value;
	if ((value = std::getenv("WIFI_HOTSPOT_PASSWORD")))
		config.accessPoints[AP_CONNECT].passphrase = value;
	if ((value = std::getenv("WIFI_SCAN_TIMEOUT")))
		parseEnvFloat("WIFI_SCAN_TIMEOUT", value, config.wifi.commandTimeout);
	if ((value = std::getenv("WIFI_RESCAN_DELAY")))
		parseEnvFloat("WIFI_RESCAN_DELAY", value, config.wifi.rescanDelay);
	if ((value = std::getenv("WIFI_STATE_FILE")))
		config.wifi.stateFile = value;
	if ((value = std::getenv("WIFI_CORS_ENABLED")))
	{
		std::string flag = toLower(value);
		config.cors.enabled = flag == "true" || flag == "1" || flag == "yes" || flag == "on";
	}
	if ((value = std::getenv("WIFI_CORS_ORIGINS")))
	{
		config.cors.origins.clear();
		std::stringstream ss(value);
		std::string origin;
		while (std::getline(ss, origin, ','))
		{
			origin = trimString(origin);
			if (!origin.empty()) config.cors.origins.push_back(origin);
		}
	}
}

std::optional<ErrorMessage> validateConfig(const ProvisionerConfig &config)
{
	if (config.server.port <= 0 || config.server.port > 65535)
		return ErrorMessage(asprintf_s("Invalid server port %d!", config.server.port), ERROR_INVALID_ARGUMENT);
	LogLevel level;
	if (!ParseLogLevel(config.server.logLevel, level))
		return ErrorMessage(asprintf_s("Invalid log level '%s'!", config.server.logLevel.c_str()), ERROR_INVALID_ARGUMENT);
	const WifiConfig &wifi = config.wifi;
	const std::pair<const char*, float> durations[] = {
		{ "state_max_age", wifi.stateMaxAge },
		{ "command_timeout", wifi.commandTimeout },
		{ "connect_timeout", wifi.connectTimeout },
		{ "rescan_delay", wifi.rescanDelay },
		{ "hotspot_disable_delay", wifi.hotspotDisableDelay },
		{ "connect_settle_delay", wifi.connectSettleDelay },
		{ "helper_settle_delay", wifi.helperSettleDelay },
		{ "helper_grace", wifi.helperGrace },
		{ "cache_ttl", wifi.cacheTTL }
	};
	for (auto &duration : durations)
	{
		if (duration.second < 0)
			return ErrorMessage(asprintf_s("Invalid negative duration for wifi.%s!", duration.first), ERROR_INVALID_ARGUMENT);
	}
	if (wifi.commandTimeout <= 0 || wifi.connectTimeout <= 0)
		return ErrorMessage("Command and connect timeouts must be positive!", ERROR_INVALID_ARGUMENT);
	if (wifi.scanRetries < 1 || wifi.startupScanRetries < 1)
		return ErrorMessage("Scan retries must be at least 1!", ERROR_INVALID_ARGUMENT);
	in_addr addr;
	if (inet_pton(AF_INET, wifi.gateway.c_str(), &addr) != 1)
		return ErrorMessage(asprintf_s("Gateway '%s' is not an IPv4 address!", wifi.gateway.c_str()), ERROR_INVALID_ARGUMENT);
	if (wifi.dhcpRange.find(',') == std::string::npos)
		return ErrorMessage(asprintf_s("DHCP range '%s' needs a start and end address!", wifi.dhcpRange.c_str()), ERROR_INVALID_ARGUMENT);
	if (wifi.stateFile.empty())
		return ErrorMessage("State file path must not be empty!", ERROR_INVALID_ARGUMENT);
	for (int k = 0; k < AP_KIND_MAX; k++)
	{
		const AccessPointConfig &ap = config.accessPoints[k];
		const char *name = getAccessPointKindName((AccessPointKind)k);
		if (ap.connectionName.empty() || ap.hotspotName.empty())
			return ErrorMessage(asprintf_s("Access point '%s' needs a connection and hotspot name!", name), ERROR_INVALID_ARGUMENT);
		if (!ap.passphrase.empty() && (ap.passphrase.size() < 8 || ap.passphrase.size() > 63))
			return ErrorMessage(asprintf_s("Passphrase of access point '%s' must be 8 to 63 characters!", name), ERROR_INVALID_ARGUMENT);
	}
	if (config.accessPoints[AP_DIRECT].connectionName == config.accessPoints[AP_CONNECT].connectionName)
		return ErrorMessage("Access points need distinct connection names!", ERROR_INVALID_ARGUMENT);
	return std::nullopt;
}

void loadConfig(const std::string &path, ProvisionerConfig &config)
{
	if (!path.empty())
	{
		auto error = parseConfigFile(path, config);
		if (error && error->is(ERROR_NOT_FOUND))
			LOG(LConfig, LDebug, "No config file '%s', using defaults", path.c_str());
		else if (error)
			LOG(LConfig, LWarn, "Could not load config file: %s", error->c_str());
		else
			LOG(LConfig, LInfo, "Loaded config file '%s'", path.c_str());
	}
	applyEnvironmentOverrides(config);
}
