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

#include <atomic>
#include <thread>
#include <string>
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <signal.h>

#include "options.hpp"
#include "config.hpp"
#include "state_store.hpp"

#include "system/command.hpp"
#include "system/dhcp_helper.hpp"

#include "network/nmcli.hpp"
#include "network/interface.hpp"
#include "network/scan_cache.hpp"
#include "network/modes.hpp"
#include "network/workflow.hpp"

#include "comm/http_server.hpp"
#include "comm/api.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

static std::atomic<bool> stopRequested = false;

static void stop_handler(int signum)
{
	stopRequested = true;
}

static ModeSettings getModeSettings(const ProvisionerConfig &config)
{
	ModeSettings settings;
	for (int k = 0; k < AP_KIND_MAX; k++)
	{
		const AccessPointConfig &ap = config.accessPoints[k];
		settings.accessPoints[k] = { ap.connectionName, ap.hotspotName, ap.passphrase };
	}
	settings.gateway = config.wifi.gateway;
	settings.dhcpRange = config.wifi.dhcpRange;
	settings.activationTimeoutMS = toMS(config.wifi.connectTimeout);
	settings.helperSettleMS = toMS(config.wifi.helperSettleDelay);
	return settings;
}

static WorkflowSettings getWorkflowSettings(const ProvisionerConfig &config)
{
	WorkflowSettings settings;
	settings.rescanDelayMS = toMS(config.wifi.rescanDelay);
	settings.scanRetries = config.wifi.scanRetries;
	settings.suspendSettleMS = toMS(config.wifi.hotspotDisableDelay);
	settings.connectSettleMS = toMS(config.wifi.connectSettleDelay);
	settings.connectTimeoutMS = toMS(config.wifi.connectTimeout);
	settings.startupCheck = config.wifi.startupCheck;
	settings.startupScanRetries = config.wifi.startupScanRetries;
	return settings;
}

static void printJSON(const json &data)
{
	std::stringstream ss;
	ss << std::setfill('\t') << std::setw(1) << data;
	printf("%s\n", ss.str().c_str());
}

static int runOneShot(const ProvisionerOptions &options, ConnectivityWorkflow &workflow, DnsmasqHelper &helper)
{
	auto report = [](const std::optional<ErrorMessage> &error, const std::string &success)
	{
		if (error)
		{
			printf("Error: %s\n", error->c_str());
			return 1;
		}
		if (!success.empty()) printf("%s\n", success.c_str());
		return 0;
	};

	switch (options.action)
	{
		case ACTION_LIST_NETWORKS:
		{
			ScanResult result;
			auto error = workflow.scan(SCAN_LIVE_IF_POSSIBLE, result);
			if (error) return report(error, "");
			json networks = json::array();
			for (auto &network : result.entry->records)
				networks.push_back(networkToJSON(network));
			printJSON(networks);
			return 0;
		}
		case ACTION_LIST_CONNECTED:
		{
			std::optional<ConnectedNetwork> network;
			auto error = workflow.connectedNetwork(network);
			if (error) return report(error, "");
			printJSON(network? connectedToJSON(*network) : json(nullptr));
			return 0;
		}
		case ACTION_LIST_SAVED:
		{
			std::vector<SavedConnectionProfile> profiles;
			auto error = workflow.savedNetworks(profiles);
			if (error) return report(error, "");
			json saved = json::array();
			for (auto &profile : profiles)
				saved.push_back(savedToJSON(profile));
			printJSON(saved);
			return 0;
		}
		case ACTION_FORGET_NETWORK:
		{
			ForgetReport forget;
			auto error = workflow.forget(options.actionArg, "", forget);
			if (forget.fallbackActivated) helper.release();
			return report(error, forget.message);
		}
		case ACTION_FORGET_ALL:
		{
			ForgetReport forget;
			auto error = workflow.forgetAll(forget);
			if (forget.fallbackActivated) helper.release();
			return report(error, forget.message);
		}
		case ACTION_CONNECT:
		{
			if (!helper.stopOrphaned())
				LOG(LDefault, LWarn, "Failed to stop DHCP helper of a running hotspot");
			auto error = workflow.connect(options.actionArg, options.passphrase);
			// A failed connect restores the hotspot, which has to outlive this process
			helper.release();
			return report(error, asprintf_s("Connected to %s", options.actionArg.c_str()));
		}
		case ACTION_START_HOTSPOT:
		{
			if (!helper.stopOrphaned())
				LOG(LDefault, LWarn, "Failed to stop previous DHCP helper");
			auto error = workflow.setAccessPoint(AP_CONNECT, true);
			helper.release();
			return report(error, "WiFi Connect hotspot started");
		}
		case ACTION_STOP_HOTSPOT:
		{
			if (!helper.stopOrphaned())
				LOG(LDefault, LWarn, "Failed to stop DHCP helper");
			auto error = workflow.setAccessPoint(AP_CONNECT, false);
			return report(error, "WiFi Connect hotspot stopped");
		}
		case ACTION_CHECK_HOTSPOT:
		{
			bool active = false;
			auto error = workflow.accessPointStatus(AP_CONNECT, active);
			if (error) return report(error, "");
			printf("WiFi Connect hotspot is %s\n", active? "active" : "inactive");
			return active? 0 : 1;
		}
		default:
			return 1;
	}
}

int main(int argc, char **argv)
{
	// ---- Init Application ----

	struct sigaction action = {};
	action.sa_handler = stop_handler;
	sigemptyset(&action.sa_mask);
	sigaction(SIGINT, &action, NULL);
	sigaction(SIGTERM, &action, NULL);
	signal(SIGPIPE, SIG_IGN);

	// Read and validate arguments
	ProvisionerOptions options;
	if (!options_read(options, argc, argv))
		return 1;

	InitLogging(LInfo);

	ProvisionerConfig config;
	loadConfig(options.configFile, config);
	options_apply(options, config);
	if (auto error = validateConfig(config))
	{
		LOG(LConfig, LError, "Invalid configuration: %s", error->c_str());
		return 1;
	}

	LogLevel level = LInfo;
	ParseLogLevel(config.server.logLevel, level);
	InitLogging(level, config.server.logFile);

	if (options.action == ACTION_PRINT_CONFIG)
	{
		printJSON(configToJSON(config));
		return 0;
	}
	if (options.action == ACTION_WRITE_CONFIG)
	{
		if (auto error = storeConfigFile(options.actionArg, config))
		{
			LOG(LConfig, LError, "%s", error->c_str());
			return 1;
		}
		LOG(LConfig, LInfo, "Wrote configuration to '%s'", options.actionArg.c_str());
		return 0;
	}

	// ---- Init Components ----

	SystemCommandRunner runner;
	NmcliBackend backend(runner, toMS(config.wifi.commandTimeout));
	InterfaceResolver resolver(backend, config.wifi.interface);
	ScanCache cache(toMS(config.wifi.cacheTTL));
	StateStore store(config.wifi.stateFile, config.wifi.stateMaxAge);

	DnsmasqOptions helperOptions;
	helperOptions.binary = config.wifi.helperBinary;
	helperOptions.logFile = config.wifi.helperLogFile;
	helperOptions.pidFile = config.wifi.helperPidFile;
	helperOptions.settleMS = toMS(config.wifi.helperSettleDelay);
	helperOptions.graceMS = toMS(config.wifi.helperGrace);
	DnsmasqHelper helper(helperOptions);

	ModeOrchestrator modes(backend, helper, resolver, cache, store, getModeSettings(config));
	ConnectivityWorkflow workflow(backend, modes, resolver, cache, store, helper, getWorkflowSettings(config));

	if (options.action != ACTION_SERVE)
	{
		int status = runOneShot(options, workflow, helper);
		FlushLog();
		return status;
	}

	// ---- Startup Recovery ----

	std::string version;
	if (auto error = backend.checkAvailable(version))
		LOG(LDefault, LWarn, "%s", error->c_str());
	else
		LOG(LDefault, LInfo, "Using NetworkManager %s", version.c_str());

	if (auto error = workflow.recoverOnStartup())
		LOG(LDefault, LWarn, "Startup recovery incomplete: %s", error->c_str());

	// ---- Serve ----

	ControlApi api(workflow, backend, config);
	HttpServerState server;
	server.host = config.server.host;
	server.port = config.server.port;
	server.handler = [&api](const HttpRequest &request) { return api.handle(request); };
	server.socket = HttpServerOpen(server.host, server.port);
	if (server.socket < 0)
	{
		LOG(LServer, LError, "Failed to open control API on %s:%d", server.host.c_str(), server.port);
		workflow.shutdown();
		FlushLog();
		return 1;
	}
	server.thread = new std::jthread(HttpServerThread, &server);

	while (!stopRequested)
		sleepMS(100);

	LOG(LDefault, LInfo, "Shutting down...");
	HttpServerClose(server);
	workflow.shutdown();
	FlushLog();
	return 0;
}
