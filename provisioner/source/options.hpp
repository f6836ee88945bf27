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

#ifndef OPTIONS_H
#define OPTIONS_H

#include <getopt.h>
#include <unistd.h>
#include <string>
#include <cstdio>
#include <cstdlib>
#include <optional>

#include "config.hpp"

enum OneShotAction
{
	ACTION_SERVE = 0,
	ACTION_LIST_NETWORKS,
	ACTION_LIST_CONNECTED,
	ACTION_LIST_SAVED,
	ACTION_FORGET_NETWORK,
	ACTION_FORGET_ALL,
	ACTION_CONNECT,
	ACTION_START_HOTSPOT,
	ACTION_STOP_HOTSPOT,
	ACTION_CHECK_HOTSPOT,
	ACTION_PRINT_CONFIG,
	ACTION_WRITE_CONFIG
};

struct ProvisionerOptions
{
	std::string configFile = "wifi_config.json";
	OneShotAction action = ACTION_SERVE;
	std::string actionArg; // SSID or output file
	std::string passphrase;

	// Overrides of the config
	std::optional<std::string> host;
	std::optional<int> port;
	std::optional<std::string> interface;
	std::optional<std::string> uiDirectory;
	std::optional<std::string> logLevel;
	std::optional<std::string> logFile;
};

static bool options_read(ProvisionerOptions &options, int argc, char **argv)
{
	const struct option long_options[] = {
		{"h",					no_argument,		0,	'h' },
		{"help",				no_argument,		0,	'h' },
		{"c",					required_argument,	0,	'c' },
		{"config",				required_argument,	0,	'c' },
		{"host",				required_argument,	0,	'a' },
		{"p",					required_argument,	0,	'p' },
		{"port",				required_argument,	0,	'p' },
		{"i",					required_argument,	0,	'i' },
		{"interface",			required_argument,	0,	'i' },
		{"ui-directory",		required_argument,	0,	'u' },
		{"log-level",			required_argument,	0,	'l' },
		{"log-file",			required_argument,	0,	'f' },
		{"list-networks",		no_argument,		0,	'N' },
		{"list-connected",		no_argument,		0,	'C' },
		{"list-saved",			no_argument,		0,	'S' },
		{"forget-network",		required_argument,	0,	'F' },
		{"forget-all",			no_argument,		0,	'A' },
		{"connect",				required_argument,	0,	'X' },
		{"passphrase",			required_argument,	0,	'P' },
		{"start-hotspot",		no_argument,		0,	'H' },
		{"stop-hotspot",		no_argument,		0,	'O' },
		{"check-hotspot",		no_argument,		0,	'K' },
		{"print-config",		no_argument,		0,	'R' },
		{"write-config",		required_argument,	0,	'W' },
		{0,						0,					0,	0 }
	};

	int c, i;
	auto print_help = [](const char *progname)
	{
		printf(
"Usage: %s [options]\n"
"  options:\n"
"    -h, --help                   Display this help message\n"
"    -c, --config file            Configuration file (wifi_config.json)\n"
"    --host addr                  Address the control API binds to (0.0.0.0)\n"
"    -p, --port port              Port of the control API (8000)\n"
"    -i, --interface name         Wireless interface to use instead of discovering it\n"
"    --ui-directory dir           Directory the UI is served from (ui)\n"
"    --log-level level            trace, debug, info, warn or error (info)\n"
"    --log-file file              Additionally log to file, rotating previous logs\n"
"\n"
"  one-shot operations (exit instead of serving):\n"
"    --list-networks              Scan and list available networks\n"
"    --list-connected             Show the currently connected network\n"
"    --list-saved                 List saved networks\n"
"    --forget-network ssid        Delete all saved profiles of the network\n"
"    --forget-all                 Delete all saved networks\n"
"    --connect ssid               Connect to a network, use --passphrase for secured networks\n"
"    --passphrase pass            Passphrase for --connect\n"
"    --start-hotspot              Start the WiFi Connect hotspot\n"
"    --stop-hotspot               Stop the WiFi Connect hotspot\n"
"    --check-hotspot              Report whether the WiFi Connect hotspot is active\n"
"    --print-config               Print the effective configuration\n"
"    --write-config file          Write the effective configuration to file\n"
"\n"
"Examples:\n"
"  sudo %s --port 8080 --log-level debug\n"
"  sudo %s --connect MyNetwork --passphrase secret123\n", progname, progname, progname);
	};

	auto setAction = [&](OneShotAction action, const char *arg)
	{
		if (options.action != ACTION_SERVE)
		{
			printf("Only one operation can be run at a time!\n");
			return false;
		}
		options.action = action;
		if (arg) options.actionArg = arg;
		return true;
	};

	while ((c = getopt_long_only(argc, argv, "", long_options, &i)) != -1)
	{
		switch (c)
		{
			case 'c':
				options.configFile = std::string(optarg);
				break;
			case 'a':
				options.host = std::string(optarg);
				break;
			case 'p':
			{
				char *end;
				long port = std::strtol(optarg, &end, 10);
				if (end == optarg || *end != '\0' || port <= 0 || port > 65535)
				{
					printf("Invalid port '%s'!\n", optarg);
					return false;
				}
				options.port = (int)port;
				break;
			}
			case 'i':
				options.interface = std::string(optarg);
				break;
			case 'u':
				options.uiDirectory = std::string(optarg);
				break;
			case 'l':
				options.logLevel = std::string(optarg);
				break;
			case 'f':
				options.logFile = std::string(optarg);
				break;
			case 'N':
				if (!setAction(ACTION_LIST_NETWORKS, nullptr)) return false;
				break;
			case 'C':
				if (!setAction(ACTION_LIST_CONNECTED, nullptr)) return false;
				break;
			case 'S':
				if (!setAction(ACTION_LIST_SAVED, nullptr)) return false;
				break;
			case 'F':
				if (!setAction(ACTION_FORGET_NETWORK, optarg)) return false;
				break;
			case 'A':
				if (!setAction(ACTION_FORGET_ALL, nullptr)) return false;
				break;
			case 'X':
				if (!setAction(ACTION_CONNECT, optarg)) return false;
				break;
			case 'P':
				options.passphrase = std::string(optarg);
				break;
			case 'H':
				if (!setAction(ACTION_START_HOTSPOT, nullptr)) return false;
				break;
			case 'O':
				if (!setAction(ACTION_STOP_HOTSPOT, nullptr)) return false;
				break;
			case 'K':
				if (!setAction(ACTION_CHECK_HOTSPOT, nullptr)) return false;
				break;
			case 'R':
				if (!setAction(ACTION_PRINT_CONFIG, nullptr)) return false;
				break;
			case 'W':
				if (!setAction(ACTION_WRITE_CONFIG, optarg)) return false;
				break;
			case 'h':
			default:
				print_help(argv[0]);
				return false;
		}
	}
	if (optind < argc)
	{
		print_help(argv[0]);
		return false;
	}

	// ---- Checks ----

	if (!options.passphrase.empty() && options.action != ACTION_CONNECT)
	{
		printf("--passphrase is only used with --connect!\n");
		return false;
	}
	if ((options.action == ACTION_CONNECT || options.action == ACTION_FORGET_NETWORK) && options.actionArg.empty())
	{
		printf("An SSID is required!\n");
		return false;
	}
	return true;
}

static void options_apply(const ProvisionerOptions &options, ProvisionerConfig &config)
{
	if (options.host) config.server.host = *options.host;
	if (options.port) config.server.port = *options.port;
	if (options.interface) config.wifi.interface = *options.interface;
	if (options.uiDirectory) config.server.uiDirectory = *options.uiDirectory;
	if (options.logLevel) config.server.logLevel = *options.logLevel;
	if (options.logFile) config.server.logFile = *options.logFile;
}

#endif // OPTIONS_H
