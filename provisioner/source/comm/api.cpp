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

#include "comm/api.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include <fstream>
#include <algorithm>
#include <sstream>
#include <filesystem>

static HttpResponse jsonResponse(int status, const json &body)
{
	HttpResponse response;
	response.status = status;
	response.body = body.dump();
	return response;
}

static HttpResponse detailResponse(int status, const std::string &detail)
{
	return jsonResponse(status, { { "detail", detail } });
}

static HttpResponse successResponse(bool success, const std::string &message)
{
	return jsonResponse(200, { { "success", success }, { "message", message } });
}

static std::string bodyString(const json &body, const char *key)
{
	if (!body.is_object() || !body.contains(key)) return "";
	auto &value = body[key];
	if (value.is_string()) return value.get<std::string>();
	if (value.is_boolean()) return value.get<bool>()? "true" : "false";
	return "";
}

json networkToJSON(const NetworkRecord &network)
{
	return {
		{ "ssid", network.ssid },
		{ "security", getSecurityName(network.security) },
		{ "signal_strength", network.signalPercent },
		{ "frequency_band", getBandName(network.band) },
		{ "active", network.isActive },
		{ "bssid", network.bssid? json(*network.bssid) : json(nullptr) }
	};
}

json connectedToJSON(const ConnectedNetwork &network)
{
	return {
		{ "ssid", network.ssid },
		{ "interface", network.interface },
		{ "security", getSecurityName(network.security) },
		{ "connection_name", network.connectionName }
	};
}

json savedToJSON(const SavedConnectionProfile &profile)
{
	return {
		{ "ssid", profile.ssid },
		{ "interface", profile.interface },
		{ "security", getSecurityName(profile.security) },
		{ "connection_name", profile.name }
	};
}

const char* getContentType(const std::string &extension)
{
	std::string ext = toLower(extension);
	if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
	if (ext == ".js") return "text/javascript; charset=utf-8";
	if (ext == ".css") return "text/css; charset=utf-8";
	if (ext == ".json") return "application/json";
	if (ext == ".svg") return "image/svg+xml";
	if (ext == ".png") return "image/png";
	if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
	if (ext == ".ico") return "image/x-icon";
	if (ext == ".txt") return "text/plain; charset=utf-8";
	return "application/octet-stream";
}

HttpResponse ControlApi::handle(const HttpRequest &request)
{
	HttpResponse response;
	if (request.method == "OPTIONS")
		response.status = 204;
	else
		response = route(request);
	applyCors(request, response);
	return response;
}

void ControlApi::applyCors(const HttpRequest &request, HttpResponse &response) const
{
	if (!cors.enabled) return;
	std::string origin = request.header("origin");
	bool wildcard = std::find(cors.origins.begin(), cors.origins.end(), "*") != cors.origins.end();
	if (wildcard)
		response.headers.emplace_back("Access-Control-Allow-Origin", "*");
	else if (!origin.empty() && std::find(cors.origins.begin(), cors.origins.end(), origin) != cors.origins.end())
	{
		response.headers.emplace_back("Access-Control-Allow-Origin", origin);
		response.headers.emplace_back("Vary", "Origin");
	}
	else
		return;
	response.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
	response.headers.emplace_back("Access-Control-Allow-Headers", "Content-Type");
}

HttpResponse ControlApi::route(const HttpRequest &request)
{
	const std::string &path = request.path;
	bool isGet = request.method == "GET";
	bool isPost = request.method == "POST";

	if (isGet)
	{
		if (path == "/") return serveFile("index.html");
		if (path.starts_with("/ui/")) return serveFile(path.substr(4));
		if (path == "/health") return health();
		if (path == "/list-networks") return listNetworks(request);
		if (path == "/list-connected") return listConnected();
		if (path == "/list-saved") return listSaved();
		if (path == "/get-wifi-direct") return getAccessPoint(AP_DIRECT);
		if (path == "/get-wifi-connect") return getAccessPoint(AP_CONNECT);
		if (path == "/scan-status") return scanStatus();
	}
	else if (isPost)
	{
		json body = json::object();
		if (!trimString(request.body).empty())
		{
			body = json::parse(request.body, nullptr, false);
			if (body.is_discarded() || !body.is_object())
				return detailResponse(422, "Request body must be a JSON object");
		}
		if (path == "/connect") return connect(body);
		if (path == "/forget")
			return forget(bodyString(body, "ssid"), bodyString(body, "bssid"));
		if (path == "/forget-network")
		{
			std::string ssid = bodyString(body, "ssid");
			if (ssid.empty()) ssid = bodyString(body, "network_name");
			return forget(ssid, bodyString(body, "bssid"));
		}
		if (path == "/forget-all") return forgetAll();
		if (path == "/set-wifi-direct") return setAccessPoint(AP_DIRECT, body);
		if (path == "/set-wifi-connect") return setAccessPoint(AP_CONNECT, body);
	}

	static const char *knownPaths[] = { "/", "/health", "/list-networks", "/list-connected", "/list-saved",
		"/get-wifi-direct", "/get-wifi-connect", "/scan-status", "/connect", "/forget", "/forget-network",
		"/forget-all", "/set-wifi-direct", "/set-wifi-connect" };
	for (const char *known : knownPaths)
		if (path == known) return detailResponse(405, "Method Not Allowed");
	return detailResponse(404, "Not Found");
}

HttpResponse ControlApi::serveFile(const std::string &relativePath)
{
	std::error_code ec;
	std::filesystem::path root = std::filesystem::weakly_canonical(uiDirectory, ec);
	if (ec) return detailResponse(404, "Not Found");
	std::filesystem::path file = std::filesystem::weakly_canonical(root / relativePath, ec);
	if (ec) return detailResponse(404, "Not Found");
	// Reject anything resolving outside the UI directory
	auto rel = file.lexically_relative(root);
	if (rel.empty() || rel.native().starts_with(".."))
		return detailResponse(404, "Not Found");
	if (std::filesystem::is_directory(file, ec))
		file /= "index.html";

	std::ifstream fs(file, std::ios::binary);
	if (!fs.is_open())
		return detailResponse(404, "Not Found");
	std::stringstream ss;
	ss << fs.rdbuf();
	HttpResponse response;
	response.contentType = getContentType(file.extension().string());
	response.body = ss.str();
	return response;
}

HttpResponse ControlApi::health()
{
	std::string version;
	auto error = backend.checkAvailable(version);
	if (error)
	{
		LOG(LServer, LError, "Health check failed: %s", error->c_str());
		return detailResponse(503, "NetworkManager not available");
	}
	return jsonResponse(200, { { "status", "healthy" }, { "message", "WiFi API is running" } });
}

HttpResponse ControlApi::listNetworks(const HttpRequest &request)
{
	bool useCache = request.hasParam("use_cache")? parseFlag(request.param("use_cache")) : true;
	bool forceScan = request.hasParam("force_scan") && parseFlag(request.param("force_scan"));
	ScanMode mode = forceScan? SCAN_FORCE_LIVE : (useCache? SCAN_CACHED : SCAN_LIVE_IF_POSSIBLE);

	ScanResult result;
	auto error = workflow.scan(mode, result);
	if (error)
	{
		const char *code = error->is(ERROR_HARDWARE_UNAVAILABLE)? "no_wifi_interface" : "scan_failed";
		return jsonResponse(200, { { "error", code }, { "message", error->str() } });
	}
	json networks = json::array();
	for (auto &network : result.entry->records)
		networks.push_back(networkToJSON(network));
	return jsonResponse(200, { { "networks", networks } });
}

HttpResponse ControlApi::listConnected()
{
	std::optional<ConnectedNetwork> network;
	auto error = workflow.connectedNetwork(network);
	if (error)
	{
		LOG(LServer, LError, "Error getting connected network: %s", error->c_str());
		return jsonResponse(200, { { "error", "connection_check_failed" }, { "message", error->str() } });
	}
	return jsonResponse(200, { { "connected", network? connectedToJSON(*network) : json(nullptr) } });
}

HttpResponse ControlApi::listSaved()
{
	std::vector<SavedConnectionProfile> profiles;
	auto error = workflow.savedNetworks(profiles);
	if (error)
	{
		LOG(LServer, LError, "Error listing saved networks: %s", error->c_str());
		return jsonResponse(200, { { "error", "list_failed" }, { "message", error->str() } });
	}
	json saved = json::array();
	for (auto &profile : profiles)
		saved.push_back(savedToJSON(profile));
	return jsonResponse(200, { { "saved_networks", saved } });
}

HttpResponse ControlApi::connect(const json &body)
{
	std::string ssid = bodyString(body, "ssid");
	if (ssid.empty())
		return detailResponse(422, "Field 'ssid' is required");
	auto error = workflow.connect(ssid, bodyString(body, "passphrase"));
	if (error)
		return successResponse(false, asprintf_s("Failed to connect to network: %s", error->c_str()));
	return successResponse(true, asprintf_s("Connected to %s", ssid.c_str()));
}

HttpResponse ControlApi::forget(const std::string &ssid, const std::string &bssid)
{
	if (ssid.empty() && bssid.empty())
		return successResponse(false, "Either SSID or BSSID is required");
	ForgetReport report;
	auto error = workflow.forget(ssid, bssid, report);
	if (error)
		return successResponse(false, report.message.empty()? error->str() : report.message);
	return successResponse(true, report.message);
}

HttpResponse ControlApi::forgetAll()
{
	ForgetReport report;
	auto error = workflow.forgetAll(report);
	if (error)
		return successResponse(false, report.message.empty()? error->str() : report.message);
	return successResponse(true, report.message);
}

HttpResponse ControlApi::setAccessPoint(AccessPointKind kind, const json &body)
{
	if (!body.contains("value"))
		return detailResponse(422, "Field 'value' is required");
	bool enable = parseFlag(bodyString(body, "value"));
	auto error = workflow.setAccessPoint(kind, enable);
	if (error)
		return detailResponse(500, error->str());
	return jsonResponse(200, { { "value", enable } });
}

HttpResponse ControlApi::getAccessPoint(AccessPointKind kind)
{
	bool active = false;
	auto error = workflow.accessPointStatus(kind, active);
	if (error)
	{
		LOG(LServer, LError, "Error getting %s status: %s", getAccessPointModeName(kind), error->c_str());
		return detailResponse(500, asprintf_s("Failed to get %s status", getAccessPointModeName(kind)));
	}
	return jsonResponse(200, { { "value", active } });
}

HttpResponse ControlApi::scanStatus()
{
	ScanStatus status = workflow.scanStatus();
	return jsonResponse(200, {
		{ "hotspot_active", status.accessPointActive },
		{ "hotspot_type", status.kind? json(getAccessPointKindName(*status.kind)) : json(nullptr) },
		{ "can_scan", status.canScan },
		{ "cache_valid", status.cacheFresh },
		{ "warning_message", status.warning.empty()? json(nullptr) : json(status.warning) }
	});
}
