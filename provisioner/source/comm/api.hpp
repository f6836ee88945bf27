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

#ifndef API_H
#define API_H

#include "comm/http_server.hpp"

#include "network/workflow.hpp"
#include "config.hpp"

#include "nlohmann/json.hpp"
using json = nlohmann::json;

/* JSON marshaling of the data model */

json networkToJSON(const NetworkRecord &network);
json connectedToJSON(const ConnectedNetwork &network);
json savedToJSON(const SavedConnectionProfile &profile);

const char* getContentType(const std::string &extension);

/**
 * Routes control API requests to the connectivity workflow
 * Every failure is answered with a structured JSON result
 */
class ControlApi
{
public:
	ControlApi(ConnectivityWorkflow &workflow, NetworkBackend &backend, const ProvisionerConfig &config)
		: workflow(workflow), backend(backend), uiDirectory(config.server.uiDirectory), cors(config.cors) {}

	HttpResponse handle(const HttpRequest &request);

private:
	ConnectivityWorkflow &workflow;
	NetworkBackend &backend;
	std::string uiDirectory;
	CorsConfig cors;

	HttpResponse route(const HttpRequest &request);
	void applyCors(const HttpRequest &request, HttpResponse &response) const;

	HttpResponse serveFile(const std::string &relativePath);
	HttpResponse health();
	HttpResponse listNetworks(const HttpRequest &request);
	HttpResponse listConnected();
	HttpResponse listSaved();
	HttpResponse connect(const json &body);
	HttpResponse forget(const std::string &ssid, const std::string &bssid);
	HttpResponse forgetAll();
	HttpResponse setAccessPoint(AccessPointKind kind, const json &body);
	HttpResponse getAccessPoint(AccessPointKind kind);
	HttpResponse scanStatus();
};

#endif // API_H
