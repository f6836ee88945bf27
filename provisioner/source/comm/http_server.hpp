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

#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include <map>
#include <string>
#include <vector>
#include <thread>
#include <functional>

/**
 * Minimal HTTP/1.1 server for the control API
 * Single accept loop on one worker thread, one request per connection
 */

/* Structures */

struct HttpRequest
{
	std::string method;
	std::string path; // Decoded, without query
	std::string version;
	std::map<std::string, std::string> headers; // Lower-case names
	std::map<std::string, std::string> query;
	std::string body;

	std::string header(const std::string &name) const;
	bool hasParam(const std::string &name) const { return query.find(name) != query.end(); }
	std::string param(const std::string &name, const std::string &fallback = "") const;
};

struct HttpResponse
{
	int status = 200;
	std::string contentType = "application/json";
	std::vector<std::pair<std::string, std::string>> headers;
	std::string body;
};

enum HttpParseStatus
{
	HTTP_PARSE_INCOMPLETE = 0,
	HTTP_PARSE_COMPLETE,
	HTTP_PARSE_INVALID,
	HTTP_PARSE_TOO_LARGE
};

typedef std::function<HttpResponse(const HttpRequest &request)> HttpHandler;

struct HttpServerState
{
	std::jthread *thread = nullptr;
	int socket = -1;

	std::string host = "0.0.0.0";
	int port = 8000;
	std::size_t maxRequestSize = 64*1024;
	int receiveTimeoutMS = 5000;

	HttpHandler handler;
};


/* Functions */

HttpParseStatus parseHttpRequest(const std::string &buffer, std::size_t maxSize, HttpRequest &request);
std::string serializeHttpResponse(const HttpResponse &response);
const char* getHttpStatusText(int status);

std::string urlDecode(const std::string &str, bool plusAsSpace = false);
std::map<std::string, std::string> parseQueryString(const std::string &query);

// Interprets a query or body flag the way browsers and scripts pass them ("true", "1", "yes", "on")
bool parseFlag(const std::string &value);

// Returns the listening socket or -1
int HttpServerOpen(const std::string &host, int port);
void HttpServerThread(std::stop_token stop_token, HttpServerState *serverState);
void HttpServerClose(HttpServerState &server);

#endif // HTTP_SERVER_H
