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

#include "comm/http_server.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <poll.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <algorithm>
#include <exception>

#define SERVER_ACCEPT_INTERVAL_MS	100

std::string HttpRequest::header(const std::string &name) const
{
	auto it = headers.find(toLower(name));
	return it == headers.end()? "" : it->second;
}

std::string HttpRequest::param(const std::string &name, const std::string &fallback) const
{
	auto it = query.find(name);
	return it == query.end()? fallback : it->second;
}

static int hexValue(char c)
{
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

std::string urlDecode(const std::string &str, bool plusAsSpace)
{
	std::string out;
	out.reserve(str.size());
	for (std::size_t i = 0; i < str.size(); i++)
	{
		if (str[i] == '%' && i+2 < str.size() && hexValue(str[i+1]) >= 0 && hexValue(str[i+2]) >= 0)
		{
			out.push_back((char)(hexValue(str[i+1])*16 + hexValue(str[i+2])));
			i += 2;
		}
		else if (str[i] == '+' && plusAsSpace)
			out.push_back(' ');
		else
			out.push_back(str[i]);
	}
	return out;
}

std::map<std::string, std::string> parseQueryString(const std::string &query)
{
	std::map<std::string, std::string> params;
	std::size_t pos = 0;
	while (pos <= query.size())
	{
		std::size_t end = query.find('&', pos);
		if (end == std::string::npos) end = query.size();
		std::string pair = query.substr(pos, end-pos);
		if (!pair.empty())
		{
			std::size_t eq = pair.find('=');
			if (eq == std::string::npos)
				params[urlDecode(pair, true)] = "";
			else
				params[urlDecode(pair.substr(0, eq), true)] = urlDecode(pair.substr(eq+1), true);
		}
		pos = end+1;
	}
	return params;
}

bool parseFlag(const std::string &value)
{
	std::string flag = toLower(trimString(value));
	return flag == "true" || flag == "1" || flag == "yes" || flag == "on";
}

HttpParseStatus parseHttpRequest(const std::string &buffer, std::size_t maxSize, HttpRequest &request)
{
	std::size_t headerEnd = buffer.find("\r\n\r\n");
	if (headerEnd == std::string::npos)
		return buffer.size() > maxSize? HTTP_PARSE_TOO_LARGE : HTTP_PARSE_INCOMPLETE;

	// Request line
	std::size_t lineEnd = buffer.find("\r\n");
	std::string requestLine = buffer.substr(0, lineEnd);
	std::size_t sp1 = requestLine.find(' ');
	std::size_t sp2 = requestLine.rfind(' ');
	if (sp1 == std::string::npos || sp2 == sp1)
		return HTTP_PARSE_INVALID;
	request.method = requestLine.substr(0, sp1);
	std::string target = requestLine.substr(sp1+1, sp2-sp1-1);
	request.version = requestLine.substr(sp2+1);
	if (request.method.empty() || target.empty() || target[0] != '/' || !request.version.starts_with("HTTP/1."))
		return HTTP_PARSE_INVALID;
	std::size_t queryStart = target.find('?');
	request.path = urlDecode(target.substr(0, queryStart));
	request.query.clear();
	if (queryStart != std::string::npos)
		request.query = parseQueryString(target.substr(queryStart+1));

	// Headers
	request.headers.clear();
	std::size_t pos = lineEnd+2;
	while (pos < headerEnd)
	{
		std::size_t end = buffer.find("\r\n", pos);
		std::string line = buffer.substr(pos, end-pos);
		pos = end+2;
		std::size_t colon = line.find(':');
		if (colon == std::string::npos || colon == 0)
			return HTTP_PARSE_INVALID;
		request.headers[toLower(trimString(line.substr(0, colon)))] = trimString(line.substr(colon+1));
	}

	// Body
	std::size_t contentLength = 0;
	std::string lengthHeader = request.header("content-length");
	if (!lengthHeader.empty())
	{
		// strtoull would accept signs and whitespace
		if (!std::all_of(lengthHeader.begin(), lengthHeader.end(), [](char c) { return c >= '0' && c <= '9'; }))
			return HTTP_PARSE_INVALID;
		errno = 0;
		unsigned long long length = std::strtoull(lengthHeader.c_str(), nullptr, 10);
		if (errno == ERANGE || length > maxSize)
			return HTTP_PARSE_TOO_LARGE;
		contentLength = length;
	}
	else if (!request.header("transfer-encoding").empty())
		return HTTP_PARSE_INVALID; // Chunked bodies are not supported
	std::size_t bodyStart = headerEnd+4;
	if (bodyStart > maxSize || contentLength > maxSize - bodyStart)
		return HTTP_PARSE_TOO_LARGE;
	if (buffer.size() < bodyStart + contentLength)
		return HTTP_PARSE_INCOMPLETE;
	request.body = buffer.substr(bodyStart, contentLength);
	return HTTP_PARSE_COMPLETE;
}

const char* getHttpStatusText(int status)
{
	switch (status)
	{
		case 200: return "OK";
		case 204: return "No Content";
		case 400: return "Bad Request";
		case 404: return "Not Found";
		case 405: return "Method Not Allowed";
		case 408: return "Request Timeout";
		case 413: return "Payload Too Large";
		case 422: return "Unprocessable Entity";
		case 500: return "Internal Server Error";
		case 503: return "Service Unavailable";
		default: return "Unknown";
	}
}

std::string serializeHttpResponse(const HttpResponse &response)
{
	std::string out = asprintf_s("HTTP/1.1 %d %s\r\n", response.status, getHttpStatusText(response.status));
	if (response.status != 204)
	{
		out += "Content-Type: " + response.contentType + "\r\n";
		out += asprintf_s("Content-Length: %zu\r\n", response.body.size());
	}
	for (auto &header : response.headers)
		out += header.first + ": " + header.second + "\r\n";
	out += "Connection: close\r\n\r\n";
	if (response.status != 204)
		out += response.body;
	return out;
}

int HttpServerOpen(const std::string &host, int port)
{
	struct addrinfo hints = {};
	hints.ai_family = AF_UNSPEC;
	hints.ai_socktype = SOCK_STREAM;
	hints.ai_protocol = IPPROTO_TCP;
	hints.ai_flags = AI_PASSIVE;

	struct addrinfo *server_addr;
	std::string portStr = std::to_string(port);
	int status = getaddrinfo(host.empty()? NULL : host.c_str(), portStr.c_str(), &hints, &server_addr);
	if (status != 0)
	{
		LOG(LServer, LError, "Failed to get addr info for %s:%d: %s", host.c_str(), port, gai_strerror(status));
		if (status == EAI_SYSTEM)
			LOG(LServer, LError, "System error: %s (%d)", strerror(errno), errno);
		return -1;
	}
	if (server_addr->ai_next != NULL)
	{
		LOG(LServer, LDebug, "Got more options than just one, using the first");
	}

	int sock = socket(server_addr->ai_family, server_addr->ai_socktype, server_addr->ai_protocol);
	if (sock < 0)
	{
		LOG(LServer, LError, "Failed to create socket: %s (%d)", strerror(errno), errno);
		freeaddrinfo(server_addr);
		return -1;
	}

	int opt = 1;
	status = setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, (char*)&opt, sizeof(opt));
	if (status != 0)
	{
		LOG(LServer, LError, "Failed to set SO_REUSEADDR socket option: %s (%d)", strerror(errno), errno);
		freeaddrinfo(server_addr);
		close(sock);
		return -1;
	}

	status = bind(sock, server_addr->ai_addr, server_addr->ai_addrlen);
	if (status != 0)
	{
		LOG(LServer, LError, "Failed to bind socket to %s:%d: %s (%d)", host.c_str(), port, strerror(errno), errno);
		freeaddrinfo(server_addr);
		close(sock);
		return -1;
	}
	freeaddrinfo(server_addr);

	status = listen(sock, 10);
	if (status < 0)
	{
		LOG(LServer, LError, "Failed to listen on socket: %s (%d)", strerror(errno), errno);
		close(sock);
		return -1;
	}

	int flags = fcntl(sock, F_GETFL, 0);
	fcntl(sock, F_SETFL, flags | O_NONBLOCK);
	return sock;
}

static bool sendAll(int socket, const std::string &data)
{
	std::size_t sent = 0;
	while (sent < data.size())
	{
		ssize_t ret = send(socket, data.data()+sent, data.size()-sent, MSG_NOSIGNAL);
		if (ret < 0)
		{
			if (errno == EINTR) continue;
			if (errno == EAGAIN || errno == EWOULDBLOCK)
			{
				struct pollfd pfd = { socket, POLLOUT, 0 };
				if (poll(&pfd, 1, 1000) <= 0) return false;
				continue;
			}
			LOG(LServer, LWarn, "Socket error on send: %s (%d)", strerror(errno), errno);
			return false;
		}
		sent += ret;
	}
	return true;
}

static HttpResponse errorResponse(int status, const char *detail)
{
	HttpResponse response;
	response.status = status;
	response.body = asprintf_s("{\"detail\":\"%s\"}", detail);
	return response;
}

static void handleConnection(HttpServerState &server, int socket, const std::string &client)
{
	std::string buffer;
	HttpRequest request;
	HttpParseStatus status = HTTP_PARSE_INCOMPLETE;
	TimePoint_t start = sclock::now();
	char chunk[4096];
	while (status == HTTP_PARSE_INCOMPLETE)
	{
		long remaining = server.receiveTimeoutMS - dtMS(start, sclock::now());
		if (remaining <= 0) break;
		struct pollfd pfd = { socket, POLLIN, 0 };
		int ready = poll(&pfd, 1, (int)remaining);
		if (ready < 0 && errno == EINTR) continue;
		if (ready <= 0) break;
		ssize_t num = recv(socket, chunk, sizeof(chunk), 0);
		if (num < 0)
		{
			if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
			LOG(LServer, LDebug, "Socket error on read from %s: %s (%d)", client.c_str(), strerror(errno), errno);
			return;
		}
		if (num == 0)
		{
			LOG(LServer, LDebug, "Client %s closed connection before sending a full request", client.c_str());
			return;
		}
		buffer.append(chunk, num);
		status = parseHttpRequest(buffer, server.maxRequestSize, request);
	}

	HttpResponse response;
	if (status == HTTP_PARSE_COMPLETE)
	{
		LOG(LServer, LDebug, "%s %s from %s", request.method.c_str(), request.path.c_str(), client.c_str());
		try
		{
			response = server.handler(request);
		}
		catch (std::exception &e)
		{ // E.g. json::type_error when a field from the system is not valid UTF-8
			LOG(LServer, LError, "Failed to handle %s %s: %s", request.method.c_str(), request.path.c_str(), e.what());
			response = errorResponse(500, "Internal Server Error");
		}
		LOG(LServer, LTrace, "Responding %d with %d bytes", response.status, (int)response.body.size());
	}
	else if (status == HTTP_PARSE_TOO_LARGE)
		response = errorResponse(413, "Request too large");
	else if (status == HTTP_PARSE_INVALID)
		response = errorResponse(400, "Malformed request");
	else
		response = errorResponse(408, "Request timed out");
	sendAll(socket, serializeHttpResponse(response));
}

static std::string getAddrString(const struct sockaddr_storage *addr)
{
	char host[INET6_ADDRSTRLEN] = {};
	if (addr->ss_family == AF_INET)
		inet_ntop(AF_INET, &((const struct sockaddr_in*)addr)->sin_addr, host, sizeof(host));
	else if (addr->ss_family == AF_INET6)
		inet_ntop(AF_INET6, &((const struct sockaddr_in6*)addr)->sin6_addr, host, sizeof(host));
	return host;
}

void HttpServerThread(std::stop_token stop_token, HttpServerState *serverState)
{
	HttpServerState &server = *serverState;
	if (server.socket < 0)
		return;

	LOG(LServer, LInfo, "Serving control API on %s:%d", server.host.c_str(), server.port);
	while (!stop_token.stop_requested())
	{
		struct pollfd pfd = { server.socket, POLLIN, 0 };
		int ready = poll(&pfd, 1, SERVER_ACCEPT_INTERVAL_MS);
		if (ready <= 0) continue;

		struct sockaddr_storage client_addr;
		socklen_t addr_size = sizeof(client_addr);
		int socket = accept(server.socket, (struct sockaddr *)&client_addr, &addr_size);
		if (socket < 0)
		{
			if (!(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
				LOG(LServer, LDebug, "Failed to accept connection: %s (%d)", strerror(errno), errno);
			continue;
		}
		int flags = fcntl(socket, F_GETFL, 0);
		fcntl(socket, F_SETFL, flags | O_NONBLOCK);

		handleConnection(server, socket, getAddrString(&client_addr));
		shutdown(socket, SHUT_RDWR);
		close(socket);
	}
	LOG(LServer, LDebug, "Server thread closing...");
}

void HttpServerClose(HttpServerState &server)
{
	if (server.thread)
	{
		server.thread->request_stop();
		delete server.thread; // jthread joins
		server.thread = nullptr;
	}
	if (server.socket >= 0)
		close(server.socket);
	server.socket = -1;
}
