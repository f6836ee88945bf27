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

#ifndef DHCP_HELPER_H
#define DHCP_HELPER_H

#include "util/error.hpp"

#include <string>
#include <vector>
#include <sys/types.h>

struct DhcpHelperConfig
{
	std::string interface;
	std::string gateway;
	std::string dhcpRange;
	bool isolated = false; // No default route and no DNS offered (WiFi Direct)
};

/**
 * Singleton DHCP/DNS helper process bound to access point mode
 * Starting implicitly stops any prior instance, stopping is idempotent
 */
class DhcpHelper
{
public:
	virtual ~DhcpHelper() = default;

	[[nodiscard]] virtual std::optional<ErrorMessage> start(const DhcpHelperConfig &config) = 0;
	virtual bool stop() = 0;
	virtual bool running() = 0;
	// Terminate a helper left behind by a previous run of the service
	virtual bool stopOrphaned() = 0;
};

struct DnsmasqOptions
{
	std::string binary = "dnsmasq";
	std::string logFile = "/var/log/dnsmasq.log";
	std::string pidFile;
	int settleMS = 1000;
	int graceMS = 5000;
};

class DnsmasqHelper : public DhcpHelper
{
public:
	DnsmasqHelper(DnsmasqOptions options) : options(std::move(options)) {}
	~DnsmasqHelper();

	HANDLE_ERROR start(const DhcpHelperConfig &config) override;
	bool stop() override;
	bool running() override;
	bool stopOrphaned() override;

	// Leave the helper running past this process, a later stopOrphaned finds it by its pid file
	// The pid file is kept until the next start
	void release();

	std::vector<std::string> buildArguments(const DhcpHelperConfig &config) const;

private:
	DnsmasqOptions options;
	pid_t pid = -1;
	int errFD = -1;
	bool released = false;

	bool reap(bool block);
	std::string readStderr();
	void writePidFile();
	void removePidFile();
};

/**
 * Terminates a process with SIGTERM, escalating to SIGKILL after graceMS
 * Returns false if the process could not be signalled
 */
bool terminateProcess(pid_t pid, int graceMS, bool isChild);

#endif // DHCP_HELPER_H
