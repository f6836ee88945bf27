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

#include "dhcp_helper.hpp"

#include "system/command.hpp" // formatCommandLine

#include "util/util.hpp"
#include "util/log.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <filesystem>

static bool processAlive(pid_t pid)
{
	if (pid <= 0) return false;
	if (kill(pid, 0) != 0 && errno != EPERM) return false;
	// Zombies still accept signals but have already exited
	std::string stat;
	std::getline(std::ifstream(asprintf_s("/proc/%d/stat", (int)pid)), stat);
	std::size_t end = stat.rfind(')');
	if (end != std::string::npos && end+2 < stat.size() && stat[end+2] == 'Z')
		return false;
	return true;
}

bool terminateProcess(pid_t pid, int graceMS, bool isChild)
{
	if (pid <= 0) return true;
	if (kill(pid, SIGTERM) != 0)
		return errno == ESRCH;

	// Wait for graceful shutdown
	TimePoint_t start = sclock::now();
	while (dtMS(start, sclock::now()) < graceMS)
	{
		if (isChild)
		{
			int status;
			if (waitpid(pid, &status, WNOHANG) != 0)
				return true;
		}
		else if (!processAlive(pid))
			return true;
		sleepMS(20);
	}

	LOG(LHelper, LWarn, "Process %d did not stop gracefully, forcing kill", (int)pid);
	if (kill(pid, SIGKILL) != 0 && errno != ESRCH)
		return false;
	if (isChild)
	{
		int status;
		waitpid(pid, &status, 0);
	}
	return true;
}

DnsmasqHelper::~DnsmasqHelper()
{
	stop();
}

std::vector<std::string> DnsmasqHelper::buildArguments(const DhcpHelperConfig &config) const
{
	std::vector<std::string> args = {
		options.binary,
		"--address=/#/" + config.gateway,
		"--interface=" + config.interface,
		"--keep-in-foreground",
		"--dhcp-range=" + config.dhcpRange,
		"--bind-interfaces",
		"--except-interface=lo",
		"--no-hosts",
		"--log-queries",
		"--log-dhcp",
		"--log-facility=" + options.logFile
	};
	if (config.isolated)
	{ // Empty router option, clients keep their default route elsewhere
		args.push_back("--dhcp-option=3");
	}
	else
	{
		args.push_back("--dhcp-option=option:router," + config.gateway);
		args.push_back("--dhcp-option=option:dns-server," + config.gateway);
	}
	return args;
}

std::optional<ErrorMessage> DnsmasqHelper::start(const DhcpHelperConfig &config)
{
	if (running())
	{
		LOG(LHelper, LInfo, "Stopping previous DHCP helper before restart");
		stop();
	}

	std::vector<std::string> args = buildArguments(config);
	LOG(LHelper, LInfo, "Starting DHCP helper: %s", formatCommandLine(args).c_str());

	int errPipe[2];
	if (pipe2(errPipe, O_CLOEXEC) != 0)
		return ErrorMessage(asprintf_s("Failed to create pipe for DHCP helper: %s", strerror(errno)), ERROR_COMMAND_FAILED);

	std::vector<char*> argv;
	for (auto &arg : args)
		argv.push_back(arg.data());
	argv.push_back(nullptr);

	pid_t child = fork();
	if (child < 0)
	{
		close(errPipe[0]);
		close(errPipe[1]);
		return ErrorMessage(asprintf_s("Failed to fork DHCP helper: %s", strerror(errno)), ERROR_COMMAND_FAILED);
	}
	if (child == 0)
	{
		int devNull = open("/dev/null", O_RDWR);
		if (devNull >= 0)
		{
			dup2(devNull, STDIN_FILENO);
			dup2(devNull, STDOUT_FILENO);
		}
		dup2(errPipe[1], STDERR_FILENO);
		setpgid(0, 0); // Keep terminal signals to the service from reaching the helper
		execvp(argv[0], argv.data());
		_exit(127);
	}

	close(errPipe[1]);
	fcntl(errPipe[0], F_SETFL, fcntl(errPipe[0], F_GETFL, 0) | O_NONBLOCK);
	pid = child;
	errFD = errPipe[0];

	// Give it a moment to start
	sleepMS(options.settleMS);

	if (!running())
	{
		std::string diag = readStderr();
		if (errFD >= 0) close(errFD);
		errFD = -1;
		LOG(LHelper, LError, "DHCP helper failed to start: %s", diag.c_str());
		return ErrorMessage(asprintf_s("DHCP helper failed to start: %s", diag.empty()? "exited immediately" : diag.c_str()), ERROR_COMMAND_FAILED);
	}
	released = false;
	writePidFile();
	LOG(LHelper, LInfo, "DHCP helper started with pid %d", (int)pid);
	return std::nullopt;
}

bool DnsmasqHelper::reap(bool block)
{
	if (pid <= 0) return true;
	int status;
	pid_t ret = waitpid(pid, &status, block? 0 : WNOHANG);
	if (ret == 0) return false;
	pid = -1;
	return true;
}

bool DnsmasqHelper::running()
{
	if (pid <= 0) return false;
	return !reap(false);
}

std::string DnsmasqHelper::readStderr()
{
	std::string diag;
	if (errFD < 0) return diag;
	char buffer[1024];
	ssize_t rd;
	while ((rd = read(errFD, buffer, sizeof(buffer))) > 0)
		diag.append(buffer, rd);
	return trimString(diag);
}

bool DnsmasqHelper::stop()
{
	if (!running())
	{
		LOG(LHelper, LDebug, "DHCP helper is not running");
		if (errFD >= 0) close(errFD);
		errFD = -1;
		pid = -1;
		if (!released)
			removePidFile();
		return true;
	}
	LOG(LHelper, LInfo, "Stopping DHCP helper (pid %d)...", (int)pid);
	bool stopped = terminateProcess(pid, options.graceMS, true);
	if (stopped)
		pid = -1;
	else
		LOG(LHelper, LError, "Failed to stop DHCP helper: %s", strerror(errno));
	if (errFD >= 0) close(errFD);
	errFD = -1;
	removePidFile();
	return stopped;
}

bool DnsmasqHelper::stopOrphaned()
{
	if (options.pidFile.empty()) return true;
	std::ifstream fs(options.pidFile);
	if (!fs.is_open()) return true;
	int orphan = -1;
	fs >> orphan;
	fs.close();
	removePidFile();
	if (orphan <= 0 || orphan == pid || !processAlive(orphan))
		return true;

	// Only kill if the pid still belongs to the helper binary, pids get reused
	std::string comm;
	std::ifstream(asprintf_s("/proc/%d/comm", orphan)) >> comm;
	std::string binaryName = std::filesystem::path(options.binary).filename().string();
	if (comm.empty() || binaryName.compare(0, comm.size(), comm) != 0)
	{
		LOG(LHelper, LDebug, "Recorded pid %d belongs to '%s', not touching it", orphan, comm.c_str());
		return true;
	}
	LOG(LHelper, LInfo, "Stopping orphaned DHCP helper (pid %d) from previous run", orphan);
	return terminateProcess(orphan, options.graceMS, false);
}

void DnsmasqHelper::release()
{
	if (pid > 0)
		LOG(LHelper, LInfo, "Leaving DHCP helper (pid %d) running", (int)pid);
	if (errFD >= 0) close(errFD);
	errFD = -1;
	pid = -1;
	released = true;
}

void DnsmasqHelper::writePidFile()
{
	if (options.pidFile.empty()) return;
	std::error_code ec;
	std::filesystem::path path(options.pidFile);
	if (path.has_parent_path())
		std::filesystem::create_directories(path.parent_path(), ec);
	std::ofstream fs(options.pidFile);
	fs << (int)pid << "\n";
	if (fs.fail())
		LOG(LHelper, LWarn, "Failed to write DHCP helper pid file '%s'", options.pidFile.c_str());
}

void DnsmasqHelper::removePidFile()
{
	if (options.pidFile.empty()) return;
	std::error_code ec;
	std::filesystem::remove(options.pidFile, ec);
}
