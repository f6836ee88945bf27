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

#include "command.hpp"

#include "util/util.hpp"
#include "util/log.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>

ErrorMessage CommandResult::toError(const std::string &context) const
{
	if (timedOut)
		return ErrorMessage(asprintf_s("%s: command timed out", context.c_str()), ERROR_TIMEOUT);
	const std::string &diag = diagnostic();
	if (diag.empty())
		return ErrorMessage(asprintf_s("%s: command failed with status %d", context.c_str(), exitStatus), ERROR_COMMAND_FAILED);
	return ErrorMessage(asprintf_s("%s: %s", context.c_str(), diag.c_str()), ERROR_COMMAND_FAILED);
}

std::string formatCommandLine(const std::vector<std::string> &args)
{
	std::string line;
	for (const auto &arg : args)
	{
		if (!line.empty()) line.push_back(' ');
		if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos)
			line += "'" + arg + "'";
		else
			line += arg;
	}
	return line;
}

static void closePipe(int fds[2])
{
	if (fds[0] >= 0) close(fds[0]);
	if (fds[1] >= 0) close(fds[1]);
	fds[0] = fds[1] = -1;
}

CommandResult SystemCommandRunner::run(const std::vector<std::string> &args, int timeoutMS, const std::string *input)
{
	CommandResult result = {};
	if (args.empty())
	{
		result.error = "Empty command";
		return result;
	}
	LOG(LCommand, LDebug, "Running: %s", formatCommandLine(args).c_str());

	int outPipe[2] = { -1, -1 }, errPipe[2] = { -1, -1 }, inPipe[2] = { -1, -1 };
	if (pipe2(outPipe, O_CLOEXEC) != 0 || pipe2(errPipe, O_CLOEXEC) != 0 || (input && pipe2(inPipe, O_CLOEXEC) != 0))
	{
		result.error = asprintf_s("Failed to create pipes: %s", strerror(errno));
		closePipe(outPipe);
		closePipe(errPipe);
		closePipe(inPipe);
		LOG(LCommand, LError, "%s", result.error.c_str());
		return result;
	}

	std::vector<char*> argv;
	for (const auto &arg : args)
		argv.push_back(const_cast<char*>(arg.c_str()));
	argv.push_back(nullptr);

	pid_t pid = fork();
	if (pid < 0)
	{
		result.error = asprintf_s("Failed to fork: %s", strerror(errno));
		closePipe(outPipe);
		closePipe(errPipe);
		closePipe(inPipe);
		LOG(LCommand, LError, "%s", result.error.c_str());
		return result;
	}
	if (pid == 0)
	{ // Child: only async-signal-safe calls until exec
		dup2(outPipe[1], STDOUT_FILENO);
		dup2(errPipe[1], STDERR_FILENO);
		if (input)
			dup2(inPipe[0], STDIN_FILENO);
		else
		{
			int devNull = open("/dev/null", O_RDONLY);
			if (devNull >= 0) dup2(devNull, STDIN_FILENO);
		}
		execvp(argv[0], argv.data());
		const char *msg = "exec failed\n";
		ssize_t ignored = write(STDERR_FILENO, msg, strlen(msg));
		(void)ignored;
		_exit(127);
	}

	close(outPipe[1]);
	close(errPipe[1]);
	if (input)
	{
		close(inPipe[0]);
		// Input is small (config snippets), write fully then signal EOF
		const char *data = input->data();
		std::size_t remaining = input->size();
		while (remaining > 0)
		{
			ssize_t wr = write(inPipe[1], data, remaining);
			if (wr < 0 && errno == EINTR) continue;
			if (wr <= 0) break;
			data += wr;
			remaining -= wr;
		}
		close(inPipe[1]);
	}

	TimePoint_t deadline = sclock::now() + std::chrono::milliseconds(timeoutMS);
	struct pollfd fds[2] = {
		{ .fd = outPipe[0], .events = POLLIN, .revents = 0 },
		{ .fd = errPipe[0], .events = POLLIN, .revents = 0 }
	};
	std::string *targets[2] = { &result.output, &result.error };
	int openStreams = 2;
	char buffer[4096];
	while (openStreams > 0)
	{
		long remainingMS = dtMS(sclock::now(), deadline);
		if (remainingMS <= 0)
		{
			result.timedOut = true;
			break;
		}
		int status = poll(fds, 2, (int)remainingMS);
		if (status < 0)
		{
			if (errno == EINTR) continue;
			LOG(LCommand, LError, "Failed to poll command output: %s", strerror(errno));
			break;
		}
		for (int i = 0; i < 2; i++)
		{
			if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
				continue;
			ssize_t rd = read(fds[i].fd, buffer, sizeof(buffer));
			if (rd > 0)
				targets[i]->append(buffer, rd);
			else if (rd == 0 || errno != EINTR)
			{
				close(fds[i].fd);
				fds[i].fd = -1;
				openStreams--;
			}
		}
	}
	for (int i = 0; i < 2; i++)
		if (fds[i].fd >= 0) close(fds[i].fd);

	int status = 0;
	if (result.timedOut)
	{
		kill(pid, SIGKILL);
		waitpid(pid, &status, 0);
		result.success = false;
		result.exitStatus = -1;
		LOG(LCommand, LError, "Command timed out after %dms: %s", timeoutMS, formatCommandLine(args).c_str());
	}
	else
	{
		// Streams closed, child is exiting. Still bounded by the deadline
		pid_t done = 0;
		while ((done = waitpid(pid, &status, WNOHANG)) == 0 && sclock::now() < deadline)
			sleepMS(5);
		if (done == 0)
		{
			kill(pid, SIGKILL);
			waitpid(pid, &status, 0);
			result.timedOut = true;
			result.exitStatus = -1;
		}
		else if (done > 0 && WIFEXITED(status))
			result.exitStatus = WEXITSTATUS(status);
		else
			result.exitStatus = -1;
		result.success = !result.timedOut && result.exitStatus == 0;
	}

	result.output = trimString(result.output);
	result.error = trimString(result.error);
	if (!result.success && !result.timedOut)
	{
		LOG(LCommand, LError, "Command failed (%d): %s", result.exitStatus, formatCommandLine(args).c_str());
		if (!result.error.empty())
			LOG(LCommand, LError, "Error: %s", result.error.c_str());
	}
	return result;
}
