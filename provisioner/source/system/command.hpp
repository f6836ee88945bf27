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

#ifndef COMMAND_H
#define COMMAND_H

#include "util/error.hpp"

#include <string>
#include <vector>
#include <optional>

/**
 * Blocking execution of OS commands with a bounded timeout
 * The only suspension point of the whole service, nothing else may block indefinitely
 */

struct CommandResult
{
	bool success = false;
	int exitStatus = -1;
	bool timedOut = false;
	std::string output; // stdout, trimmed
	std::string error; // stderr, trimmed

	// Diagnostic text for error reporting, stderr if available
	const std::string &diagnostic() const { return error.empty()? output : error; }
	// Typed error (ERROR_TIMEOUT or ERROR_COMMAND_FAILED) for a failed command
	ErrorMessage toError(const std::string &context) const;
};

std::string formatCommandLine(const std::vector<std::string> &args);

/**
 * An abstract command runner, implemented by the system runner and by scripted runners in tests
 */
class CommandRunner
{
public:
	virtual ~CommandRunner() = default;

	virtual CommandResult run(const std::vector<std::string> &args, int timeoutMS, const std::string *input = nullptr) = 0;
};

/**
 * Runs commands with fork/exec, no shell involved
 * Stdout and stderr are captured through pipes, the child is killed once the timeout passes
 */
class SystemCommandRunner : public CommandRunner
{
public:
	CommandResult run(const std::vector<std::string> &args, int timeoutMS, const std::string *input = nullptr) override;
};

#endif // COMMAND_H
