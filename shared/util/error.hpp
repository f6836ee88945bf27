/**
WiFi Provisioner Network Service
Copyright (C)  2025 Seneral <contact@seneral.dev> and contributors

MIT License

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef ERROR_H
#define ERROR_H

#include <string>
#include <optional>


/* Error Handling */

enum ErrorCode : int
{
	ERROR_GENERIC = -1,
	ERROR_HARDWARE_UNAVAILABLE = 1,	// No wireless interface, fatal until re-resolved
	ERROR_COMMAND_FAILED,			// OS subsystem returned non-zero, recoverable
	ERROR_TIMEOUT,					// Command or connection attempt exceeded its bound
	ERROR_VERIFICATION_MISMATCH,	// Post-connect check did not confirm the expected network
	ERROR_PERSISTENCE,				// State file could not be written, logged only
	ERROR_INVALID_ARGUMENT,
	ERROR_NOT_FOUND,
	ERROR_MODE_CONFLICT,			// Transition refused because another mode is active
};

struct [[nodiscard]] ErrorMessage
{
	std::string msg;
	int code;

	inline ErrorMessage(std::string &&msg) noexcept : msg(std::move(msg)), code(ERROR_GENERIC) {}
	inline ErrorMessage(const std::string &msg) : msg(msg), code(ERROR_GENERIC) {}
	inline ErrorMessage(const char *msg) noexcept : msg(msg), code(ERROR_GENERIC) {}
	inline ErrorMessage(std::string &&msg, int code) noexcept : msg(std::move(msg)), code(code) {}
	inline ErrorMessage(const std::string &msg, int code) : msg(msg), code(code) {}
	inline ErrorMessage(const char *msg, int code) noexcept : msg(msg), code(code) {}

	inline const std::string& str() const noexcept { return msg; }
	inline const char* c_str() const noexcept { return msg.c_str(); }
	inline bool is(ErrorCode kind) const noexcept { return code == kind; }
};

#define HANDLE_ERROR [[nodiscard]] std::optional<ErrorMessage>

const char* getErrorCodeName(int code);

#endif // ERROR_H
