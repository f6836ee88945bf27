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

#include "util.hpp"
#include "error.hpp"

#include <cstdio>
#include <algorithm>
#include <cctype>
#include <thread>

void sleepMS(long milliseconds)
{
	if (milliseconds <= 0) return;
	std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
}

std::string asprintf_s(const char *format, ...)
{
	std::string str;
	va_list argp;
	va_start(argp, format);
	int size = std::vsnprintf(nullptr, 0, format, argp);
	va_end(argp);
	if (size <= 0) return str;
	str.resize(size);
	va_start(argp, format);
	std::vsnprintf(str.data(), size+1, format, argp);
	va_end(argp);
	return str;
}

std::string trimString(const std::string &str)
{
	const char *whitespace = " \t\r\n";
	std::size_t begin = str.find_first_not_of(whitespace);
	if (begin == std::string::npos) return "";
	std::size_t end = str.find_last_not_of(whitespace);
	return str.substr(begin, end-begin+1);
}

std::string toLower(std::string str)
{
	std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c){ return std::tolower(c); });
	return str;
}

std::string joinStrings(const std::vector<std::string> &strings, const char *separator)
{
	std::string joined;
	for (std::size_t i = 0; i < strings.size(); i++)
	{
		if (i > 0) joined += separator;
		joined += strings[i];
	}
	return joined;
}

const char* getErrorCodeName(int code)
{
	switch (code)
	{
		case ERROR_HARDWARE_UNAVAILABLE: return "HardwareUnavailable";
		case ERROR_COMMAND_FAILED: return "CommandFailed";
		case ERROR_TIMEOUT: return "Timeout";
		case ERROR_VERIFICATION_MISMATCH: return "VerificationMismatch";
		case ERROR_PERSISTENCE: return "StatePersistenceFailure";
		case ERROR_INVALID_ARGUMENT: return "InvalidArgument";
		case ERROR_NOT_FOUND: return "NotFound";
		case ERROR_MODE_CONFLICT: return "ModeConflict";
		default: return "Error";
	}
}
