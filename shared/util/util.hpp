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

#ifndef UTIL_H
#define UTIL_H

#include <chrono>
#include <string>
#include <vector>
#include <cstdarg>

/* Time */

typedef std::chrono::steady_clock sclock;
typedef std::chrono::time_point<sclock> TimePoint_t;

template<typename Rep = long>
static inline Rep dtMS(TimePoint_t t0, TimePoint_t t1)
{
	return std::chrono::duration_cast<std::chrono::duration<Rep, std::milli>>(t1 - t0).count();
}

template<typename Rep = long>
static inline Rep dtUS(TimePoint_t t0, TimePoint_t t1)
{
	return std::chrono::duration_cast<std::chrono::duration<Rep, std::micro>>(t1 - t0).count();
}

// Seconds since epoch, used where a value has to survive a restart (e.g. state file)
static inline double getWallTime()
{
	return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

// Sleeps that are configured as 0 are skipped entirely (tests)
void sleepMS(long milliseconds);

/* Strings */

std::string asprintf_s(const char *format, ...);

std::string trimString(const std::string &str);

std::string toLower(std::string str);

std::string joinStrings(const std::vector<std::string> &strings, const char *separator);

#endif // UTIL_H
