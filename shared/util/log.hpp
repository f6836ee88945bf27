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

#ifndef LOG_H
#define LOG_H

#include <cstdio>
#include <string>

enum LogLevel : char {
	LTrace,
	LDebug,
	LDarn, // Debug Warn
	LInfo,
	LWarn,
	LError,
	LOutput,
	LMaxLevel
};

enum LogCategory : char {
	LDefault,
	LCommand,
	LInterface,
	LScan,
	LMode,
	LHelper,
	LWorkflow,
	LState,
	LConfig,
	LServer,
	LMaxCategory
};

extern LogLevel LogFilterTable[LMaxCategory];
extern thread_local LogCategory CurrentLogCategory;

extern const char* LogCategoryIdentifiers[LMaxCategory];
extern const char* LogCategoryDescriptions[LMaxCategory];
extern const char* LogLevelIdentifiers[LMaxLevel];

int PrintLog(LogCategory category, LogLevel level, const char *format, ...)
#if defined(__GNUC__)
	__attribute__((format(printf, 3, 4)))
#endif
	;

/**
 * Initialise logging output
 * All categories are filtered at the given level
 * If logFile is not empty, log.txt style rotation is applied to it (file -> file_1 -> file_2)
 */
void InitLogging(LogLevel level, const std::string &logFile = "");

void SetLogLevel(LogLevel level);

bool ParseLogLevel(const std::string &name, LogLevel &level);

void FlushLog();

struct ScopedLogCategory
{
	LogCategory prevCategory;

	ScopedLogCategory(LogCategory category)
	{
		prevCategory = CurrentLogCategory;
		CurrentLogCategory = category;
	}

	~ScopedLogCategory()
	{
		CurrentLogCategory = prevCategory;
	}
};

#define LOG(CATEGORY, LEVEL, ...) do { if (LEVEL >= LogFilterTable[CATEGORY]) PrintLog(CATEGORY, LEVEL, __VA_ARGS__); } while (0)
#define LOGC(LEVEL, ...) LOG(CurrentLogCategory, LEVEL, __VA_ARGS__)

#endif // LOG_H
