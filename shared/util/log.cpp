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

#include "log.hpp"

#include <cstdarg>
#include <ctime>
#include <mutex>
#include <fstream>
#include <filesystem>

/* Logging implementation */

LogLevel LogFilterTable[LMaxCategory] = {};
thread_local LogCategory CurrentLogCategory = LDefault;

const char* LogCategoryIdentifiers[LMaxCategory];
const char* LogCategoryDescriptions[LMaxCategory];
const char* LogLevelIdentifiers[LMaxLevel];

static std::mutex logAccess;
static std::ofstream logFile;
static bool logStringsInitialised = false;

static void initialise_logging_strings()
{
	const char* defaultCategoryName = "!CAT";
	const char* defaultCategoryDesc = "!Missing Category Description";
	for (int i = 0; i < LMaxCategory; i++)
	{
		LogCategoryIdentifiers[i] = defaultCategoryName;
		LogCategoryDescriptions[i] = defaultCategoryDesc;
	}

	LogCategoryIdentifiers[LDefault] 		= "Std ";
	LogCategoryIdentifiers[LCommand] 		= "Cmd ";
	LogCategoryIdentifiers[LInterface] 		= "Ifc ";
	LogCategoryIdentifiers[LScan] 			= "Scan";
	LogCategoryIdentifiers[LMode] 			= "Mode";
	LogCategoryIdentifiers[LHelper] 		= "DHCP";
	LogCategoryIdentifiers[LWorkflow] 		= "Flow";
	LogCategoryIdentifiers[LState] 			= "Stat";
	LogCategoryIdentifiers[LConfig] 		= "Cfg ";
	LogCategoryIdentifiers[LServer] 		= "Serv";

	LogCategoryDescriptions[LDefault] 		= "Default";
	LogCategoryDescriptions[LCommand] 		= "OS Commands";
	LogCategoryDescriptions[LInterface] 	= "Interface Resolution";
	LogCategoryDescriptions[LScan] 			= "Network Scans";
	LogCategoryDescriptions[LMode] 			= "Mode Transitions";
	LogCategoryDescriptions[LHelper] 		= "DHCP/DNS Helper";
	LogCategoryDescriptions[LWorkflow] 		= "Connectivity Workflow";
	LogCategoryDescriptions[LState] 		= "State Persistence";
	LogCategoryDescriptions[LConfig] 		= "Configuration";
	LogCategoryDescriptions[LServer] 		= "Control API";

	LogLevelIdentifiers[LTrace]  = "TRACE";
	LogLevelIdentifiers[LDebug]  = "DEBUG";
	LogLevelIdentifiers[LDarn]   = "DWARN";
	LogLevelIdentifiers[LInfo]   = "INFO ";
	LogLevelIdentifiers[LWarn]   = "WARN ";
	LogLevelIdentifiers[LError]  = "ERROR";
	LogLevelIdentifiers[LOutput] = "OUT  ";

	logStringsInitialised = true;
}

void InitLogging(LogLevel level, const std::string &path)
{
	std::unique_lock lock(logAccess);
	initialise_logging_strings();
	for (int i = 0; i < LMaxCategory; i++)
		LogFilterTable[i] = level;

	if (path.empty()) return;
	// Basic log file rotation
	std::filesystem::path logPath(path), logDir = logPath.parent_path();
	std::string stem = logPath.stem().string(), ext = logPath.extension().string();
	std::filesystem::path log1 = logDir / (stem + "_1" + ext), log2 = logDir / (stem + "_2" + ext);
	std::error_code ec;
	if (std::filesystem::exists(log1, ec))
		std::filesystem::rename(log1, log2, ec);
	if (std::filesystem::exists(logPath, ec))
		std::filesystem::rename(logPath, log1, ec);
	if (!logDir.empty())
		std::filesystem::create_directories(logDir, ec);
	logFile.open(logPath);
	if (!logFile.is_open())
		printf("Failed to open log file '%s', logging to stdout only!\n", path.c_str());
}

void SetLogLevel(LogLevel level)
{
	for (int i = 0; i < LMaxCategory; i++)
		LogFilterTable[i] = level;
}

bool ParseLogLevel(const std::string &name, LogLevel &level)
{
	if (name == "trace") level = LTrace;
	else if (name == "debug") level = LDebug;
	else if (name == "info") level = LInfo;
	else if (name == "warn" || name == "warning") level = LWarn;
	else if (name == "error" || name == "critical") level = LError;
	else return false;
	return true;
}

void FlushLog()
{
	std::unique_lock lock(logAccess);
	fflush(stdout);
	if (logFile.is_open())
		logFile << std::flush;
}

int PrintLog(LogCategory category, LogLevel level, const char *format, ...)
{
	std::string log;
	va_list argp;
	va_start(argp, format);
	int size = std::vsnprintf(nullptr, 0, format, argp);
	va_end(argp);
	if (size < 0) return -1;
	log.resize(size);
	va_start(argp, format);
	std::vsnprintf(log.data(), size+1, format, argp);
	va_end(argp);
	// Messages are written line-by-line, trailing newlines are optional
	while (!log.empty() && log.back() == '\n')
		log.pop_back();

	char timeStr[32];
	std::time_t now = std::time(nullptr);
	std::tm tm = {};
	localtime_r(&now, &tm);
	std::strftime(timeStr, sizeof(timeStr), "%Y-%m-%d %H:%M:%S", &tm);

	std::unique_lock lock(logAccess);
	if (!logStringsInitialised)
		initialise_logging_strings();
	printf("%s %s %s : %s\n", timeStr, LogCategoryIdentifiers[category], LogLevelIdentifiers[level], log.c_str());
	if (logFile.is_open())
		logFile << timeStr << " " << LogCategoryIdentifiers[category] << " " << LogLevelIdentifiers[level] << " : " << log << "\n";
	return size;
}
