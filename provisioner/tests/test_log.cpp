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

#include "util/log.hpp"

#include "gtest/gtest.h"

static const char* logBranch(bool active)
{
	if (active)
		LOG(LWorkflow, LWarn, "branch taken");
	else
		LOG(LWorkflow, LWarn, "branch skipped");
	return active? "taken" : "skipped";
}

TEST(Logging, MacroIsASingleStatement)
{
	SetLogLevel(LWarn);
	testing::internal::CaptureStdout();
	EXPECT_STREQ(logBranch(true), "taken");
	EXPECT_STREQ(logBranch(false), "skipped");
	FlushLog();
	std::string output = testing::internal::GetCapturedStdout();
	EXPECT_NE(output.find("branch taken"), std::string::npos);
	EXPECT_NE(output.find("branch skipped"), std::string::npos);
}

TEST(Logging, FiltersBelowCategoryLevel)
{
	SetLogLevel(LWarn);
	testing::internal::CaptureStdout();
	LOG(LScan, LInfo, "filtered %d", 1);
	LOG(LScan, LError, "printed %d", 2);
	{
		ScopedLogCategory scope(LMode);
		LOGC(LWarn, "scoped %s", "entry");
	}
	FlushLog();
	std::string output = testing::internal::GetCapturedStdout();
	EXPECT_EQ(output.find("filtered 1"), std::string::npos);
	EXPECT_NE(output.find("Scan ERROR : printed 2"), std::string::npos);
	EXPECT_NE(output.find("Mode WARN  : scoped entry"), std::string::npos);
}

TEST(Logging, ParsesLevelNames)
{
	LogLevel level = LInfo;
	EXPECT_TRUE(ParseLogLevel("debug", level));
	EXPECT_EQ(level, LDebug);
	EXPECT_TRUE(ParseLogLevel("warning", level));
	EXPECT_EQ(level, LWarn);
	EXPECT_FALSE(ParseLogLevel("verbose", level));
	EXPECT_EQ(level, LWarn);
}
