#include <gtest/gtest.h>

#include "logging.h"
#include "util/system.h"

#include <fstream>
#include <sstream>

static std::string ReadDebugLog()
{
    std::ifstream logFile(GetDebugLogPath().string());
    std::stringstream buffer;
    buffer << logFile.rdbuf();
    return buffer.str();
}

TEST(LoggingTest, ConfigFilter) {
    auto saved = mapMultiArgs;

    mapMultiArgs.erase("-debug");
    EXPECT_EQ(LogConfigFilter(), "error,main=info");

    mapMultiArgs["-debug"] = {"signtx", "sighash"};
    EXPECT_EQ(LogConfigFilter(), "error,main=info,sighash=debug,signtx=debug");

    mapMultiArgs["-debug"] = {"1"};
    EXPECT_EQ(LogConfigFilter(), "debug");

    mapMultiArgs = saved;
}

TEST(LoggingTest, AcceptLevel) {
    // Everything but debug lines is always kept.
    EXPECT_TRUE(LogAcceptLevel("info", "main"));
    EXPECT_TRUE(LogAcceptLevel("error", "signtx"));
    // The test binary runs with -debug=1.
    EXPECT_TRUE(LogAcceptLevel("debug", "signtx"));
}

TEST(LoggingTest, WritesToDebugLog) {
    LogPrintf("hello %s %d\n", "log", 42);
    LogPrint("signtx", "category line\n");
    EXPECT_FALSE(LogError("sighash", "failure %u", 7u));

    std::string strLog = ReadDebugLog();
    EXPECT_NE(strLog.find("[info] main: hello log 42\n"), std::string::npos);
    EXPECT_NE(strLog.find("[debug] signtx: category line\n"), std::string::npos);
    EXPECT_NE(strLog.find("[error] sighash: failure 7\n"), std::string::npos);
}
