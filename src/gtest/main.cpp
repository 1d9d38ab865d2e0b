#include "gmock/gmock.h"

#include "crypto/common.h"
#include "fs.h"
#include "logging.h"
#include "util/system.h"

#include <fstream>
#include <iostream>

class LogGrabber : public ::testing::EmptyTestEventListener {
    fs::path logPath;

public:
    LogGrabber(fs::path logPathIn) : logPath(logPathIn) {}

    virtual void OnTestStart(const ::testing::TestInfo& test_info) {
        // Test logs are written synchronously, so we can clear the log file to
        // ensure that at the end of the test, the log lines are all related to
        // the test itself.
        std::ofstream logFile;
        logFile.open(logPath.string(), std::ofstream::out | std::ofstream::trunc);
        logFile.close();
    }

    virtual void OnTestEnd(const ::testing::TestInfo& test_info) {
        // If the test failed, print the test logs.
        auto result = test_info.result();
        if (result && result->Failed()) {
            std::cout << "\n--- Logs:";

            std::ifstream logFile;
            logFile.open(logPath.string(), std::ios::in | std::ios::ate);
            ASSERT_TRUE(logFile.is_open());
            logFile.seekg(0, logFile.beg);
            std::string line;
            while (logFile.good()) {
                std::getline(logFile, line);
                if (!line.empty()) {
                    std::cout << "\n  " << line;
                }
            }

            std::cout << "\n---" << std::endl;
        }
    }
};

int main(int argc, char **argv) {
    if (init_and_check_sodium() == -1) {
        std::cerr << "libsodium initialization failed" << std::endl;
        return 1;
    }

    // Log everything to a common test file.
    fs::path tmpPath = fs::temp_directory_path();
    fs::path tmpFilename = fs::unique_path("%%%%%%%%");
    fs::path logPath = tmpPath / tmpFilename;

    mapArgs["-debuglogfile"] = logPath.string();
    mapMultiArgs["-debug"].push_back("1");
    InitLogging();

    testing::InitGoogleMock(&argc, argv);

    // The "threadsafe" style is necessary for correct operation of death/exit
    // tests on macOS (https://github.com/zcash/zcash/issues/4802).
    testing::FLAGS_gtest_death_test_style = "threadsafe";

    ::testing::TestEventListeners& listeners =
        ::testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new LogGrabber(logPath));

    return RUN_ALL_TESTS();
}
