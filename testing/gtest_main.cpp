#include "base/init.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    const char* log_level = std::getenv("MESHRTC_TEST_LOG_LEVEL");
    meshrtc::Init(meshrtc::ParseLoggingLevel(log_level ? log_level : "", meshrtc::LoggingLevel::WARNING));
    // Skips the suites compiled with ENABLE_UNIT_TESTS 0.
    std::string filter = testing::GTEST_FLAG(filter);
    if (filter.find('-') == std::string::npos) {
        testing::GTEST_FLAG(filter) = filter + ":-FILTERED_*";
    }
    return RUN_ALL_TESTS();
}
