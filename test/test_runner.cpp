// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point for every unit and integration test of TokenVault.
// Console logging is switched off so test output stays readable; set
// TOKENVAULT_TEST_LOG=1 to keep it.

#include <cstdlib>
#include <gtest/gtest.h>
#include <string>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    const char* keepLog = std::getenv("TOKENVAULT_TEST_LOG");
    if (keepLog == nullptr || std::string(keepLog) != "1") {
        tokenvault::util::logger::setConsoleOutput(false);
    }
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
