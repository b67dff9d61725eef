/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <engine/core/Logger.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

namespace Wayfarer {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for Wayfarer tests
 *
 * Logging stays silent unless WAYFARER_TEST_LOG names a level, in which
 * case console output is enabled at that level.
 */
class WayfarerTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== Wayfarer Test Suite Starting ===" << std::endl;
        SetupTestLogging();
    }

    void TearDown() override {
        std::cout << "=== Wayfarer Test Suite Complete ===" << std::endl;
        Logger::Shutdown();
    }

private:
    void SetupTestLogging() {
        const char* level = std::getenv("WAYFARER_TEST_LOG");
        if (level == nullptr) {
            // Loggers fall back to null sinks when never initialized
            return;
        }
        Logger::Initialize("", true);
        Logger::SetLevel(Logger::ParseLevel(level));
    }
};

// =============================================================================
// Test Event Listener for Enhanced Output
// =============================================================================

/**
 * @brief Prints one summary line per suite
 */
class WayfarerTestListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        if (test_info.result()->Failed()) {
            std::cout << "[  FAILED  ] " << test_info.test_suite_name() << "."
                      << test_info.name() << std::endl;
        }
    }

    void OnTestSuiteEnd(const ::testing::TestSuite& test_suite) override {
        std::cout << "Suite " << test_suite.name() << ": "
                  << test_suite.successful_test_count() << " passed, "
                  << test_suite.failed_test_count() << " failed" << std::endl;
    }
};

} // namespace Test
} // namespace Wayfarer

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new Wayfarer::Test::WayfarerTestEnvironment());

    if (std::getenv("WAYFARER_TEST_VERBOSE") != nullptr) {
        ::testing::UnitTest::GetInstance()->listeners().Append(new Wayfarer::Test::WayfarerTestListener());
    }

    return RUN_ALL_TESTS();
}
