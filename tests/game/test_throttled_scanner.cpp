/**
 * @file test_throttled_scanner.cpp
 * @brief Unit tests for the distance/time gated hostile scanner
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "combat/ThrottledScanner.hpp"

#include "mocks/MockPorts.hpp"
#include "utils/TestHelpers.hpp"

#include <limits>

using namespace Wayfarer;
using namespace Wayfarer::Bot;
using namespace Wayfarer::Test;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class ThrottledScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sensing.UseFakeWorld();
        settings.aggroRange = 1000.0;
        settings.moveThreshold = 750.0;
        settings.interval = std::chrono::milliseconds(500);
    }

    ManualClock clock;
    NiceMock<MockSensingPort> sensing;
    ScannerSettings settings;
};

// =============================================================================
// Settings Tests
// =============================================================================

TEST(ScannerSettingsTest, ForAggroRange) {
    const ScannerSettings settings = ScannerSettings::ForAggroRange(2000.0);

    EXPECT_DOUBLE_EQ(2000.0, settings.aggroRange);
    EXPECT_DOUBLE_EQ(1500.0, settings.moveThreshold);
    EXPECT_EQ(Time::Duration(std::chrono::milliseconds(500)), settings.interval);
}

// =============================================================================
// Gate Tests
// =============================================================================

TEST_F(ThrottledScannerTest, FirstScanAlwaysFires) {
    ThrottledScanner scanner(sensing, settings);
    EXPECT_CALL(sensing, NearbyHostiles(_, 1000.0)).Times(1);

    scanner.Scan(clock.Now(), Point(0, 0));

    EXPECT_TRUE(scanner.HasFired());
    EXPECT_EQ(1u, scanner.GetQueryCount());
}

TEST_F(ThrottledScannerTest, CachedWithinIntervalAndDistance) {
    ThrottledScanner scanner(sensing, settings);
    scanner.Scan(clock.Now(), Point(0, 0));

    sensing.hostiles.push_back({7, Point(100, 0), true});
    const ScanResult& result = scanner.Scan(clock.AdvanceMs(100), Point(100, 0));

    EXPECT_EQ(1u, scanner.GetQueryCount());
    EXPECT_FALSE(result.HasTarget());
}

TEST_F(ThrottledScannerTest, FiresAfterInterval) {
    ThrottledScanner scanner(sensing, settings);
    scanner.Scan(clock.Now(), Point(0, 0));

    scanner.Scan(clock.AdvanceMs(499), Point(0, 0));
    EXPECT_EQ(1u, scanner.GetQueryCount());

    scanner.Scan(clock.AdvanceMs(1), Point(0, 0));
    EXPECT_EQ(2u, scanner.GetQueryCount());
}

TEST_F(ThrottledScannerTest, FiresAfterMovingThreshold) {
    ThrottledScanner scanner(sensing, settings);
    scanner.Scan(clock.Now(), Point(0, 0));

    scanner.Scan(clock.AdvanceMs(10), Point(749, 0));
    EXPECT_EQ(1u, scanner.GetQueryCount());

    scanner.Scan(clock.AdvanceMs(10), Point(750, 0));
    EXPECT_EQ(2u, scanner.GetQueryCount());
    EXPECT_POINT_EQ(Point(750, 0), scanner.GetLastResult().origin);
}

TEST_F(ThrottledScannerTest, InvalidateForcesNextScan) {
    ThrottledScanner scanner(sensing, settings);
    scanner.Scan(clock.Now(), Point(0, 0));

    scanner.Invalidate();
    scanner.Scan(clock.AdvanceMs(1), Point(0, 0));

    EXPECT_EQ(2u, scanner.GetQueryCount());
}

// =============================================================================
// Target Selection Tests
// =============================================================================

TEST_F(ThrottledScannerTest, PicksNearestLiveHostileInRange) {
    sensing.hostiles = {
        {1, Point(900, 0), true},
        {2, Point(300, 0), false},     // Dead
        {3, Point(500, 0), true},
        {4, Point(1500, 0), true},     // Out of range
        {INVALID_ENTITY, Point(10, 0), true},
    };
    ThrottledScanner scanner(sensing, settings);

    const ScanResult& result = scanner.Scan(clock.Now(), Point(0, 0));

    ASSERT_TRUE(result.HasTarget());
    EXPECT_EQ(3u, result.TargetId());
}

TEST_F(ThrottledScannerTest, TieKeepsFirstEntry) {
    sensing.hostiles = {
        {5, Point(0, 400), true},
        {6, Point(400, 0), true},
    };
    ThrottledScanner scanner(sensing, settings);

    EXPECT_EQ(5u, scanner.Scan(clock.Now(), Point(0, 0)).TargetId());
}

TEST_F(ThrottledScannerTest, HostileAtExactRangeCounts) {
    sensing.hostiles = {{8, Point(1000, 0), true}};
    ThrottledScanner scanner(sensing, settings);

    EXPECT_EQ(8u, scanner.Scan(clock.Now(), Point(0, 0)).TargetId());
}

TEST_F(ThrottledScannerTest, NonFinitePositionsAreSkipped) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    sensing.hostiles = {
        {1, Point(nan, 0), true},
        {2, Point(0, inf), true},
        {3, Point(600, 0), true},
    };
    ThrottledScanner scanner(sensing, settings);

    EXPECT_EQ(3u, scanner.Scan(clock.Now(), Point(0, 0)).TargetId());
}

TEST_F(ThrottledScannerTest, OnlyNonFiniteHostilesMeansNoTarget) {
    sensing.hostiles = {{1, Point(std::numeric_limits<double>::quiet_NaN(), 0), true}};
    ThrottledScanner scanner(sensing, settings);

    EXPECT_FALSE(scanner.Scan(clock.Now(), Point(0, 0)).HasTarget());
}

TEST_F(ThrottledScannerTest, FailedQueryMeansNoHostile) {
    EXPECT_CALL(sensing, NearbyHostiles(_, _))
        .WillOnce(Return(PortResult<std::vector<HostileInfo>>(std::unexpected(PortError::Unavailable))));
    ThrottledScanner scanner(sensing, settings);

    const ScanResult& result = scanner.Scan(clock.Now(), Point(0, 0));

    EXPECT_FALSE(result.HasTarget());
    EXPECT_EQ(INVALID_ENTITY, result.TargetId());
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(PortError::Unavailable, *result.error);
}

TEST_F(ThrottledScannerTest, ResetQueryCount) {
    ThrottledScanner scanner(sensing, settings);
    scanner.Scan(clock.Now(), Point(0, 0));

    scanner.ResetQueryCount();

    EXPECT_EQ(0u, scanner.GetQueryCount());
}
