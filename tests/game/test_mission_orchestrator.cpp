/**
 * @file test_mission_orchestrator.cpp
 * @brief Unit tests for the orchestrator's handling of world port results
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "mission/MissionOrchestrator.hpp"

#include "mocks/MockPorts.hpp"
#include "utils/TestHelpers.hpp"

#include <memory>
#include <string>

using namespace Wayfarer;
using namespace Wayfarer::Bot;
using namespace Wayfarer::Test;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

constexpr LocationId OUTPOST = 148;
constexpr LocationId EXPLORABLE = 149;

PortResult<void> Rejected() {
    return std::unexpected(PortError::Rejected);
}

MapDefinition MakeMap() {
    MapDefinition map;
    map.name = "orchestrator";
    map.outpostPath = {Point(0, 0), Point(500, 0)};
    map.rawPath = std::vector<Point>{Point(5000, 5000), Point(6000, 5000)};
    map.ids = {OUTPOST, EXPLORABLE};
    return map;
}

} // namespace

class MissionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        movement.UseFakeDriver();
        sensing.UseFakeWorld();
        combat.AcceptAll();

        BotSettings settings;
        settings.mission.transitionDelay = Time::Duration::zero();
        settings.mission.setupDelay = Time::Duration::zero();

        context = std::make_unique<MissionContext>(MissionContext{movement, sensing, combat, world, settings});
        mission = std::make_unique<MissionOrchestrator>(*context);
        ASSERT_TRUE(mission->LoadMap(MakeMap()));
    }

    void Tick() {
        mission->Update(clock.AdvanceMs(100), Point(0, 0));
    }

    std::string MainState() const {
        return std::string(mission->GetMainMachine().GetCurrentStateName());
    }

    ManualClock clock;
    NiceMock<MockMovementPort> movement;
    NiceMock<MockSensingPort> sensing;
    NiceMock<MockCombatPort> combat;
    NiceMock<MockWorldPort> world;
    std::unique_ptr<MissionContext> context;
    std::unique_ptr<MissionOrchestrator> mission;
};

// =============================================================================
// Travel Tests
// =============================================================================

TEST_F(MissionOrchestratorTest, FailedTravelIsRetried) {
    EXPECT_CALL(world, TravelTo(OUTPOST))
        .WillOnce(Return(Rejected()))
        .WillOnce(Return(PortResult<void>{}));
    ASSERT_TRUE(mission->Start(clock.Now()));

    Tick();
    Tick();
    Tick();

    EXPECT_EQ("Travel: Start Location", MainState());
}

TEST_F(MissionOrchestratorTest, NoTravelWhenAlreadyAtStart) {
    ON_CALL(world, IsAt(OUTPOST)).WillByDefault(Return(true));
    EXPECT_CALL(world, TravelTo(_)).Times(0);
    ASSERT_TRUE(mission->Start(clock.Now()));

    Tick();

    EXPECT_EQ("Wait: Map Load", MainState());
}

TEST_F(MissionOrchestratorTest, LoadingWorldHoldsMovement) {
    ON_CALL(world, IsLoading()).WillByDefault(Return(true));
    ASSERT_TRUE(mission->Start(clock.Now()));

    EXPECT_CALL(world, TravelTo(_)).Times(0);
    EXPECT_CALL(movement, Reset()).Times(AtLeast(3));

    Tick();
    Tick();
    Tick();

    EXPECT_EQ("Travel: Start Location", MainState());
}

// =============================================================================
// Setup Tests
// =============================================================================

TEST_F(MissionOrchestratorTest, FailedSetupDoesNotStallRun) {
    ON_CALL(world, IsAt(OUTPOST)).WillByDefault(Return(true));
    ON_CALL(world, IsInDestinationZone()).WillByDefault(Return(true));
    ON_CALL(world, SetupActionSatisfied()).WillByDefault(Return(true));
    EXPECT_CALL(world, RequestSetupAction()).WillOnce(Return(Rejected()));
    ASSERT_TRUE(mission->Start(clock.Now()));

    for (int i = 0; i < 10 && MainState() != "Run: Path and Combat"; ++i) {
        Tick();
    }

    EXPECT_EQ("Run: Path and Combat", MainState());
    EXPECT_TRUE(mission->IsRunning());
}

TEST_F(MissionOrchestratorTest, SetupWaitsUntilSatisfied) {
    ON_CALL(world, IsAt(OUTPOST)).WillByDefault(Return(true));
    ON_CALL(world, IsInDestinationZone()).WillByDefault(Return(true));
    ASSERT_TRUE(mission->Start(clock.Now()));

    for (int i = 0; i < 10; ++i) {
        Tick();
    }
    EXPECT_EQ("Setup: One-Shot Action", MainState());

    ON_CALL(world, SetupActionSatisfied()).WillByDefault(Return(true));
    Tick();

    EXPECT_EQ("Run: Path and Combat", MainState());
}

// =============================================================================
// Danger Tests
// =============================================================================

TEST_F(MissionOrchestratorTest, DangerPausesMovementDriver) {
    ASSERT_TRUE(mission->Start(clock.Now()));
    Tick();

    ON_CALL(world, InDanger()).WillByDefault(Return(true));
    Tick();

    EXPECT_TRUE(movement.paused);
    EXPECT_TRUE(context->combatActive);

    ON_CALL(world, InDanger()).WillByDefault(Return(false));
    Tick();
    Tick();

    EXPECT_FALSE(movement.paused);
    EXPECT_FALSE(context->combatActive);
    EXPECT_FALSE(mission->GetMainMachine().IsPaused());
}
