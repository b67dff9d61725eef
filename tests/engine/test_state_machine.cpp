/**
 * @file test_state_machine.cpp
 * @brief Unit tests for the hierarchical state machine
 */

#include <gtest/gtest.h>

#include <engine/fsm/StateMachine.hpp>

#include "utils/TestHelpers.hpp"

#include <string>
#include <vector>

using namespace Wayfarer;
using namespace Wayfarer::Test;

namespace {

constexpr auto ZERO = Time::Duration{0};

} // namespace

// =============================================================================
// Lifecycle Tests
// =============================================================================

TEST(StateMachineTest, DefaultState) {
    StateMachine fsm("Test");

    EXPECT_EQ("Test", fsm.GetName());
    EXPECT_FALSE(fsm.IsStarted());
    EXPECT_FALSE(fsm.IsPaused());
    EXPECT_TRUE(fsm.IsFinished());
    EXPECT_EQ(0u, fsm.GetStateCount());
    EXPECT_TRUE(fsm.GetCurrentStateName().empty());
}

TEST(StateMachineTest, UpdateBeforeStartDoesNothing) {
    ManualClock clock;
    StateMachine fsm("Test");
    int calls = 0;
    fsm.AddState("A", [&]() { ++calls; });

    fsm.Update(clock.Now());

    EXPECT_EQ(0, calls);
    EXPECT_EQ(0u, fsm.GetCursor());
}

TEST(StateMachineTest, StatesRunInOrder) {
    ManualClock clock;
    StateMachine fsm("Test");
    std::vector<std::string> trace;
    fsm.AddState("A", [&]() { trace.push_back("A"); });
    fsm.AddState("B", [&]() { trace.push_back("B"); });
    fsm.AddState("C", [&]() { trace.push_back("C"); });

    fsm.Start(clock.Now());
    EXPECT_EQ("A", fsm.GetCurrentStateName());

    for (int i = 0; i < 3; ++i) {
        fsm.Update(clock.AdvanceMs(10));
    }

    EXPECT_EQ((std::vector<std::string>{"A", "B", "C"}), trace);
    EXPECT_TRUE(fsm.IsFinished());

    // Finished machines ignore further updates
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ(3u, trace.size());
}

TEST(StateMachineTest, ExitConditionHoldsState) {
    ManualClock clock;
    StateMachine fsm("Test");
    bool ready = false;
    fsm.AddState("Wait", nullptr, [&]() { return ready; });
    fsm.AddState("Done");

    fsm.Start(clock.Now());
    fsm.Update(clock.AdvanceMs(10));
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ("Wait", fsm.GetCurrentStateName());

    ready = true;
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ("Done", fsm.GetCurrentStateName());
}

TEST(StateMachineTest, RunOnceExecutesBodyOnce) {
    ManualClock clock;
    StateMachine fsm("Test");
    int calls = 0;
    bool ready = false;
    fsm.AddState("Once", [&]() { ++calls; }, [&]() { return ready; }, true);

    fsm.Start(clock.Now());
    for (int i = 0; i < 5; ++i) {
        fsm.Update(clock.AdvanceMs(10));
    }

    EXPECT_EQ(1, calls);
}

TEST(StateMachineTest, RepeatingStateExecutesEveryTick) {
    ManualClock clock;
    StateMachine fsm("Test");
    int calls = 0;
    bool ready = false;
    fsm.AddState("Loop", [&]() { ++calls; }, [&]() { return ready; }, false);

    fsm.Start(clock.Now());
    for (int i = 0; i < 5; ++i) {
        fsm.Update(clock.AdvanceMs(10));
    }

    EXPECT_EQ(5, calls);
}

// =============================================================================
// Transition Delay Tests
// =============================================================================

TEST(StateMachineTest, TransitionDelayDebouncesExit) {
    ManualClock clock;
    StateMachine fsm("Test");
    fsm.AddState("Dwell", nullptr, nullptr, true, std::chrono::milliseconds(1000));
    fsm.AddState("Next");

    fsm.Start(clock.Now());

    fsm.Update(clock.AdvanceMs(400));
    EXPECT_EQ("Dwell", fsm.GetCurrentStateName());

    fsm.Update(clock.AdvanceMs(599));
    EXPECT_EQ("Dwell", fsm.GetCurrentStateName());

    fsm.Update(clock.AdvanceMs(1));
    EXPECT_EQ("Next", fsm.GetCurrentStateName());
}

TEST(StateMachineTest, TransitionDelayCountsFromStateEntry) {
    ManualClock clock;
    StateMachine fsm("Test");
    fsm.AddState("First");
    fsm.AddState("Dwell", nullptr, nullptr, true, std::chrono::milliseconds(500));
    fsm.AddState("Last");

    fsm.Start(clock.Now());
    clock.AdvanceMs(2000);
    fsm.Update(clock.Now());
    EXPECT_EQ("Dwell", fsm.GetCurrentStateName());

    fsm.Update(clock.AdvanceMs(100));
    EXPECT_EQ("Dwell", fsm.GetCurrentStateName());

    fsm.Update(clock.AdvanceMs(400));
    EXPECT_EQ("Last", fsm.GetCurrentStateName());
}

// =============================================================================
// Pause Tests
// =============================================================================

TEST(StateMachineTest, PauseFreezesCursorAndBody) {
    ManualClock clock;
    StateMachine fsm("Test");
    int calls = 0;
    bool ready = false;
    fsm.AddState("Work", [&]() { ++calls; }, [&]() { return ready; }, true);
    fsm.AddState("Done");

    fsm.Start(clock.Now());
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ(1, calls);

    fsm.Pause();
    EXPECT_TRUE(fsm.IsPaused());
    ready = true;
    fsm.Update(clock.AdvanceMs(10));
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ(0u, fsm.GetCursor());

    ready = false;
    fsm.Resume();
    fsm.Update(clock.AdvanceMs(10));

    // Resuming does not re-run the body of the paused state
    EXPECT_EQ(1, calls);
    EXPECT_EQ(0u, fsm.GetCursor());

    ready = true;
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ("Done", fsm.GetCurrentStateName());
    EXPECT_EQ(1, calls);
}

TEST(StateMachineTest, PauseAndResumeAreIdempotent) {
    StateMachine fsm("Test");
    fsm.AddState("A");

    fsm.Pause();
    fsm.Pause();
    EXPECT_TRUE(fsm.IsPaused());

    fsm.Resume();
    fsm.Resume();
    EXPECT_FALSE(fsm.IsPaused());
}

TEST(StateMachineTest, BodyMayPauseItsOwnMachine) {
    ManualClock clock;
    StateMachine fsm("Test");
    fsm.AddState("Pauser", [&]() { fsm.Pause(); });
    fsm.AddState("Next");

    fsm.Start(clock.Now());
    fsm.Update(clock.AdvanceMs(10));

    EXPECT_TRUE(fsm.IsPaused());
    EXPECT_EQ("Pauser", fsm.GetCurrentStateName());

    fsm.Resume();
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ("Next", fsm.GetCurrentStateName());
}

TEST(StateMachineTest, StartClearsPause) {
    ManualClock clock;
    StateMachine fsm("Test");
    fsm.AddState("A");
    fsm.Pause();

    fsm.Start(clock.Now());

    EXPECT_FALSE(fsm.IsPaused());
    EXPECT_TRUE(fsm.IsStarted());
}

// =============================================================================
// Stop / Reset Tests
// =============================================================================

TEST(StateMachineTest, StopKeepsCursor) {
    ManualClock clock;
    StateMachine fsm("Test");
    fsm.AddState("A");
    fsm.AddState("B", nullptr, []() { return false; });

    fsm.Start(clock.Now());
    fsm.Update(clock.AdvanceMs(10));
    fsm.Stop();

    EXPECT_FALSE(fsm.IsStarted());
    EXPECT_EQ(1u, fsm.GetCursor());
}

TEST(StateMachineTest, ResetRewindsAndAllowsBodyAgain) {
    ManualClock clock;
    StateMachine fsm("Test");
    int calls = 0;
    fsm.AddState("A", [&]() { ++calls; });
    fsm.AddState("B");

    fsm.Start(clock.Now());
    fsm.Update(clock.AdvanceMs(10));
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_TRUE(fsm.IsFinished());

    fsm.Reset();
    EXPECT_FALSE(fsm.IsStarted());
    EXPECT_EQ(0u, fsm.GetCursor());

    fsm.Start(clock.Now());
    fsm.Update(clock.AdvanceMs(10));
    EXPECT_EQ(2, calls);
}

TEST(StateMachineTest, ClearRemovesStates) {
    StateMachine fsm("Test");
    fsm.AddState("A");
    fsm.AddState("B");

    fsm.Clear();

    EXPECT_EQ(0u, fsm.GetStateCount());
    EXPECT_FALSE(fsm.IsStarted());
}

// =============================================================================
// Subroutine Tests
// =============================================================================

class StateMachineSubroutineTest : public ::testing::Test {
protected:
    void SetUp() override {
        parent.AddState("Before");
        parent.AddSubroutine("Delegate", [this]() { return condition; }, child);
        parent.AddState("After");

        child.AddState("Child: Wait", [this]() { ++childWaitCalls; },
                       [this]() { return childReady; }, false);
        child.AddState("Child: Done", [this]() { ++childDoneCalls; });
    }

    ManualClock clock;
    StateMachine parent{"Parent"};
    StateMachine child{"Child"};
    bool condition = false;
    bool childReady = false;
    int childWaitCalls = 0;
    int childDoneCalls = 0;
};

TEST_F(StateMachineSubroutineTest, FalseConditionSkipsChild) {
    parent.Start(clock.Now());
    parent.Update(clock.AdvanceMs(10));  // Before -> Delegate
    parent.Update(clock.AdvanceMs(10));  // Delegate skipped

    EXPECT_EQ("After", parent.GetCurrentStateName());
    EXPECT_FALSE(child.IsStarted());
    EXPECT_EQ(0, childWaitCalls);
}

TEST_F(StateMachineSubroutineTest, HoldingConditionTicksChild) {
    condition = true;
    parent.Start(clock.Now());
    parent.Update(clock.AdvanceMs(10));

    parent.Update(clock.AdvanceMs(10));
    parent.Update(clock.AdvanceMs(10));

    EXPECT_TRUE(child.IsStarted());
    EXPECT_EQ(2, childWaitCalls);
    EXPECT_EQ("Delegate", parent.GetCurrentStateName());
    EXPECT_EQ("Delegate > Child: Wait", parent.GetActivePath());
}

TEST_F(StateMachineSubroutineTest, ParentWaitsForChildToDrain) {
    condition = true;
    parent.Start(clock.Now());
    parent.Update(clock.AdvanceMs(10));
    parent.Update(clock.AdvanceMs(10));

    // Condition drops while the child is still mid-flow
    condition = false;
    childReady = true;
    parent.Update(clock.AdvanceMs(10));  // Child: Wait -> Child: Done
    EXPECT_EQ("Delegate", parent.GetCurrentStateName());

    parent.Update(clock.AdvanceMs(10));  // Child: Done runs, child finishes, parent moves on
    EXPECT_EQ(1, childDoneCalls);
    EXPECT_EQ("After", parent.GetCurrentStateName());

    // The child was rewound for the next use
    EXPECT_FALSE(child.IsStarted());
    EXPECT_EQ(0u, child.GetCursor());
}

TEST_F(StateMachineSubroutineTest, PausedParentFreezesChild) {
    condition = true;
    parent.Start(clock.Now());
    parent.Update(clock.AdvanceMs(10));
    parent.Update(clock.AdvanceMs(10));
    EXPECT_EQ(1, childWaitCalls);

    parent.Pause();
    parent.Update(clock.AdvanceMs(10));
    parent.Update(clock.AdvanceMs(10));

    EXPECT_EQ(1, childWaitCalls);
}

TEST_F(StateMachineSubroutineTest, ResetPropagatesToChild) {
    condition = true;
    parent.Start(clock.Now());
    parent.Update(clock.AdvanceMs(10));
    parent.Update(clock.AdvanceMs(10));
    ASSERT_TRUE(child.IsStarted());

    parent.Reset();

    EXPECT_FALSE(child.IsStarted());
    EXPECT_EQ(0u, child.GetCursor());
}
