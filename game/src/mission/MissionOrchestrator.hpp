#pragma once

#include "MissionContext.hpp"
#include "combat/PathAndCombatController.hpp"
#include "navigation/PathCursor.hpp"

#include <engine/fsm/StateMachine.hpp>
#include <memory>
#include <string>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Drives one mission run with two state machines
 *
 * The main machine travels to the start location, walks the outpost path,
 * waits for the explorable zone, performs the one-shot setup action and
 * then ticks the path-and-combat controller until the path is done.
 *
 * The danger machine runs beside it on every tick. While the world reports
 * danger it pauses the main machine and the movement driver and hands the
 * tick to its handler sub-machine; once safe it resumes both. When the
 * danger machine reaches its end it is rewound for the next incident.
 */
class MissionOrchestrator {
public:
    explicit MissionOrchestrator(MissionContext& context);

    MissionOrchestrator(const MissionOrchestrator&) = delete;
    MissionOrchestrator& operator=(const MissionOrchestrator&) = delete;

    /**
     * @brief Install a map and rebuild the path controller
     *
     * Refused while a run is in progress.
     */
    bool LoadMap(MapDefinition map);

    /**
     * @brief Begin a run from the first state
     * @return False when no map is loaded
     */
    bool Start(Time::TimePoint now);

    /**
     * @brief Abort the run and reset cursors, movement and triggers
     */
    void Stop(Time::TimePoint now);

    void Pause();
    void Resume();
    void TogglePause();

    /**
     * @brief Per-frame entry point
     */
    void Update(Time::TimePoint now, const Point& playerPosition);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] bool IsRunning() const noexcept { return m_context.running; }
    [[nodiscard]] bool IsPaused() const noexcept { return m_context.paused; }

    /**
     * @brief "<active state> | <controller status>" for display
     */
    [[nodiscard]] std::string GetStatusLine() const;

    [[nodiscard]] const StateMachine& GetMainMachine() const noexcept { return m_main; }
    [[nodiscard]] const StateMachine& GetDangerMachine() const noexcept { return m_danger; }
    [[nodiscard]] const StateMachine& GetDangerHandler() const noexcept { return m_dangerHandler; }
    [[nodiscard]] const PathCursor& GetOutpostCursor() const noexcept { return m_outpostCursor; }

    /**
     * @brief Controller of the loaded map, nullptr before LoadMap
     */
    [[nodiscard]] PathAndCombatController* GetController() noexcept { return m_controller.get(); }
    [[nodiscard]] const PathAndCombatController* GetController() const noexcept { return m_controller.get(); }

    [[nodiscard]] const MissionContext& GetContext() const noexcept { return m_context; }

private:
    void BuildMainMachine();
    void BuildDangerMachine();

    // State bodies
    void TravelToStart();
    void NavigateOutpost();
    bool IsOutpostFinished() const;
    void RequestSetup();
    void PauseForDanger();
    void ResumeAfterDanger();

    void ResetEnvironment();
    void CompleteRun(Time::TimePoint now);

    MissionContext& m_context;

    StateMachine m_main{"Mission"};
    StateMachine m_danger{"Danger"};
    StateMachine m_dangerHandler{"Danger Handler"};

    PathCursor m_outpostCursor;
    std::unique_ptr<PathAndCombatController> m_controller;

    // Sampled at the top of Update for the state bodies
    Time::TimePoint m_now{};
    Point m_playerPosition{0.0};

    bool m_travelRequested = false;
    bool m_outpostMovePending = false;
};

} // namespace Bot
} // namespace Wayfarer
