#include "MissionOrchestrator.hpp"
#include <engine/core/Logger.hpp>

namespace Wayfarer {
namespace Bot {

MissionOrchestrator::MissionOrchestrator(MissionContext& context)
    : m_context(context)
{
    BuildMainMachine();
    BuildDangerMachine();

    if (m_context.map) {
        MapDefinition map = std::move(*m_context.map);
        m_context.map.reset();
        LoadMap(std::move(map));
    }
}

// ============================================================================
// Setup
// ============================================================================

void MissionOrchestrator::BuildMainMachine() {
    const MissionSettings& mission = m_context.settings.mission;
    IWorldPort& world = m_context.world;

    m_main.SetLogBehavior(true);

    m_main.AddState("Travel: Start Location",
        [this]() { TravelToStart(); },
        [this, &world]() { return m_context.map && world.IsAt(m_context.map->ids.startLocationId); },
        false,
        mission.transitionDelay);

    m_main.AddState("Wait: Map Load",
        nullptr,
        [&world]() { return !world.IsLoading(); },
        true,
        mission.transitionDelay);

    m_main.AddState("Navigate: Outpost",
        [this]() { NavigateOutpost(); },
        [this, &world]() { return IsOutpostFinished() || world.IsInDestinationZone(); },
        false);

    m_main.AddState("Wait: Explorable Load",
        nullptr,
        [&world]() { return !world.IsLoading() && world.IsInDestinationZone(); },
        true,
        mission.transitionDelay);

    m_main.AddState("Setup: One-Shot Action",
        [this]() { RequestSetup(); },
        [&world]() { return world.SetupActionSatisfied() || world.IsLoading(); },
        true,
        mission.setupDelay);

    m_main.AddState("Run: Path and Combat",
        [this]() {
            if (m_controller) {
                m_controller->Tick(m_now, m_playerPosition);
            }
        },
        [this]() { return !m_controller || m_controller->IsPathFinished(); },
        false);
}

void MissionOrchestrator::BuildDangerMachine() {
    IWorldPort& world = m_context.world;

    m_danger.SetLogBehavior(false);
    m_danger.AddState("Check: In Danger",
        [this]() { PauseForDanger(); },
        [&world]() { return world.InDanger(); },
        false);
    m_danger.AddSubroutine("Danger: Handle",
        [&world]() { return world.InDanger(); },
        m_dangerHandler);
    m_danger.AddState("Resume: Main FSM",
        [this]() { ResumeAfterDanger(); },
        [&world]() { return !world.InDanger(); },
        false);

    m_dangerHandler.SetLogBehavior(false);
    m_dangerHandler.AddState("Danger: Wait Safe",
        nullptr,
        [&world]() { return !world.InDanger(); },
        false);
    m_dangerHandler.AddState("Danger: Stop",
        [this]() { m_context.combatActive = false; });
}

bool MissionOrchestrator::LoadMap(MapDefinition map) {
    if (m_context.running) {
        BOT_LOG_WARN("Cannot load map '{}' while a run is in progress", map.name);
        return false;
    }

    FlattenResult flat = Flatten(map.rawPath);
    for (const PathWarning& warning : flat.warnings) {
        BOT_LOG_WARN("Map '{}': {}", map.name, warning.message);
    }

    m_outpostCursor = PathCursor(map.outpostPath);
    m_controller = std::make_unique<PathAndCombatController>(
        std::move(flat.waypoints),
        m_context.movement,
        m_context.sensing,
        m_context.combat,
        m_context.settings.controller);

    IWorldPort& world = m_context.world;
    m_controller->SetRallyPoints(std::move(flat.rallyPoints), [&world](const Point& point) {
        if (auto result = world.RequestSetupAction(); !result) {
            BOT_LOG_WARN("Rally action at ({:.0f}, {:.0f}) failed: {}",
                         point.x, point.y, PortErrorToString(result.error()));
        }
    });
    m_controller->SetBusyCheck([&world]() { return world.IsBusy(); });

    BOT_LOG_INFO("Map '{}' ready: {} waypoints, start location {}, destination zone {}",
                 map.name, m_controller->GetWaypoints().size(),
                 map.ids.startLocationId, map.ids.destinationZoneId);

    m_context.map = std::move(map);
    return true;
}

// ============================================================================
// Host API
// ============================================================================

bool MissionOrchestrator::Start(Time::TimePoint now) {
    if (!m_context.map || !m_controller) {
        BOT_LOG_ERROR("Cannot start: no map loaded");
        return false;
    }

    ResetEnvironment();
    m_main.Reset();
    m_danger.Reset();

    m_context.running = true;
    m_context.paused = false;
    m_context.stats.BeginRun(now);

    m_now = now;
    m_main.Start(now);
    m_danger.Start(now);

    BOT_LOG_INFO("Run {} started on '{}'", m_context.stats.GetRunsAttempted(), m_context.map->name);
    return true;
}

void MissionOrchestrator::Stop(Time::TimePoint now) {
    if (!m_context.running) {
        return;
    }

    m_context.running = false;
    m_context.paused = false;
    m_context.stats.EndSession(now);
    m_main.Stop();
    m_danger.Stop();
    ResetEnvironment();

    BOT_LOG_INFO("Run stopped");
}

void MissionOrchestrator::Pause() {
    if (!m_context.running || m_context.paused) {
        return;
    }
    m_context.paused = true;
    m_main.Pause();
    m_danger.Pause();
    m_context.movement.Pause();
    BOT_LOG_INFO("Bot paused");
}

void MissionOrchestrator::Resume() {
    if (!m_context.running || !m_context.paused) {
        return;
    }
    m_context.paused = false;
    m_main.Resume();
    m_danger.Resume();
    m_context.movement.Resume();
    BOT_LOG_INFO("Bot resumed");
}

void MissionOrchestrator::TogglePause() {
    if (m_context.paused) {
        Resume();
    } else {
        Pause();
    }
}

void MissionOrchestrator::Update(Time::TimePoint now, const Point& playerPosition) {
    if (!m_context.running || m_context.paused) {
        return;
    }

    m_now = now;
    m_playerPosition = playerPosition;

    if (m_context.world.IsLoading()) {
        m_context.movement.Reset();
        return;
    }

    if (m_danger.IsFinished()) {
        m_danger.Reset();
        m_danger.Start(now);
        return;
    }

    m_danger.Update(now);
    m_main.Update(now);

    if (m_main.IsFinished()) {
        CompleteRun(now);
    }
}

std::string MissionOrchestrator::GetStatusLine() const {
    if (!m_context.running) {
        return "Idle";
    }

    std::string line = m_context.combatActive ? m_danger.GetActivePath() : m_main.GetActivePath();
    if (m_context.paused) {
        line += " [PAUSED]";
    }
    if (m_controller && m_main.GetCurrentStateName() == "Run: Path and Combat") {
        line += " | ";
        line += m_controller->GetStatusMessage();
    }
    return line;
}

// ============================================================================
// State bodies
// ============================================================================

void MissionOrchestrator::TravelToStart() {
    IWorldPort& world = m_context.world;
    const LocationId start = m_context.map->ids.startLocationId;

    if (m_travelRequested || world.IsAt(start) || world.IsLoading()) {
        return;
    }

    if (auto result = world.TravelTo(start); !result) {
        BOT_LOG_WARN("Travel to location {} failed: {}", start, PortErrorToString(result.error()));
        return;
    }
    m_travelRequested = true;
    BOT_LOG_INFO("Travelling to start location {}", start);
}

void MissionOrchestrator::NavigateOutpost() {
    IMovementPort& movement = m_context.movement;
    if (movement.IsFollowing()) {
        return;
    }

    std::optional<Point> next = m_outpostMovePending ? m_outpostCursor.CurrentPoint()
                                                     : m_outpostCursor.Advance();
    if (!next) {
        m_outpostMovePending = false;
        movement.SetArrived(true);
        return;
    }

    if (auto result = movement.MoveTo(*next); !result) {
        m_outpostMovePending = true;
        BOT_LOG_DEBUG("Outpost move failed: {}", PortErrorToString(result.error()));
        return;
    }
    m_outpostMovePending = false;
    movement.SetArrived(false);
}

bool MissionOrchestrator::IsOutpostFinished() const {
    const IMovementPort& movement = m_context.movement;
    return !m_outpostMovePending &&
           (m_outpostCursor.Empty() || m_outpostCursor.IsAtEnd()) &&
           movement.IsArrived() && !movement.IsFollowing();
}

void MissionOrchestrator::RequestSetup() {
    if (auto result = m_context.world.RequestSetupAction(); !result) {
        BOT_LOG_WARN("Setup action failed: {}", PortErrorToString(result.error()));
    }
}

void MissionOrchestrator::PauseForDanger() {
    if (!m_context.world.InDanger()) {
        return;
    }
    m_context.combatActive = true;
    if (!m_main.IsPaused()) {
        BOT_LOG_INFO("In danger, pausing mission at '{}'", m_main.GetCurrentStateName());
        m_main.Pause();
    }
    m_context.movement.Pause();
}

void MissionOrchestrator::ResumeAfterDanger() {
    if (m_context.world.InDanger()) {
        return;
    }
    // Danger can clear before the handler ever starts
    m_context.combatActive = false;
    if (m_main.IsPaused()) {
        BOT_LOG_INFO("Safe again, resuming mission at '{}'", m_main.GetCurrentStateName());
        m_main.Resume();
    }
    m_context.movement.Resume();
}

// ============================================================================
// Helpers
// ============================================================================

void MissionOrchestrator::ResetEnvironment() {
    m_outpostCursor.Reset();
    m_outpostMovePending = false;
    m_travelRequested = false;
    if (m_controller) {
        m_controller->Reset();
    }
    m_context.movement.Reset();
    m_context.combatActive = false;
}

void MissionOrchestrator::CompleteRun(Time::TimePoint now) {
    m_context.stats.CompleteRun(now);
    const RunStats& stats = m_context.stats;
    BOT_LOG_INFO("Run complete in {:.1f}s ({} of {} runs, {:.1f}% success)",
                 stats.GetLapHistory().empty() ? 0.0 : stats.GetLapHistory().back(),
                 stats.GetRunsCompleted(), stats.GetRunsAttempted(),
                 stats.GetSuccessRate() * 100.0);

    m_context.running = false;
    m_context.paused = false;
    m_danger.Stop();
    m_context.stats.EndSession(now);
}

} // namespace Bot
} // namespace Wayfarer
