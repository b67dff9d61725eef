#include "PathAndCombatController.hpp"
#include <engine/core/Logger.hpp>
#include <spdlog/fmt/fmt.h>
#include <limits>

namespace Wayfarer {
namespace Bot {

namespace {

std::string FormatPoint(const Point& p) {
    return fmt::format("({:.0f}, {:.0f})", p.x, p.y);
}

} // namespace

PathAndCombatController::PathAndCombatController(FlatPath waypoints,
                                                 IMovementPort& movement,
                                                 ISensingPort& sensing,
                                                 ICombatPort& combat,
                                                 ControllerSettings settings)
    : m_movement(movement)
    , m_sensing(sensing)
    , m_combat(combat)
    , m_settings(settings)
    , m_cursor(std::move(waypoints))
    , m_scanner(sensing, ScannerSettings::ForAggroRange(settings.aggroRange,
                                                        settings.scanMoveRatio,
                                                        settings.scanInterval))
    , m_rallyTrigger(settings.rallyDebounce)
{
    if (m_cursor.Empty()) {
        BOT_LOG_WARN("PathAndCombatController created with an empty path");
    }
}

// ============================================================================
// Tick
// ============================================================================

const std::string& PathAndCombatController::Tick(Time::TimePoint now, const Point& playerPosition) {
    m_lastPlayerPosition = playerPosition;
    MaybeLogStats(now);

    if (m_cursor.Empty()) {
        SetStatus("No waypoints available.");
        return m_statusMessage;
    }

    if (m_busyCheck && m_busyCheck()) {
        SetStatus("Waiting for external routine to finish...");
        m_movement.Update();
        return m_statusMessage;
    }

    CheckRallyPoints(now, playerPosition);

    switch (m_mode) {
        case ControllerMode::Path:
            TickPath(now, playerPosition);
            break;
        case ControllerMode::Combat:
            TickCombat(now, playerPosition);
            break;
    }

    m_movement.Update();
    return m_statusMessage;
}

void PathAndCombatController::Reset() {
    m_cursor.Reset();
    m_mode = ControllerMode::Path;
    m_currentPoint.reset();
    m_resyncPending = false;
    m_debug = DebugOverride{};
    m_currentTarget.reset();
    m_lastTargetId.reset();
    m_lastApproach.reset();
    m_scanner.Invalidate();
    m_rallyTrigger.Clear();
    m_statusMessage = "Waiting to begin...";
}

// ============================================================================
// Path mode
// ============================================================================

void PathAndCombatController::TickPath(Time::TimePoint now, const Point& playerPosition) {
    const ScanResult& scan = m_scanner.Scan(now, playerPosition);
    if (scan.target) {
        EnterCombat(now, *scan.target);
        return;
    }

    AdvancePath(playerPosition);
}

void PathAndCombatController::AdvancePath(const Point& playerPosition) {
    if (ApplyDebugOverride()) {
        return;
    }

    if (!m_movement.IsFollowing()) {
        if (m_resyncPending) {
            if (const auto point = m_cursor.CurrentPoint()) {
                m_currentPoint = point;
                if (MoveToWaypoint(*point)) {
                    m_resyncPending = false;
                    SetStatus("Resuming at wp " + DescribeWaypoint(*m_cursor.CurrentIndex()), true);
                }
                return;
            }
            m_resyncPending = false;
        }

        const auto next = AdvanceSkippingReached(playerPosition);
        if (!next) {
            SetStatus("No valid next waypoint! Stopping pathing.");
            BOT_LOG_WARN("Path cursor exhausted; halting movement");

            if (!m_cursor.SupportsReset()) {
                m_currentPoint.reset();
                SetStatus("Halted: path exhausted.");
                return;
            }

            m_cursor.Reset();
            if (const auto retry = m_cursor.Advance()) {
                m_currentPoint = retry;
                if (MoveToWaypoint(*retry)) {
                    SetStatus("Path reset -> moving to " + FormatPoint(*retry));
                    BOT_LOG_WARN("Path reset after exhaustion, moving to {}", FormatPoint(*retry));
                }
            }
            return;
        }

        m_currentPoint = next;
        if (MoveToWaypoint(*next)) {
            SetStatus("Moving to wp " + DescribeWaypoint(*m_cursor.CurrentIndex()), true);
        }
        return;
    }

    if (!m_currentPoint) {
        SetStatus("Lost current path point, recovering...");
        m_movement.StopFollowing();
        return;
    }

    const double distance = Distance(playerPosition, *m_currentPoint);
    const bool noHostile = !m_scanner.GetLastResult().HasTarget();

    // Fluid advance: close and clear, keep walking without stopping
    const bool flow = noHostile && distance <= m_settings.earlyAdvanceDist;
    if (flow || distance <= m_settings.arrivalTolerance) {
        if (!AdvanceAndMove()) {
            MarkArrived();
        }
        return;
    }

    if (const auto index = m_cursor.CurrentIndex()) {
        SetStatus(fmt::format("Moving to wp {} ({:.0f} away)", DescribeWaypoint(*index), distance));
    } else {
        SetStatus(fmt::format("Moving to {} ({:.0f} away)", FormatPoint(*m_currentPoint), distance));
    }
}

bool PathAndCombatController::ApplyDebugOverride() {
    const size_t count = m_cursor.Size();

    if (m_debug.held) {
        if (m_debug.forcedIndex) {
            const size_t index = ClampIndex(static_cast<std::int64_t>(*m_debug.forcedIndex), count);
            if (m_debug.movePending && m_cursor.SetIndex(index)) {
                m_currentPoint = m_cursor.CurrentPoint();
                if (MoveToWaypoint(*m_currentPoint)) {
                    m_debug.movePending = false;
                }
            }
            SetStatus("[DEBUG] Holding at wp " + DescribeWaypoint(index) + " [HOLD]");
        } else {
            SetStatus("[DEBUG] Holding [HOLD]");
        }
        return true;
    }

    if (!m_debug.forcedIndex) {
        return false;
    }

    const size_t index = ClampIndex(static_cast<std::int64_t>(*m_debug.forcedIndex), count);
    if (m_debug.movePending) {
        if (auto synced = m_cursor.SetIndex(index); !synced) {
            BOT_LOG_WARN("Dropping forced move: {}", CursorErrorToString(synced.error()));
            m_debug.forcedIndex.reset();
            m_debug.movePending = false;
            return false;
        }
        m_currentPoint = m_cursor.CurrentPoint();
        if (!MoveToWaypoint(*m_currentPoint)) {
            return true;
        }
    }

    m_debug.forcedIndex.reset();
    m_debug.movePending = false;
    SetStatus("[DEBUG] Moving to wp " + DescribeWaypoint(index));
    return true;
}

std::optional<Point> PathAndCombatController::AdvanceSkippingReached(const Point& playerPosition) {
    // A waypoint the player already stands on counts as reached, except the last
    auto next = m_cursor.Advance();
    while (next && !m_cursor.IsAtEnd() &&
           Distance(playerPosition, *next) <= m_settings.arrivalTolerance) {
        next = m_cursor.Advance();
    }
    return next;
}

bool PathAndCombatController::AdvanceAndMove() {
    const auto next = m_cursor.Advance();
    if (!next) {
        return false;
    }

    m_currentPoint = next;
    if (MoveToWaypoint(*next)) {
        SetStatus("Flowing to next wp " + DescribeWaypoint(*m_cursor.CurrentIndex()), true);
    }
    return true;
}

bool PathAndCombatController::AdvanceIndexOnly() {
    if (!m_cursor.CurrentIndex() || m_cursor.IsAtEnd()) {
        return false;
    }
    m_currentPoint = m_cursor.Advance();
    return m_currentPoint.has_value();
}

bool PathAndCombatController::MoveToWaypoint(const Point& point) {
    auto result = m_movement.MoveTo(point);
    if (!result) {
        // Retry the same waypoint once the driver is idle again
        m_resyncPending = true;
        SetStatus(fmt::format("Movement command to {} failed ({}); retrying",
                              FormatPoint(point), PortErrorToString(result.error())));
        BOT_LOG_DEBUG("{}", m_statusMessage);
        return false;
    }
    ++m_stats.pathMoveCalls;
    return true;
}

void PathAndCombatController::MarkArrived() {
    m_movement.StopFollowing();
    m_movement.SetArrived(true);
    SetStatus("Arrived at final waypoint.", true);
}

// ============================================================================
// Combat mode
// ============================================================================

void PathAndCombatController::TickCombat(Time::TimePoint now, const Point& playerPosition) {
    // Keep path progress while fighting in place
    if (!m_debug.held && m_currentPoint &&
        Distance(playerPosition, *m_currentPoint) <= m_settings.combatReachDist) {
        if (AdvanceIndexOnly()) {
            SetStatus("Marked waypoint reached during combat.", true);
        }
    }

    if (!m_currentTarget) {
        ExitCombat(now, "Combat done. Switching to path mode.");
        return;
    }

    auto current = m_sensing.QueryEntity(*m_currentTarget);
    if (!current || !current->alive) {
        m_scanner.Invalidate();
        ExitCombat(now, current ? "Combat done. Switching to path mode."
                                : "Target lost. Switching to path mode.");
        return;
    }

    const ScanResult& scan = m_scanner.Scan(now, playerPosition);
    if (!scan.target) {
        ExitCombat(now, "No enemies (throttled), returning to path.");
        return;
    }

    const EntityId targetId = scan.target->id;
    HostileInfo target = *current;
    if (targetId != *m_currentTarget) {
        auto fresh = m_sensing.QueryEntity(targetId);
        if (!fresh || !fresh->alive) {
            m_scanner.Invalidate();
            ExitCombat(now, "Enemy fetch failed. Returning to path.");
            return;
        }
        target = *fresh;
    }
    if (!IsFinite(target.position)) {
        m_scanner.Invalidate();
        ExitCombat(now, "Enemy position invalid. Returning to path.");
        return;
    }
    m_currentTarget = targetId;

    if (m_lastTargetId != targetId) {
        auto selected = m_combat.SetTarget(targetId);
        if (!selected) {
            BOT_LOG_DEBUG("SetTarget({}) failed: {}", targetId, PortErrorToString(selected.error()));
            ExitCombat(now, "Target command failed. Returning to path.");
            return;
        }
        m_lastTargetId = targetId;
        ++m_stats.setTargetCalls;
    }

    const GridPoint destination = RoundToGrid(target.position);
    if (m_lastApproach != destination) {
        auto approached = m_combat.ApproachTarget(Point(destination));
        if (!approached) {
            BOT_LOG_DEBUG("ApproachTarget failed: {}", PortErrorToString(approached.error()));
            ExitCombat(now, "Approach command failed. Returning to path.");
            return;
        }
        m_lastApproach = destination;
        ++m_stats.approachCalls;
    }

    SetStatus(fmt::format("Closing in on enemy at ({}, {})", destination.x, destination.y));
}

void PathAndCombatController::EnterCombat(Time::TimePoint now, const HostileInfo& target) {
    m_mode = ControllerMode::Combat;
    m_currentTarget = target.id;
    m_lastTargetId.reset();
    m_lastApproach.reset();
    m_lastEnemyCheck.Reset(now);
    SetStatus("Switching to combat mode.", true);
}

void PathAndCombatController::ExitCombat(Time::TimePoint now, std::string reason) {
    const double engaged = m_lastEnemyCheck.IsArmed()
        ? Time::SecondsBetween(m_lastEnemyCheck.GetLastReset(), now)
        : 0.0;

    m_mode = ControllerMode::Path;
    m_currentTarget.reset();
    SetStatus(std::move(reason));

    if (m_settings.logActions) {
        BOT_LOG_INFO("{} (engaged {:.1f}s)", m_statusMessage, engaged);
    }
}

// ============================================================================
// Rally points and statistics
// ============================================================================

void PathAndCombatController::SetRallyPoints(std::vector<Point> points, ProximityTrigger::Action action) {
    m_rallyPoints = std::move(points);
    m_rallyTrigger.SetAction(std::move(action));
}

void PathAndCombatController::CheckRallyPoints(Time::TimePoint now, const Point& playerPosition) {
    for (const Point& point : m_rallyPoints) {
        if (m_rallyTrigger.IsConfirmed(point)) {
            continue;
        }
        if (Distance(playerPosition, point) < m_settings.rallyRadius) {
            SetStatus("Near rally point " + FormatPoint(point));
            const TriggerState state = m_rallyTrigger.Check(point, now, playerPosition, m_settings.rallyRadius);
            if (state == TriggerState::Fired) {
                SetStatus("Rally action triggered at " + FormatPoint(point), true);
            }
            break;
        }
    }
}

void PathAndCombatController::MaybeLogStats(Time::TimePoint now) {
    if (!m_statsTimer.IsArmed()) {
        m_statsTimer.Reset(now);
        return;
    }
    if (!m_statsTimer.HasElapsed(now, m_settings.statsInterval)) {
        return;
    }

    const ControllerStats stats = GetStats();
    BOT_LOG_INFO("[Stats over {:.0f}s] queries={}, setTarget={}, approach={}, pathMoves={}",
                 Time::SecondsBetween(m_statsTimer.GetLastReset(), now),
                 stats.hostileQueries, stats.setTargetCalls, stats.approachCalls, stats.pathMoveCalls);

    m_stats = ControllerStats{};
    m_scanner.ResetQueryCount();
    m_statsTimer.Reset(now);
}

ControllerStats PathAndCombatController::GetStats() const {
    ControllerStats stats = m_stats;
    stats.hostileQueries = m_scanner.GetQueryCount();
    return stats;
}

// ============================================================================
// Debug / UI surface
// ============================================================================

std::optional<size_t> PathAndCombatController::GetCurrentIndex() const {
    const size_t count = m_cursor.Size();
    if (count == 0) {
        return std::nullopt;
    }
    if (m_debug.forcedIndex) {
        return ClampIndex(static_cast<std::int64_t>(*m_debug.forcedIndex), count);
    }
    if (const auto index = m_cursor.CurrentIndex()) {
        return index;
    }
    if (!m_lastPlayerPosition) {
        return std::nullopt;
    }

    const FlatPath& waypoints = m_cursor.GetWaypoints();
    size_t nearest = 0;
    double best = std::numeric_limits<double>::max();
    for (size_t i = 0; i < count; ++i) {
        const double d = DistanceSquared(*m_lastPlayerPosition, waypoints[i]);
        if (d < best) {
            best = d;
            nearest = i;
        }
    }
    return nearest;
}

std::optional<Point> PathAndCombatController::GetCurrentWaypoint() const {
    if (m_currentPoint) {
        return m_currentPoint;
    }
    if (const auto index = GetCurrentIndex()) {
        return m_cursor.GetWaypoints()[*index];
    }
    return std::nullopt;
}

bool PathAndCombatController::ForceMoveToIndex(std::int64_t index, bool sticky) {
    if (m_cursor.Empty()) {
        SetStatus("No waypoints available.");
        return false;
    }

    const size_t clamped = ClampIndex(index, m_cursor.Size());
    if (auto synced = m_cursor.SetIndex(clamped); !synced) {
        SetStatus(fmt::format("Cannot move to wp {}: {}", clamped + 1, CursorErrorToString(synced.error())));
        return false;
    }

    m_debug.forcedIndex = clamped;
    if (sticky) {
        EnableHold();
    }

    m_movement.StopFollowing();
    m_movement.SetArrived(false);
    m_currentPoint = m_cursor.CurrentPoint();
    m_resyncPending = false;
    m_debug.movePending = !MoveToWaypoint(*m_currentPoint);
    if (m_debug.movePending) {
        // The retry belongs to the override, not to the resync path
        m_resyncPending = false;
    }

    SetStatus("[DEBUG] Forced move -> wp " + DescribeWaypoint(clamped) + (m_debug.held ? " [HOLD]" : ""));
    if (m_settings.logActions) {
        BOT_LOG_WARN("{}", m_statusMessage);
    }
    return true;
}

bool PathAndCombatController::SetActiveIndex(std::int64_t index) {
    if (m_cursor.Empty()) {
        SetStatus("No waypoints available.");
        return false;
    }

    const size_t clamped = ClampIndex(index, m_cursor.Size());
    if (auto synced = m_cursor.SetIndex(clamped); !synced) {
        SetStatus(fmt::format("Cannot select wp {}: {}", clamped + 1, CursorErrorToString(synced.error())));
        return false;
    }

    ReleaseHold();
    m_currentPoint.reset();
    m_resyncPending = true;
    m_movement.StopFollowing();
    m_movement.SetArrived(false);

    SetStatus(fmt::format("[DEBUG] Set active index to {}/{}", clamped + 1, m_cursor.Size()), true);
    return true;
}

bool PathAndCombatController::SeekRelative(std::int64_t delta, bool sticky) {
    if (m_cursor.Empty()) {
        SetStatus("No waypoints to seek.");
        return false;
    }

    // The current index is never negative, so only the upper bound can overflow
    const auto current = static_cast<std::int64_t>(GetCurrentIndex().value_or(0));
    constexpr std::int64_t maxIndex = std::numeric_limits<std::int64_t>::max();
    const std::int64_t target = delta > maxIndex - current ? maxIndex : current + delta;
    return ForceMoveToIndex(target, sticky);
}

void PathAndCombatController::ReleaseHold() noexcept {
    m_debug.held = false;
    m_debug.forcedIndex.reset();
    m_debug.movePending = false;
}

bool PathAndCombatController::IsPathFinished() const {
    return !m_cursor.Empty() && m_cursor.IsAtEnd() &&
           m_movement.IsArrived() && !m_movement.IsFollowing();
}

void PathAndCombatController::SetStatus(std::string message, bool logIt) {
    m_statusMessage = std::move(message);
    if (logIt && m_settings.logActions) {
        BOT_LOG_INFO("{}", m_statusMessage);
    }
}

std::string PathAndCombatController::DescribeWaypoint(size_t index) const {
    const FlatPath& waypoints = m_cursor.GetWaypoints();
    if (index >= waypoints.size()) {
        return fmt::format("{}/{}", index + 1, waypoints.size());
    }
    return fmt::format("{}/{} {}", index + 1, waypoints.size(), FormatPoint(waypoints[index]));
}

} // namespace Bot
} // namespace Wayfarer
