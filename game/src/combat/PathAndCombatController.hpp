#pragma once

#include "ThrottledScanner.hpp"
#include "config/BotSettings.hpp"
#include "navigation/PathCursor.hpp"
#include "ports/CombatPort.hpp"
#include "ports/MovementPort.hpp"
#include "triggers/ProximityTrigger.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Controller behaviour modes
 */
enum class ControllerMode : uint8_t {
    Path,       // Walking the waypoint path
    Combat      // Engaging a detected hostile
};

inline const char* ControllerModeToString(ControllerMode mode) {
    switch (mode) {
        case ControllerMode::Path:   return "Path";
        case ControllerMode::Combat: return "Combat";
        default:                     return "Unknown";
    }
}

/**
 * @brief Manual waypoint control from the debug surface
 */
struct DebugOverride {
    std::optional<size_t> forcedIndex;  // One-shot target unless held
    bool held = false;                  // Suspend automatic advancement
    bool movePending = false;           // Forced move not yet accepted by the driver
};

/**
 * @brief Command counters for the current statistics window
 */
struct ControllerStats {
    uint64_t hostileQueries = 0;
    uint64_t setTargetCalls = 0;
    uint64_t approachCalls = 0;
    uint64_t pathMoveCalls = 0;
};

/**
 * @brief Waypoint follower that breaks off to fight nearby hostiles
 *
 * In Path mode the controller walks the flattened path, advancing early
 * ("fluid" flow) when the path is clear, and switches to Combat as soon as
 * a throttled scan reports a live hostile within aggro range. In Combat
 * mode it keeps counting waypoints it passes, re-targets only when the
 * nearest hostile changes, and re-issues approach commands only when the
 * target's integer position changes. Port failures never escape Tick();
 * they drop the controller back to Path mode.
 */
class PathAndCombatController {
public:
    using BusyCheck = std::function<bool()>;

    PathAndCombatController(FlatPath waypoints,
                            IMovementPort& movement,
                            ISensingPort& sensing,
                            ICombatPort& combat,
                            ControllerSettings settings = {});

    // Holds references to its ports
    PathAndCombatController(const PathAndCombatController&) = delete;
    PathAndCombatController& operator=(const PathAndCombatController&) = delete;

    /**
     * @brief Per-frame entry point
     * @return Human-readable status for this tick
     */
    const std::string& Tick(Time::TimePoint now, const Point& playerPosition);

    /**
     * @brief Rewind to the start of the path and drop all transient state
     */
    void Reset();

    // =========================================================================
    // Collaborators
    // =========================================================================

    /**
     * @brief Rally points checked every tick; the action fires once per point
     */
    void SetRallyPoints(std::vector<Point> points, ProximityTrigger::Action action);

    /**
     * @brief While the check returns true the controller only waits
     */
    void SetBusyCheck(BusyCheck check) { m_busyCheck = std::move(check); }

    // =========================================================================
    // Debug / UI surface
    // =========================================================================

    [[nodiscard]] const FlatPath& GetWaypoints() const noexcept { return m_cursor.GetWaypoints(); }

    /**
     * @brief Forced index, else cursor index, else the waypoint nearest to
     *        the last known player position
     */
    [[nodiscard]] std::optional<size_t> GetCurrentIndex() const;

    /**
     * @brief Waypoint being walked to, else the nearest one for display
     */
    [[nodiscard]] std::optional<Point> GetCurrentWaypoint() const;

    /**
     * @brief Move to a waypoint now; with sticky, hold there until released
     * @param index Clamped into the valid range
     */
    bool ForceMoveToIndex(std::int64_t index, bool sticky = true);

    /**
     * @brief Reposition the cursor without commanding movement
     *
     * The next tick resumes walking at the selected waypoint.
     */
    bool SetActiveIndex(std::int64_t index);

    /**
     * @brief ForceMoveToIndex relative to the current index
     */
    bool SeekRelative(std::int64_t delta, bool sticky = true);

    void EnableHold() noexcept { m_debug.held = true; }
    void ReleaseHold() noexcept;

    [[nodiscard]] bool IsHolding() const noexcept { return m_debug.held; }
    [[nodiscard]] const DebugOverride& GetDebugOverride() const noexcept { return m_debug; }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] const std::string& GetStatusMessage() const noexcept { return m_statusMessage; }
    [[nodiscard]] ControllerMode GetMode() const noexcept { return m_mode; }
    [[nodiscard]] std::optional<EntityId> GetCurrentTarget() const noexcept { return m_currentTarget; }

    /**
     * @brief Final waypoint reached and the driver stopped
     */
    [[nodiscard]] bool IsPathFinished() const;

    [[nodiscard]] const PathCursor& GetCursor() const noexcept { return m_cursor; }
    [[nodiscard]] const ThrottledScanner& GetScanner() const noexcept { return m_scanner; }
    [[nodiscard]] const ProximityTrigger& GetRallyTrigger() const noexcept { return m_rallyTrigger; }
    [[nodiscard]] const std::vector<Point>& GetRallyPoints() const noexcept { return m_rallyPoints; }
    [[nodiscard]] const ControllerSettings& GetSettings() const noexcept { return m_settings; }

    /** @brief Counters for the current statistics window */
    [[nodiscard]] ControllerStats GetStats() const;

private:
    // Per-mode behaviour
    void TickPath(Time::TimePoint now, const Point& playerPosition);
    void TickCombat(Time::TimePoint now, const Point& playerPosition);
    void AdvancePath(const Point& playerPosition);
    bool ApplyDebugOverride();

    // Path helpers
    std::optional<Point> AdvanceSkippingReached(const Point& playerPosition);
    bool AdvanceAndMove();
    bool AdvanceIndexOnly();
    bool MoveToWaypoint(const Point& point);
    void MarkArrived();

    // Combat helpers
    void EnterCombat(Time::TimePoint now, const HostileInfo& target);
    void ExitCombat(Time::TimePoint now, std::string reason);

    void CheckRallyPoints(Time::TimePoint now, const Point& playerPosition);
    void MaybeLogStats(Time::TimePoint now);
    void SetStatus(std::string message, bool logIt = false);
    [[nodiscard]] std::string DescribeWaypoint(size_t index) const;

    IMovementPort& m_movement;
    ISensingPort& m_sensing;
    ICombatPort& m_combat;
    ControllerSettings m_settings;

    PathCursor m_cursor;
    ThrottledScanner m_scanner;
    ProximityTrigger m_rallyTrigger;
    std::vector<Point> m_rallyPoints;
    BusyCheck m_busyCheck;

    ControllerMode m_mode = ControllerMode::Path;
    std::optional<Point> m_currentPoint;        // Waypoint currently walked to
    bool m_resyncPending = false;               // Walk to the cursor's point instead of advancing
    DebugOverride m_debug;
    std::optional<Point> m_lastPlayerPosition;

    // Combat bookkeeping
    std::optional<EntityId> m_currentTarget;
    std::optional<EntityId> m_lastTargetId;     // Last target accepted by SetTarget
    std::optional<GridPoint> m_lastApproach;    // Last destination accepted by ApproachTarget
    IntervalTimer m_lastEnemyCheck;

    // Statistics window
    ControllerStats m_stats;
    IntervalTimer m_statsTimer;

    std::string m_statusMessage = "Waiting to begin...";
};

} // namespace Bot
} // namespace Wayfarer
