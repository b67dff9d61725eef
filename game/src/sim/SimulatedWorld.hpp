#pragma once

#include "ports/CombatPort.hpp"
#include "ports/MovementPort.hpp"
#include "ports/SensingPort.hpp"
#include "ports/WorldPort.hpp"

#include <engine/core/Time.hpp>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Tunables of the simulated world
 */
struct SimulationSettings {
    double playerSpeed = 600.0;          // Units per second
    double arrivalEpsilon = 1.0;         // Snap distance for commanded moves
    double engageRange = 300.0;          // Approach stops this far from a hostile
    Time::Duration killTime = std::chrono::seconds(2);
    Time::Duration loadTime = std::chrono::seconds(1);
    bool setupAvailable = true;          // Whether the setup action can be performed
};

/**
 * @brief A hostile living in the simulation
 */
struct SimHostile {
    EntityId id = INVALID_ENTITY;
    Point position{0.0};
    bool alive = true;
    Time::Duration engaged{0};           // Time spent in engage range while targeted
};

/**
 * @brief In-memory world implementing every port the bot consumes
 *
 * The player walks at a fixed speed toward the commanded point. Approach
 * commands take priority over path moves. A targeted hostile dies after
 * the player spent killTime within engageRange of it. Zone changes
 * (travel and portals) go through a loading phase of loadTime.
 *
 * Time only advances through Step(); port calls never read the clock.
 */
class SimulatedWorld final : public IMovementPort,
                             public ISensingPort,
                             public ICombatPort,
                             public IWorldPort {
public:
    SimulatedWorld(SimulationSettings settings, LocationId location, Point playerPosition);

    // -------------------------------------------------------------------------
    // World setup
    // -------------------------------------------------------------------------

    /**
     * @brief Register a zone and where the player appears in it
     */
    void AddZone(LocationId id, Point spawn);

    /**
     * @brief Walking within radius of position in zone 'from' loads zone 'to'
     */
    void AddPortal(LocationId from, Point position, double radius, LocationId to);

    /**
     * @brief Zone counted as the mission's destination
     */
    void SetDestinationZone(LocationId id) noexcept { m_destinationZone = id; }

    EntityId SpawnHostile(Point position);

    void SetDanger(bool inDanger) noexcept { m_inDanger = inDanger; }
    void SetBusy(bool busy) noexcept { m_busy = busy; }

    /** @brief Make sensing calls fail with Unavailable */
    void SetSensingAvailable(bool available) noexcept { m_sensingAvailable = available; }

    /** @brief Reject the next count MoveTo commands */
    void FailNextMoves(uint32_t count) noexcept { m_failMoves = count; }

    /**
     * @brief Advance the simulation to now
     */
    void Step(Time::TimePoint now);

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    [[nodiscard]] const Point& GetPlayerPosition() const noexcept { return m_player; }
    void SetPlayerPosition(const Point& position) noexcept { m_player = position; }

    [[nodiscard]] LocationId GetLocation() const noexcept { return m_location; }
    [[nodiscard]] const std::vector<SimHostile>& GetHostiles() const noexcept { return m_hostiles; }
    [[nodiscard]] size_t GetAliveHostileCount() const noexcept;
    [[nodiscard]] std::optional<Point> GetMoveTarget() const noexcept { return m_moveTarget; }

    [[nodiscard]] uint32_t GetMoveCommandCount() const noexcept { return m_moveCommands; }
    [[nodiscard]] uint32_t GetSetTargetCount() const noexcept { return m_setTargetCalls; }
    [[nodiscard]] uint32_t GetApproachCount() const noexcept { return m_approachCalls; }
    [[nodiscard]] uint32_t GetHostileQueryCount() const noexcept { return m_hostileQueries; }
    [[nodiscard]] uint32_t GetTravelCount() const noexcept { return m_travelRequests; }
    [[nodiscard]] uint32_t GetSetupRequestCount() const noexcept { return m_setupRequests; }

    // -------------------------------------------------------------------------
    // IMovementPort
    // -------------------------------------------------------------------------

    PortResult<void> MoveTo(const Point& point) override;
    [[nodiscard]] bool IsFollowing() const override { return m_following; }
    void StopFollowing() override;
    [[nodiscard]] bool IsArrived() const override { return m_arrived; }
    void SetArrived(bool arrived) override { m_arrived = arrived; }
    void Reset() override;
    void Pause() override { m_movementPaused = true; }
    void Resume() override { m_movementPaused = false; }
    [[nodiscard]] bool IsPaused() const override { return m_movementPaused; }
    void Update() override {}

    // -------------------------------------------------------------------------
    // ISensingPort
    // -------------------------------------------------------------------------

    PortResult<std::vector<HostileInfo>> NearbyHostiles(const Point& position, double radius) override;
    PortResult<HostileInfo> QueryEntity(EntityId id) override;

    // -------------------------------------------------------------------------
    // ICombatPort
    // -------------------------------------------------------------------------

    PortResult<void> SetTarget(EntityId id) override;
    PortResult<void> ApproachTarget(const Point& position) override;

    // -------------------------------------------------------------------------
    // IWorldPort
    // -------------------------------------------------------------------------

    PortResult<void> TravelTo(LocationId location) override;
    [[nodiscard]] bool IsAt(LocationId location) const override;
    [[nodiscard]] bool IsLoading() const override { return m_pendingZone.has_value(); }
    [[nodiscard]] bool IsInDestinationZone() const override;
    [[nodiscard]] bool InDanger() const override { return m_inDanger; }
    [[nodiscard]] bool IsBusy() const override { return m_busy; }
    PortResult<void> RequestSetupAction() override;
    [[nodiscard]] bool SetupActionSatisfied() const override;

private:
    struct Portal {
        LocationId from = 0;
        Point position{0.0};
        double radius = 0.0;
        LocationId to = 0;
    };

    SimHostile* FindHostile(EntityId id);
    void BeginLoading(LocationId zone);
    void MovePlayer(const Point& target, double maxStep, double stopDistance);
    void UpdateCombat(Time::Duration dt);
    void CheckPortals();

    SimulationSettings m_settings;

    // Zones
    std::unordered_map<LocationId, Point> m_zoneSpawns;
    std::vector<Portal> m_portals;
    LocationId m_location = 0;
    LocationId m_destinationZone = 0;
    std::optional<LocationId> m_pendingZone;
    Time::TimePoint m_loadingStarted{};

    // Player and movement
    Point m_player{0.0};
    std::optional<Point> m_moveTarget;
    std::optional<Point> m_approachTarget;
    bool m_following = false;
    bool m_arrived = false;
    bool m_movementPaused = false;
    uint32_t m_failMoves = 0;

    // Hostiles
    std::vector<SimHostile> m_hostiles;
    EntityId m_nextId = 1;
    std::optional<EntityId> m_selectedTarget;

    // World flags
    bool m_inDanger = false;
    bool m_busy = false;
    bool m_sensingAvailable = true;
    bool m_setupDone = false;

    std::optional<Time::TimePoint> m_lastStep;

    // Command counters
    uint32_t m_moveCommands = 0;
    uint32_t m_setTargetCalls = 0;
    uint32_t m_approachCalls = 0;
    uint32_t m_hostileQueries = 0;
    uint32_t m_travelRequests = 0;
    uint32_t m_setupRequests = 0;
};

} // namespace Bot
} // namespace Wayfarer
