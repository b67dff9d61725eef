#include "SimulatedWorld.hpp"
#include <engine/core/Logger.hpp>
#include <algorithm>

namespace Wayfarer {
namespace Bot {

SimulatedWorld::SimulatedWorld(SimulationSettings settings, LocationId location, Point playerPosition)
    : m_settings(settings)
    , m_location(location)
    , m_player(playerPosition)
{
    m_zoneSpawns[location] = playerPosition;
}

void SimulatedWorld::AddZone(LocationId id, Point spawn) {
    m_zoneSpawns[id] = spawn;
}

void SimulatedWorld::AddPortal(LocationId from, Point position, double radius, LocationId to) {
    m_portals.push_back({from, position, radius, to});
}

EntityId SimulatedWorld::SpawnHostile(Point position) {
    SimHostile hostile;
    hostile.id = m_nextId++;
    hostile.position = position;
    m_hostiles.push_back(hostile);
    return hostile.id;
}

size_t SimulatedWorld::GetAliveHostileCount() const noexcept {
    return static_cast<size_t>(std::count_if(m_hostiles.begin(), m_hostiles.end(),
        [](const SimHostile& h) { return h.alive; }));
}

// ============================================================================
// Simulation step
// ============================================================================

void SimulatedWorld::Step(Time::TimePoint now) {
    const Time::Duration dt = m_lastStep ? now - *m_lastStep : Time::Duration{0};
    m_lastStep = now;

    if (m_pendingZone) {
        if (now - m_loadingStarted >= m_settings.loadTime) {
            m_location = *m_pendingZone;
            m_pendingZone.reset();
            m_player = m_zoneSpawns[m_location];
            BOT_LOG_DEBUG("[Sim] entered zone {}", m_location);
        }
        return;
    }

    const double maxStep = m_settings.playerSpeed * std::chrono::duration_cast<Time::Seconds>(dt).count();

    if (m_approachTarget) {
        MovePlayer(*m_approachTarget, maxStep, m_settings.engageRange * 0.5);
    } else if (m_following && !m_movementPaused && m_moveTarget) {
        MovePlayer(*m_moveTarget, maxStep, 0.0);
        if (Distance(m_player, *m_moveTarget) <= m_settings.arrivalEpsilon) {
            m_player = *m_moveTarget;
            m_moveTarget.reset();
            m_following = false;
            m_arrived = true;
        }
    }

    UpdateCombat(dt);
    CheckPortals();
}

void SimulatedWorld::MovePlayer(const Point& target, double maxStep, double stopDistance) {
    const double distance = Distance(m_player, target);
    const double travel = std::min(maxStep, distance - stopDistance);
    if (travel <= 0.0 || distance <= 0.0) {
        return;
    }
    m_player += (target - m_player) * (travel / distance);
}

void SimulatedWorld::UpdateCombat(Time::Duration dt) {
    if (!m_selectedTarget) {
        return;
    }

    SimHostile* hostile = FindHostile(*m_selectedTarget);
    if (!hostile || !hostile->alive) {
        m_selectedTarget.reset();
        return;
    }

    if (Distance(m_player, hostile->position) <= m_settings.engageRange) {
        hostile->engaged += dt;
        if (hostile->engaged >= m_settings.killTime) {
            hostile->alive = false;
            m_selectedTarget.reset();
            m_approachTarget.reset();
            BOT_LOG_DEBUG("[Sim] hostile {} died", hostile->id);
        }
    }
}

void SimulatedWorld::CheckPortals() {
    for (const Portal& portal : m_portals) {
        if (portal.from == m_location && Distance(m_player, portal.position) <= portal.radius) {
            BeginLoading(portal.to);
            return;
        }
    }
}

void SimulatedWorld::BeginLoading(LocationId zone) {
    m_pendingZone = zone;
    m_loadingStarted = m_lastStep.value_or(Time::TimePoint{});
    m_moveTarget.reset();
    m_approachTarget.reset();
    m_selectedTarget.reset();
    m_following = false;
    m_setupDone = false;
}

SimHostile* SimulatedWorld::FindHostile(EntityId id) {
    auto it = std::find_if(m_hostiles.begin(), m_hostiles.end(),
                           [id](const SimHostile& h) { return h.id == id; });
    return it != m_hostiles.end() ? &*it : nullptr;
}

// ============================================================================
// IMovementPort
// ============================================================================

PortResult<void> SimulatedWorld::MoveTo(const Point& point) {
    if (m_failMoves > 0) {
        --m_failMoves;
        return std::unexpected(PortError::Rejected);
    }
    if (IsLoading()) {
        return std::unexpected(PortError::Unavailable);
    }

    m_moveTarget = point;
    m_approachTarget.reset();
    m_following = true;
    m_arrived = false;
    ++m_moveCommands;
    return {};
}

void SimulatedWorld::StopFollowing() {
    m_moveTarget.reset();
    m_following = false;
}

void SimulatedWorld::Reset() {
    m_moveTarget.reset();
    m_approachTarget.reset();
    m_following = false;
    m_arrived = false;
}

// ============================================================================
// ISensingPort
// ============================================================================

PortResult<std::vector<HostileInfo>> SimulatedWorld::NearbyHostiles(const Point& position, double radius) {
    ++m_hostileQueries;
    if (!m_sensingAvailable || IsLoading()) {
        return std::unexpected(PortError::Unavailable);
    }

    std::vector<HostileInfo> result;
    for (const SimHostile& hostile : m_hostiles) {
        if (Distance(position, hostile.position) <= radius) {
            result.push_back({hostile.id, hostile.position, hostile.alive});
        }
    }
    return result;
}

PortResult<HostileInfo> SimulatedWorld::QueryEntity(EntityId id) {
    if (!m_sensingAvailable) {
        return std::unexpected(PortError::Unavailable);
    }
    const SimHostile* hostile = FindHostile(id);
    if (!hostile) {
        return std::unexpected(PortError::InvalidEntity);
    }
    return HostileInfo{hostile->id, hostile->position, hostile->alive};
}

// ============================================================================
// ICombatPort
// ============================================================================

PortResult<void> SimulatedWorld::SetTarget(EntityId id) {
    const SimHostile* hostile = FindHostile(id);
    if (!hostile || !hostile->alive) {
        return std::unexpected(PortError::InvalidEntity);
    }
    m_selectedTarget = id;
    ++m_setTargetCalls;
    return {};
}

PortResult<void> SimulatedWorld::ApproachTarget(const Point& position) {
    if (IsLoading()) {
        return std::unexpected(PortError::Unavailable);
    }
    m_approachTarget = position;
    ++m_approachCalls;
    return {};
}

// ============================================================================
// IWorldPort
// ============================================================================

PortResult<void> SimulatedWorld::TravelTo(LocationId location) {
    ++m_travelRequests;
    if (IsLoading()) {
        return std::unexpected(PortError::Unavailable);
    }
    if (!m_zoneSpawns.contains(location)) {
        return std::unexpected(PortError::Rejected);
    }
    if (location != m_location) {
        BeginLoading(location);
    }
    return {};
}

bool SimulatedWorld::IsAt(LocationId location) const {
    return !IsLoading() && m_location == location;
}

bool SimulatedWorld::IsInDestinationZone() const {
    return !IsLoading() && m_location == m_destinationZone;
}

PortResult<void> SimulatedWorld::RequestSetupAction() {
    ++m_setupRequests;
    if (!m_settings.setupAvailable) {
        return std::unexpected(PortError::Rejected);
    }
    if (IsLoading()) {
        return std::unexpected(PortError::Unavailable);
    }
    m_setupDone = true;
    return {};
}

bool SimulatedWorld::SetupActionSatisfied() const {
    return m_setupDone || !m_settings.setupAvailable;
}

} // namespace Bot
} // namespace Wayfarer
