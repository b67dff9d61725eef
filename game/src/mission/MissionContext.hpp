#pragma once

#include "MapData.hpp"
#include "RunStats.hpp"
#include "config/BotSettings.hpp"
#include "ports/CombatPort.hpp"
#include "ports/MovementPort.hpp"
#include "ports/SensingPort.hpp"
#include "ports/WorldPort.hpp"

#include <optional>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Everything a mission run shares
 *
 * Built once by the host and handed to the orchestrator by reference.
 * The ports must outlive the context.
 */
struct MissionContext {
    IMovementPort& movement;
    ISensingPort& sensing;
    ICombatPort& combat;
    IWorldPort& world;

    BotSettings settings;
    std::optional<MapDefinition> map;

    bool running = false;
    bool paused = false;
    bool combatActive = false;      // Danger handler owns the player

    RunStats stats;
};

} // namespace Bot
} // namespace Wayfarer
