#pragma once

#include <engine/core/Time.hpp>
#include <string>

namespace Wayfarer {
class Config;
}

namespace Wayfarer {
namespace Bot {

/**
 * @brief Tunables of the path-and-combat controller
 */
struct ControllerSettings {
    static constexpr double ARRIVAL_TOLERANCE = 250.0;

    double aggroRange = 2500.0;
    double arrivalTolerance = ARRIVAL_TOLERANCE;
    double earlyAdvanceDist = ARRIVAL_TOLERANCE * 1.5;   // Fluid advance when the path is clear
    double combatReachDist = 312.0;                      // Waypoint counts as reached while fighting
    bool logActions = false;
    Time::Duration statsInterval = std::chrono::seconds(30);

    // Hostile query gate
    double scanMoveRatio = 0.75;                         // Of aggroRange
    Time::Duration scanInterval = std::chrono::milliseconds(500);

    // Rally point debounce
    double rallyRadius = 2500.0;
    Time::Duration rallyDebounce = std::chrono::seconds(5);
};

/**
 * @brief Tunables of the mission flow
 */
struct MissionSettings {
    Time::Duration transitionDelay = std::chrono::milliseconds(1000);
    Time::Duration setupDelay = std::chrono::milliseconds(5000);
};

/**
 * @brief Everything the bot reads from configuration
 */
struct BotSettings {
    ControllerSettings controller;
    MissionSettings mission;
    std::string logLevel = "info";
    std::string logFile;

    /**
     * @brief Read settings, falling back to defaults for absent or mistyped keys
     */
    static BotSettings FromConfig(const Config& config);
};

} // namespace Bot
} // namespace Wayfarer
