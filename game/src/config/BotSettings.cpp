#include "BotSettings.hpp"
#include <engine/config/Config.hpp>
#include <engine/core/Logger.hpp>
#include <cmath>

namespace Wayfarer {
namespace Bot {

namespace {

Time::Duration Milliseconds(double ms) {
    return std::chrono::duration_cast<Time::Duration>(std::chrono::duration<double, std::milli>(ms));
}

Time::Duration Seconds(double s) {
    return std::chrono::duration_cast<Time::Duration>(std::chrono::duration<double>(s));
}

// Negative or non-finite distances fall back to the default
double ReadDistance(const Config& config, std::string_view key, double fallback) {
    const double value = config.Get<double>(key, fallback);
    if (!std::isfinite(value) || value < 0.0) {
        BOT_LOG_WARN("Ignoring invalid value for '{}': {}", key, value);
        return fallback;
    }
    return value;
}

} // namespace

BotSettings BotSettings::FromConfig(const Config& config) {
    BotSettings settings;
    ControllerSettings& c = settings.controller;

    c.aggroRange = ReadDistance(config, "bot.aggro_range", c.aggroRange);
    c.arrivalTolerance = ReadDistance(config, "bot.arrival_tolerance", c.arrivalTolerance);
    c.earlyAdvanceDist = ReadDistance(config, "bot.early_advance_dist", c.earlyAdvanceDist);
    c.combatReachDist = ReadDistance(config, "bot.combat_reach_dist", c.combatReachDist);
    c.logActions = config.Get<bool>("bot.log_actions", c.logActions);
    c.statsInterval = Seconds(ReadDistance(config, "bot.stats_interval_seconds", 30.0));

    c.scanInterval = Milliseconds(ReadDistance(config, "scanner.interval_ms", 500.0));
    c.scanMoveRatio = ReadDistance(config, "scanner.move_threshold_ratio", c.scanMoveRatio);

    c.rallyRadius = ReadDistance(config, "rally.radius", c.rallyRadius);
    c.rallyDebounce = Seconds(ReadDistance(config, "rally.debounce_seconds", 5.0));

    settings.mission.transitionDelay = Milliseconds(ReadDistance(config, "mission.transition_delay_ms", 1000.0));
    settings.mission.setupDelay = Milliseconds(ReadDistance(config, "mission.setup_delay_ms", 5000.0));

    settings.logLevel = config.Get<std::string>("logging.level", settings.logLevel);
    settings.logFile = config.Get<std::string>("logging.file", settings.logFile);

    return settings;
}

} // namespace Bot
} // namespace Wayfarer
