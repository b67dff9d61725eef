#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include <engine/config/Config.hpp>
#include <engine/core/Logger.hpp>

#include "mission/MissionOrchestrator.hpp"
#include "sim/SimulatedWorld.hpp"

namespace {

constexpr Wayfarer::Bot::LocationId TOWN_ZONE = -1;

/**
 * @brief Parse command line arguments
 */
struct CommandLineArgs {
    std::string mapPath;
    std::string configPath;
    std::string logLevel;
    int tickBudget = 20000;
    int tickMs = 100;
    int hostileEvery = 5;
    bool showHelp = false;

    static CommandLineArgs Parse(int argc, char* argv[]) {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.showHelp = true;
            } else if (arg == "-t" || arg == "--ticks") {
                if (i + 1 < argc) {
                    args.tickBudget = std::atoi(argv[++i]);
                }
            } else if (arg == "--tick-ms") {
                if (i + 1 < argc) {
                    args.tickMs = std::atoi(argv[++i]);
                }
            } else if (arg == "--hostile-every") {
                if (i + 1 < argc) {
                    args.hostileEvery = std::atoi(argv[++i]);
                }
            } else if (arg == "-v" || arg == "--log-level") {
                if (i + 1 < argc) {
                    args.logLevel = argv[++i];
                }
            } else if (args.mapPath.empty()) {
                args.mapPath = arg;
            } else if (args.configPath.empty()) {
                args.configPath = arg;
            }
        }

        return args;
    }

    static void PrintHelp() {
        std::cout << "wayfarer_sim - run a waypoint mission against a simulated world\n";
        std::cout << "==============================================================\n\n";
        std::cout << "Usage: wayfarer_sim <map.json> [config.json] [options]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -h, --help              Show this help message\n";
        std::cout << "  -t, --ticks N           Tick budget before giving up (default 20000)\n";
        std::cout << "      --tick-ms N         Simulated milliseconds per tick (default 100)\n";
        std::cout << "      --hostile-every N   Spawn a hostile near every Nth waypoint (0 = none)\n";
        std::cout << "  -v, --log-level LEVEL   Override logging.level\n";
    }
};

/**
 * @brief Lay out zones, portal and hostiles around the map's paths
 */
void PopulateWorld(Wayfarer::Bot::SimulatedWorld& world,
                   const Wayfarer::Bot::MapDefinition& map,
                   int hostileEvery) {
    using namespace Wayfarer;
    using namespace Wayfarer::Bot;

    const FlatPath explorable = Flatten(map.rawPath).waypoints;
    const Point outpostSpawn = map.outpostPath.empty() ? Point(0.0) : map.outpostPath.front();
    const Point zoneSpawn = explorable.empty() ? Point(0.0) : explorable.front();

    world.AddZone(map.ids.startLocationId, outpostSpawn);
    world.AddZone(map.ids.destinationZoneId, zoneSpawn);
    world.SetDestinationZone(map.ids.destinationZoneId);

    const Point portal = map.outpostPath.empty() ? outpostSpawn : map.outpostPath.back();
    world.AddPortal(map.ids.startLocationId, portal, 150.0, map.ids.destinationZoneId);

    if (hostileEvery <= 0) {
        return;
    }
    for (size_t i = static_cast<size_t>(hostileEvery); i < explorable.size(); i += static_cast<size_t>(hostileEvery)) {
        world.SpawnHostile(explorable[i] + Point(600.0, 300.0));
    }
}

} // namespace

/**
 * @brief Main entry point for the mission simulator
 */
int main(int argc, char* argv[]) {
    using namespace Wayfarer;
    using namespace Wayfarer::Bot;

    auto args = CommandLineArgs::Parse(argc, argv);

    if (args.showHelp || args.mapPath.empty()) {
        CommandLineArgs::PrintHelp();
        return args.showHelp ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    // Configuration
    Config config;
    if (!args.configPath.empty()) {
        if (auto loaded = config.Load(args.configPath); !loaded) {
            std::cerr << "Config '" << args.configPath << "': "
                      << ConfigErrorToString(loaded.error()) << ", using defaults\n";
        }
    }
    BotSettings settings = BotSettings::FromConfig(config);
    if (!args.logLevel.empty()) {
        settings.logLevel = args.logLevel;
    }

    Logger::Initialize(settings.logFile);
    Logger::SetLevel(Logger::ParseLevel(settings.logLevel));

    BOT_LOG_INFO("[Wayfarer] simulator starting");

    // Map
    auto map = LoadMapDefinition(args.mapPath);
    if (!map) {
        BOT_LOG_ERROR("[Wayfarer] cannot load map '{}': {}", args.mapPath, MapLoadErrorToString(map.error()));
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    const PathLengthReport length = ComputePathLength(Flatten(map->rawPath).waypoints);
    if (length.longestLeg) {
        BOT_LOG_INFO("[Wayfarer] path length {:.0f} over {} legs (avg {:.0f}, longest {:.0f} at leg {})",
                     length.totalDistance, length.legs.size(), length.averageLeg,
                     length.longestLeg->distance, length.longestLeg->index + 1);
    }

    // World
    SimulatedWorld world(SimulationSettings{}, TOWN_ZONE, Point(0.0));
    PopulateWorld(world, *map, args.hostileEvery);

    MissionContext context{world, world, world, world, settings};
    MissionOrchestrator mission(context);
    if (!mission.LoadMap(std::move(*map))) {
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    Time::TimePoint now = Time::Clock::now();
    const Time::Duration tick = std::chrono::milliseconds(args.tickMs);

    world.Step(now);
    if (!mission.Start(now)) {
        Logger::Shutdown();
        return EXIT_FAILURE;
    }

    // Main loop
    std::string lastStatus;
    int ticks = 0;
    for (; ticks < args.tickBudget && mission.IsRunning(); ++ticks) {
        now += tick;
        world.Step(now);
        mission.Update(now, world.GetPlayerPosition());

        std::string status = mission.GetStatusLine();
        if (status != lastStatus) {
            BOT_LOG_INFO("[{:>6}] {}", ticks, status);
            lastStatus = std::move(status);
        }
    }

    const RunStats& stats = context.stats;
    const bool completed = stats.GetRunsCompleted() > 0;
    if (!completed) {
        mission.Stop(now);
        BOT_LOG_WARN("[Wayfarer] tick budget of {} exhausted", args.tickBudget);
    }

    BOT_LOG_INFO("[Wayfarer] {} after {} ticks ({:.1f}s simulated), {} hostiles left, {} setup requests",
                 completed ? "run completed" : "run incomplete",
                 ticks, stats.GetSessionSeconds(now),
                 world.GetAliveHostileCount(), world.GetSetupRequestCount());

    Logger::Shutdown();
    return completed ? EXIT_SUCCESS : EXIT_FAILURE;
}
