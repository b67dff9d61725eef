#pragma once

#include "navigation/WaypointPath.hpp"
#include "ports/WorldPort.hpp"

#include <nlohmann/json.hpp>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Error types for map file loading
 */
enum class MapLoadError {
    FileNotFound,
    ParseError,
    InvalidFormat
};

/**
 * @brief Get error description string
 */
[[nodiscard]] const char* MapLoadErrorToString(MapLoadError error) noexcept;

/**
 * @brief Location identifiers attached to a map
 */
struct MapIds {
    LocationId startLocationId = 0;      // "outpost_id"
    LocationId destinationZoneId = 0;    // "map_id"
};

/**
 * @brief One authored map: explorable path, outpost path and ids
 */
struct MapDefinition {
    std::string name;
    RawPath rawPath;
    FlatPath outpostPath;
    MapIds ids;
    std::vector<PathWarning> warnings;
};

/**
 * @brief RawPath read from JSON plus entries that had to be skipped
 */
struct RawPathParse {
    RawPath path;
    std::vector<PathWarning> warnings;
};

/**
 * @brief Read a raw path from JSON
 *
 * Accepts a flat list of [x, y] pairs or a list of segment objects
 * ({"path": [...], "rally": [x, y]}; "bless" is accepted for "rally").
 * Entries that are not numeric pairs are skipped with a warning. A segment
 * whose path is missing or not a list keeps its rally point and is left
 * without a path, which Flatten() reports.
 */
[[nodiscard]] RawPathParse ParseRawPath(const nlohmann::json& json);

/**
 * @brief Build a map definition from a parsed JSON document
 * @param name Display name (usually the file stem)
 */
[[nodiscard]] std::expected<MapDefinition, MapLoadError> ParseMapDefinition(
    const nlohmann::json& json, std::string name = "");

/**
 * @brief Load and parse a map file
 */
[[nodiscard]] std::expected<MapDefinition, MapLoadError> LoadMapDefinition(
    const std::filesystem::path& filepath);

/**
 * @brief Summary shown when a map is selected
 */
struct MapStats {
    size_t segmentCount = 0;
    std::vector<size_t> segmentWaypointCounts;
    size_t explorableWaypointCount = 0;
    size_t outpostWaypointCount = 0;
    size_t rallyCount = 0;
    std::vector<GridPoint> rallyPreview;     // First few rally points

    static constexpr size_t RALLY_PREVIEW_COUNT = 5;
};

[[nodiscard]] MapStats ComputeMapStats(const MapDefinition& map);

} // namespace Bot
} // namespace Wayfarer
