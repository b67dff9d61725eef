#include "MapData.hpp"
#include <engine/core/Logger.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <fstream>

namespace Wayfarer {
namespace Bot {

const char* MapLoadErrorToString(MapLoadError error) noexcept {
    switch (error) {
        case MapLoadError::FileNotFound:  return "File not found";
        case MapLoadError::ParseError:    return "JSON parse error";
        case MapLoadError::InvalidFormat: return "Invalid map format";
        default:                          return "Unknown error";
    }
}

namespace {

std::optional<Point> ParsePoint(const nlohmann::json& json) {
    if (!json.is_array() || json.size() != 2 || !json[0].is_number() || !json[1].is_number()) {
        return std::nullopt;
    }
    return Point(json[0].get<double>(), json[1].get<double>());
}

std::vector<Point> ParsePointList(const nlohmann::json& json,
                                  std::optional<size_t> segmentIndex,
                                  std::vector<PathWarning>& warnings) {
    std::vector<Point> points;
    points.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
        if (auto point = ParsePoint(json[i])) {
            points.push_back(*point);
        } else {
            warnings.push_back({segmentIndex,
                fmt::format("Skipping entry {}: expected [x, y], got {}", i, json[i].dump())});
        }
    }
    return points;
}

std::optional<Point> ParseRally(const nlohmann::json& segment, size_t index,
                                std::vector<PathWarning>& warnings) {
    for (const char* key : {"rally", "bless"}) {
        if (!segment.contains(key)) {
            continue;
        }
        if (auto point = ParsePoint(segment[key])) {
            return point;
        }
        warnings.push_back({index, fmt::format("Ignoring malformed '{}' point", key)});
        return std::nullopt;
    }
    return std::nullopt;
}

LocationId ReadId(const nlohmann::json& ids, const char* key, std::vector<PathWarning>& warnings) {
    if (ids.is_object() && ids.contains(key) && ids[key].is_number_integer()) {
        return ids[key].get<LocationId>();
    }
    warnings.push_back({std::nullopt, fmt::format("Missing or invalid ids.{}, using 0", key)});
    return 0;
}

} // namespace

RawPathParse ParseRawPath(const nlohmann::json& json) {
    RawPathParse result;
    if (!json.is_array()) {
        result.path = std::vector<Point>{};
        result.warnings.push_back({std::nullopt, "Path is not a list"});
        return result;
    }

    const bool segmented = !json.empty() &&
        std::all_of(json.begin(), json.end(), [](const nlohmann::json& e) { return e.is_object(); });

    if (!segmented) {
        result.path = ParsePointList(json, std::nullopt, result.warnings);
        return result;
    }

    std::vector<PathSegment> segments;
    segments.reserve(json.size());
    for (size_t i = 0; i < json.size(); ++i) {
        const nlohmann::json& entry = json[i];
        PathSegment segment;
        // A missing or non-list path is left empty; flattening reports it
        if (entry.contains("path") && entry["path"].is_array()) {
            segment.path = ParsePointList(entry["path"], i, result.warnings);
        }
        segment.rally = ParseRally(entry, i, result.warnings);
        segments.push_back(std::move(segment));
    }
    result.path = std::move(segments);
    return result;
}

std::expected<MapDefinition, MapLoadError> ParseMapDefinition(const nlohmann::json& json, std::string name) {
    if (!json.is_object()) {
        BOT_LOG_ERROR("Map '{}': document is not an object", name);
        return std::unexpected(MapLoadError::InvalidFormat);
    }
    if (!json.contains("map_path") || !json["map_path"].is_array()) {
        BOT_LOG_ERROR("Map '{}': missing 'map_path' list", name);
        return std::unexpected(MapLoadError::InvalidFormat);
    }

    MapDefinition map;
    map.name = std::move(name);

    RawPathParse parsed = ParseRawPath(json["map_path"]);
    map.rawPath = std::move(parsed.path);
    map.warnings = std::move(parsed.warnings);

    if (json.contains("outpost_path")) {
        const nlohmann::json& outpost = json["outpost_path"];
        if (outpost.is_array()) {
            map.outpostPath = ParsePointList(outpost, std::nullopt, map.warnings);
        } else {
            map.warnings.push_back({std::nullopt, "'outpost_path' is not a list, ignoring it"});
        }
    }

    const nlohmann::json ids = json.value("ids", nlohmann::json::object());
    map.ids.startLocationId = ReadId(ids, "outpost_id", map.warnings);
    map.ids.destinationZoneId = ReadId(ids, "map_id", map.warnings);

    for (const PathWarning& warning : map.warnings) {
        if (warning.segmentIndex) {
            BOT_LOG_WARN("Map '{}' segment {}: {}", map.name, *warning.segmentIndex, warning.message);
        } else {
            BOT_LOG_WARN("Map '{}': {}", map.name, warning.message);
        }
    }

    return map;
}

std::expected<MapDefinition, MapLoadError> LoadMapDefinition(const std::filesystem::path& filepath) {
    if (!std::filesystem::exists(filepath)) {
        BOT_LOG_ERROR("Map file not found: {}", filepath.string());
        return std::unexpected(MapLoadError::FileNotFound);
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        BOT_LOG_ERROR("Could not open map file: {}", filepath.string());
        return std::unexpected(MapLoadError::FileNotFound);
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        BOT_LOG_ERROR("Failed to parse map {}: {}", filepath.string(), e.what());
        return std::unexpected(MapLoadError::ParseError);
    }

    auto map = ParseMapDefinition(json, filepath.stem().string());
    if (map) {
        const MapStats stats = ComputeMapStats(*map);
        BOT_LOG_INFO("Loaded map '{}': {} segments, {} waypoints, {} outpost waypoints, {} rally points",
                     map->name, stats.segmentCount, stats.explorableWaypointCount,
                     stats.outpostWaypointCount, stats.rallyCount);
    }
    return map;
}

MapStats ComputeMapStats(const MapDefinition& map) {
    MapStats stats;
    stats.segmentCount = SegmentCount(map.rawPath);
    stats.outpostWaypointCount = map.outpostPath.size();

    if (const auto* segments = std::get_if<std::vector<PathSegment>>(&map.rawPath)) {
        for (const PathSegment& segment : *segments) {
            stats.segmentWaypointCounts.push_back(segment.path ? segment.path->size() : 0);
        }
    } else if (const auto& flat = std::get<std::vector<Point>>(map.rawPath); !flat.empty()) {
        stats.segmentWaypointCounts.push_back(flat.size());
    }

    const FlattenResult flat = Flatten(map.rawPath);
    stats.explorableWaypointCount = flat.waypoints.size();
    stats.rallyCount = flat.rallyPoints.size();

    const size_t preview = std::min(flat.rallyPoints.size(), MapStats::RALLY_PREVIEW_COUNT);
    for (size_t i = 0; i < preview; ++i) {
        stats.rallyPreview.push_back(RoundToGrid(flat.rallyPoints[i]));
    }
    return stats;
}

} // namespace Bot
} // namespace Wayfarer
