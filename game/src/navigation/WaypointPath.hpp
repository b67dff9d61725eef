#pragma once

#include <engine/math/Vector2.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Ordered waypoints used for traversal
 */
using FlatPath = std::vector<Point>;

/**
 * @brief Authored group of waypoints with an optional rally point
 *
 * An empty path contributes no waypoints but may still carry a rally point.
 * A missing path (nullopt) means the authored entry had no usable path
 * field; flattening reports it and skips it.
 */
struct PathSegment {
    std::optional<std::vector<Point>> path;
    std::optional<Point> rally;
};

/**
 * @brief Path as authored: either one flat list or a list of segments
 */
using RawPath = std::variant<std::vector<Point>, std::vector<PathSegment>>;

/**
 * @brief Non-fatal data problem found while reading or merging a path
 */
struct PathWarning {
    std::optional<size_t> segmentIndex;
    std::string message;
};

/**
 * @brief Result of merging a RawPath
 */
struct FlattenResult {
    FlatPath waypoints;
    std::vector<Point> rallyPoints;
    std::vector<PathWarning> warnings;
};

/**
 * @brief Merge a raw path into traversal order
 *
 * Flat lists are returned verbatim with no rally points. Segmented paths
 * are concatenated in order; each present rally point is collected in
 * segment order.
 */
[[nodiscard]] FlattenResult Flatten(const RawPath& raw);

[[nodiscard]] bool IsSegmented(const RawPath& raw) noexcept;

/**
 * @brief Number of authored segments (a non-empty flat list counts as one)
 */
[[nodiscard]] size_t SegmentCount(const RawPath& raw) noexcept;

/**
 * @brief Flat index of the first waypoint of a segment
 *
 * Sum of the point counts of all segments before segmentIndex. Always 0
 * for flat paths. Indices past the end yield the total waypoint count.
 */
[[nodiscard]] size_t SegmentBaseIndex(const RawPath& raw, size_t segmentIndex) noexcept;

/**
 * @brief Distance between two consecutive waypoints
 */
struct PathLeg {
    size_t index = 0;
    Point from{0.0};
    Point to{0.0};
    double distance = 0.0;
};

/**
 * @brief Leg-by-leg length of a flat path
 *
 * The longest and shortest legs flag misplaced waypoints. On ties the
 * earliest leg wins. Both are empty when the path has fewer than two points.
 */
struct PathLengthReport {
    size_t waypointCount = 0;
    double totalDistance = 0.0;
    std::vector<PathLeg> legs;
    std::optional<PathLeg> longestLeg;
    std::optional<PathLeg> shortestLeg;
    double averageLeg = 0.0;
};

[[nodiscard]] PathLengthReport ComputePathLength(const FlatPath& path);

} // namespace Bot
} // namespace Wayfarer
