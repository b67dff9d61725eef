#include "WaypointPath.hpp"
#include <engine/core/Logger.hpp>
#include <algorithm>

namespace Wayfarer {
namespace Bot {

FlattenResult Flatten(const RawPath& raw) {
    FlattenResult result;

    if (const auto* flat = std::get_if<std::vector<Point>>(&raw)) {
        result.waypoints = *flat;
        return result;
    }

    const auto& segments = std::get<std::vector<PathSegment>>(raw);
    for (size_t i = 0; i < segments.size(); ++i) {
        const PathSegment& segment = segments[i];

        if (segment.path) {
            result.waypoints.insert(result.waypoints.end(),
                                    segment.path->begin(), segment.path->end());
        } else {
            result.warnings.push_back({i, "segment has no usable path; skipped"});
            BOT_LOG_WARN("Path segment {} has no usable path; contributing no waypoints", i);
        }

        if (segment.rally) {
            result.rallyPoints.push_back(*segment.rally);
        }
    }

    return result;
}

bool IsSegmented(const RawPath& raw) noexcept {
    return std::holds_alternative<std::vector<PathSegment>>(raw);
}

size_t SegmentCount(const RawPath& raw) noexcept {
    if (const auto* flat = std::get_if<std::vector<Point>>(&raw)) {
        return flat->empty() ? 0 : 1;
    }
    return std::get<std::vector<PathSegment>>(raw).size();
}

size_t SegmentBaseIndex(const RawPath& raw, size_t segmentIndex) noexcept {
    const auto* segments = std::get_if<std::vector<PathSegment>>(&raw);
    if (!segments) {
        return 0;
    }

    size_t total = 0;
    const size_t end = std::min(segmentIndex, segments->size());
    for (size_t k = 0; k < end; ++k) {
        if ((*segments)[k].path) {
            total += (*segments)[k].path->size();
        }
    }
    return total;
}

PathLengthReport ComputePathLength(const FlatPath& path) {
    PathLengthReport report;
    report.waypointCount = path.size();

    for (size_t i = 1; i < path.size(); ++i) {
        PathLeg leg;
        leg.index = i - 1;
        leg.from = path[i - 1];
        leg.to = path[i];
        leg.distance = Distance(leg.from, leg.to);
        report.totalDistance += leg.distance;
        if (!report.longestLeg || leg.distance > report.longestLeg->distance) {
            report.longestLeg = leg;
        }
        if (!report.shortestLeg || leg.distance < report.shortestLeg->distance) {
            report.shortestLeg = leg;
        }
        report.legs.push_back(leg);
    }

    if (!report.legs.empty()) {
        report.averageLeg = report.totalDistance / static_cast<double>(report.legs.size());
    }
    return report;
}

} // namespace Bot
} // namespace Wayfarer
