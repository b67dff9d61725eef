#pragma once

#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace Wayfarer {

/**
 * @brief 2D world position (double precision)
 */
using Point = glm::dvec2;

/**
 * @brief Integer grid position used to compare commanded destinations
 */
using GridPoint = glm::ivec2;

/**
 * @brief Euclidean distance between two points
 */
[[nodiscard]] inline double Distance(const Point& a, const Point& b) {
    return glm::distance(a, b);
}

[[nodiscard]] inline double DistanceSquared(const Point& a, const Point& b) {
    const Point d = a - b;
    return glm::dot(d, d);
}

[[nodiscard]] inline bool IsFinite(const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

/**
 * @brief Truncate toward zero, saturating at the int32 limits. NaN maps to 0.
 */
[[nodiscard]] inline int32_t TruncateToInt32(double value) {
    if (std::isnan(value)) {
        return 0;
    }
    constexpr double lo = static_cast<double>(std::numeric_limits<int32_t>::min());
    constexpr double hi = static_cast<double>(std::numeric_limits<int32_t>::max());
    return static_cast<int32_t>(std::clamp(std::trunc(value), lo, hi));
}

/**
 * @brief Truncate toward zero on both axes
 */
[[nodiscard]] inline GridPoint RoundToGrid(const Point& p) {
    return GridPoint(TruncateToInt32(p.x), TruncateToInt32(p.y));
}

/**
 * @brief Clamp a signed index into [0, size - 1]. Size must be non-zero.
 */
[[nodiscard]] inline size_t ClampIndex(std::int64_t index, size_t size) {
    const auto last = static_cast<std::int64_t>(size) - 1;
    return static_cast<size_t>(std::clamp<std::int64_t>(index, 0, std::max<std::int64_t>(last, 0)));
}

} // namespace Wayfarer
