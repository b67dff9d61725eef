#pragma once

#include "WaypointPath.hpp"
#include <expected>
#include <optional>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Error types for explicit cursor positioning
 */
enum class CursorError {
    Empty,
    OutOfRange
};

[[nodiscard]] const char* CursorErrorToString(CursorError error) noexcept;

/**
 * @brief Position within a flat path
 *
 * The index is empty before the first Advance(); afterwards it names the
 * waypoint most recently handed out. Repeated Advance() calls visit
 * 0, 1, ..., size - 1 exactly once each.
 */
class PathCursor {
public:
    PathCursor() = default;
    explicit PathCursor(FlatPath waypoints, bool resettable = true);

    /**
     * @brief Move to the next waypoint
     * @return The new current waypoint, or nullopt when the path is exhausted
     */
    std::optional<Point> Advance();

    /**
     * @brief Rewind to "before the first waypoint"
     */
    void Reset() noexcept { m_index.reset(); }

    /**
     * @brief Position the cursor on an explicit waypoint
     */
    std::expected<void, CursorError> SetIndex(size_t index);

    [[nodiscard]] std::optional<size_t> CurrentIndex() const noexcept { return m_index; }
    [[nodiscard]] std::optional<Point> CurrentPoint() const;

    /**
     * @brief True when the current waypoint is the last one
     */
    [[nodiscard]] bool IsAtEnd() const noexcept;

    /**
     * @brief Whether the owner may rewind and retry after exhaustion
     */
    [[nodiscard]] bool SupportsReset() const noexcept { return m_resettable; }

    [[nodiscard]] const FlatPath& GetWaypoints() const noexcept { return m_waypoints; }
    [[nodiscard]] size_t Size() const noexcept { return m_waypoints.size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_waypoints.empty(); }

private:
    FlatPath m_waypoints;
    std::optional<size_t> m_index;
    bool m_resettable = true;
};

} // namespace Bot
} // namespace Wayfarer
