#include "PathCursor.hpp"
#include <utility>

namespace Wayfarer {
namespace Bot {

const char* CursorErrorToString(CursorError error) noexcept {
    switch (error) {
        case CursorError::Empty:      return "path is empty";
        case CursorError::OutOfRange: return "index out of range";
        default:                      return "unknown error";
    }
}

PathCursor::PathCursor(FlatPath waypoints, bool resettable)
    : m_waypoints(std::move(waypoints))
    , m_resettable(resettable)
{
}

std::optional<Point> PathCursor::Advance() {
    const size_t next = m_index ? *m_index + 1 : 0;
    if (next >= m_waypoints.size()) {
        return std::nullopt;
    }
    m_index = next;
    return m_waypoints[next];
}

std::expected<void, CursorError> PathCursor::SetIndex(size_t index) {
    if (m_waypoints.empty()) {
        return std::unexpected(CursorError::Empty);
    }
    if (index >= m_waypoints.size()) {
        return std::unexpected(CursorError::OutOfRange);
    }
    m_index = index;
    return {};
}

std::optional<Point> PathCursor::CurrentPoint() const {
    if (!m_index) {
        return std::nullopt;
    }
    return m_waypoints[*m_index];
}

bool PathCursor::IsAtEnd() const noexcept {
    return m_index && *m_index + 1 >= m_waypoints.size();
}

} // namespace Bot
} // namespace Wayfarer
