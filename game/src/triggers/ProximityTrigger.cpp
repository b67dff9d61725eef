#include "ProximityTrigger.hpp"
#include <engine/core/Logger.hpp>
#include <algorithm>

namespace Wayfarer {
namespace Bot {

ProximityTrigger::ProximityTrigger(Time::Duration debounce, Action action)
    : m_debounce(debounce)
    , m_action(std::move(action))
{
}

TriggerState ProximityTrigger::Check(const Point& point, Time::TimePoint now,
                                     const Point& playerPosition, double radius) {
    Entry* entry = Find(point);
    if (entry && entry->confirmed) {
        return TriggerState::Confirmed;
    }

    if (Distance(playerPosition, point) >= radius) {
        return TriggerState::OutOfRange;
    }

    if (!entry) {
        m_entries.push_back({point, now, false});
        return TriggerState::Armed;
    }

    if (!entry->firstSeenAt) {
        entry->firstSeenAt = now;
        return TriggerState::Armed;
    }

    if (now - *entry->firstSeenAt < m_debounce) {
        return TriggerState::Waiting;
    }

    entry->confirmed = true;
    BOT_LOG_INFO("Proximity trigger fired at ({:.0f}, {:.0f})", point.x, point.y);
    if (m_action) {
        m_action(point);
    }
    return TriggerState::Fired;
}

bool ProximityTrigger::IsConfirmed(const Point& point) const {
    const Entry* entry = Find(point);
    return entry && entry->confirmed;
}

bool ProximityTrigger::IsArmed(const Point& point) const {
    const Entry* entry = Find(point);
    return entry && !entry->confirmed && entry->firstSeenAt.has_value();
}

size_t ProximityTrigger::GetConfirmedCount() const noexcept {
    return static_cast<size_t>(std::count_if(m_entries.begin(), m_entries.end(),
                                             [](const Entry& e) { return e.confirmed; }));
}

ProximityTrigger::Entry* ProximityTrigger::Find(const Point& point) {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&point](const Entry& e) { return e.point == point; });
    return it != m_entries.end() ? &*it : nullptr;
}

const ProximityTrigger::Entry* ProximityTrigger::Find(const Point& point) const {
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&point](const Entry& e) { return e.point == point; });
    return it != m_entries.end() ? &*it : nullptr;
}

} // namespace Bot
} // namespace Wayfarer
