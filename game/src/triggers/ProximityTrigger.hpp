#pragma once

#include <engine/core/Time.hpp>
#include <engine/math/Vector2.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Outcome of one proximity check
 */
enum class TriggerState : uint8_t {
    Confirmed,   // Already fired earlier; nothing to do
    OutOfRange,  // Player not within the radius
    Armed,       // First tick in range; timer started
    Waiting,     // In range, debounce not yet elapsed
    Fired        // Action fired on this tick
};

inline const char* TriggerStateToString(TriggerState state) {
    switch (state) {
        case TriggerState::Confirmed:  return "Confirmed";
        case TriggerState::OutOfRange: return "OutOfRange";
        case TriggerState::Armed:      return "Armed";
        case TriggerState::Waiting:    return "Waiting";
        case TriggerState::Fired:      return "Fired";
        default:                       return "Unknown";
    }
}

/**
 * @brief Fires a one-time action per point after sustained proximity
 *
 * The first in-range check records a timestamp; the action fires on the
 * first check at or after the debounce duration. Fired points stay
 * confirmed for the trigger's lifetime unless Clear() is called.
 */
class ProximityTrigger {
public:
    using Action = std::function<void(const Point&)>;

    static constexpr Time::Duration DEFAULT_DEBOUNCE = std::chrono::seconds(5);

    explicit ProximityTrigger(Time::Duration debounce = DEFAULT_DEBOUNCE, Action action = nullptr);

    /**
     * @brief Evaluate one tracked point
     */
    TriggerState Check(const Point& point, Time::TimePoint now,
                       const Point& playerPosition, double radius);

    void SetAction(Action action) { m_action = std::move(action); }
    void SetDebounce(Time::Duration debounce) noexcept { m_debounce = debounce; }
    [[nodiscard]] Time::Duration GetDebounce() const noexcept { return m_debounce; }

    [[nodiscard]] bool IsConfirmed(const Point& point) const;
    [[nodiscard]] bool IsArmed(const Point& point) const;
    [[nodiscard]] size_t GetConfirmedCount() const noexcept;

    /**
     * @brief Forget every point (new run)
     */
    void Clear() noexcept { m_entries.clear(); }

private:
    struct Entry {
        Point point{0.0};
        std::optional<Time::TimePoint> firstSeenAt;
        bool confirmed = false;
    };

    Entry* Find(const Point& point);
    const Entry* Find(const Point& point) const;

    std::vector<Entry> m_entries;
    Time::Duration m_debounce;
    Action m_action;
};

} // namespace Bot
} // namespace Wayfarer
