#pragma once

#include "PortError.hpp"
#include <engine/math/Vector2.hpp>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Motion driver that walks the player toward a commanded point
 *
 * MoveTo() is a non-blocking command; progress is observed through
 * IsFollowing() on later ticks.
 */
class IMovementPort {
public:
    virtual ~IMovementPort() = default;

    /** @brief Start following toward a point */
    virtual PortResult<void> MoveTo(const Point& point) = 0;

    /** @brief True while a commanded move is in progress */
    [[nodiscard]] virtual bool IsFollowing() const = 0;

    /** @brief Abandon the current move without clearing the arrived flag */
    virtual void StopFollowing() = 0;

    [[nodiscard]] virtual bool IsArrived() const = 0;
    virtual void SetArrived(bool arrived) = 0;

    /** @brief Drop any pending move and clear both flags */
    virtual void Reset() = 0;

    virtual void Pause() = 0;
    virtual void Resume() = 0;
    [[nodiscard]] virtual bool IsPaused() const = 0;

    /** @brief Per-frame housekeeping of the driver */
    virtual void Update() = 0;
};

} // namespace Bot
} // namespace Wayfarer
