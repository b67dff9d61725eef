#pragma once

#include "SensingPort.hpp"

namespace Wayfarer {
namespace Bot {

/**
 * @brief Player combat commands
 */
class ICombatPort {
public:
    virtual ~ICombatPort() = default;

    /** @brief Select an entity as the current target */
    virtual PortResult<void> SetTarget(EntityId id) = 0;

    /** @brief Walk directly toward a target position */
    virtual PortResult<void> ApproachTarget(const Point& position) = 0;
};

} // namespace Bot
} // namespace Wayfarer
