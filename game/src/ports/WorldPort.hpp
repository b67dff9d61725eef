#pragma once

#include "PortError.hpp"
#include <cstdint>

namespace Wayfarer {
namespace Bot {

using LocationId = int32_t;

/**
 * @brief Mission-level world state and commands
 */
class IWorldPort {
public:
    virtual ~IWorldPort() = default;

    /** @brief Request travel to a start location */
    virtual PortResult<void> TravelTo(LocationId location) = 0;

    [[nodiscard]] virtual bool IsAt(LocationId location) const = 0;
    [[nodiscard]] virtual bool IsLoading() const = 0;

    /** @brief True once the player is inside the destination zone */
    [[nodiscard]] virtual bool IsInDestinationZone() const = 0;

    /** @brief Hostiles are engaging the player */
    [[nodiscard]] virtual bool InDanger() const = 0;

    /** @brief An external routine (looting, dialogs) owns the player */
    [[nodiscard]] virtual bool IsBusy() const = 0;

    /** @brief Trigger the one-shot setup action (buff, blessing) */
    virtual PortResult<void> RequestSetupAction() = 0;

    /** @brief Setup action done, or impossible at this location */
    [[nodiscard]] virtual bool SetupActionSatisfied() const = 0;
};

} // namespace Bot
} // namespace Wayfarer
