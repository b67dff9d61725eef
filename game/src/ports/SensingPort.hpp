#pragma once

#include "PortError.hpp"
#include <engine/math/Vector2.hpp>
#include <cstdint>
#include <vector>

namespace Wayfarer {
namespace Bot {

using EntityId = uint32_t;
inline constexpr EntityId INVALID_ENTITY = 0;

/**
 * @brief Snapshot of a hostile entity
 */
struct HostileInfo {
    EntityId id = INVALID_ENTITY;
    Point position{0.0};
    bool alive = false;
};

/**
 * @brief World query for hostile entities
 */
class ISensingPort {
public:
    virtual ~ISensingPort() = default;

    /**
     * @brief Hostiles the collaborator considers near a position
     *
     * The result may include dead or out-of-radius entries; callers filter.
     * Array order is the collaborator's and is used to break distance ties.
     */
    virtual PortResult<std::vector<HostileInfo>> NearbyHostiles(const Point& position, double radius) = 0;

    /**
     * @brief Fresh state of one entity
     */
    virtual PortResult<HostileInfo> QueryEntity(EntityId id) = 0;
};

} // namespace Bot
} // namespace Wayfarer
