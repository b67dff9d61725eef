#pragma once

#include <expected>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Failures reported by external collaborators
 */
enum class PortError {
    Unavailable,    // Collaborator not ready (loading screen, no player)
    InvalidEntity,  // Entity id unknown or despawned
    Rejected,       // Command refused by the collaborator
    Timeout
};

/**
 * @brief Get error description string
 */
[[nodiscard]] inline const char* PortErrorToString(PortError error) noexcept {
    switch (error) {
        case PortError::Unavailable:   return "unavailable";
        case PortError::InvalidEntity: return "invalid entity";
        case PortError::Rejected:      return "rejected";
        case PortError::Timeout:       return "timeout";
        default:                       return "unknown";
    }
}

template<typename T>
using PortResult = std::expected<T, PortError>;

} // namespace Bot
} // namespace Wayfarer
