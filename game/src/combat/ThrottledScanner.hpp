#pragma once

#include "ports/SensingPort.hpp"
#include <engine/core/Time.hpp>
#include <cstdint>
#include <optional>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Gate parameters for hostile queries
 */
struct ScannerSettings {
    double aggroRange = 2500.0;
    double moveThreshold = 2500.0 * 0.75;    // Distance moved that forces a query
    Time::Duration interval = std::chrono::milliseconds(500);

    /** @brief Recommended settings for an aggro range */
    static ScannerSettings ForAggroRange(double aggroRange, double moveRatio = 0.75,
                                         Time::Duration interval = std::chrono::milliseconds(500));
};

/**
 * @brief Outcome of the most recent query that actually fired
 */
struct ScanResult {
    std::optional<HostileInfo> target;      // Nearest live hostile in range
    Point origin{0.0};                      // Player position the query ran from
    Time::TimePoint timestamp{};
    std::optional<PortError> error;         // Set when the query failed

    [[nodiscard]] bool HasTarget() const noexcept { return target.has_value(); }
    [[nodiscard]] EntityId TargetId() const noexcept { return target ? target->id : INVALID_ENTITY; }
};

/**
 * @brief Sensing wrapper that bounds query frequency
 *
 * The underlying query fires when the player has moved at least the move
 * threshold since the last query, or when the interval has elapsed.
 * Otherwise the cached result is returned unchanged. The first scan always
 * fires. A failed query caches "no hostile".
 */
class ThrottledScanner {
public:
    ThrottledScanner(ISensingPort& sensing, ScannerSettings settings);

    /**
     * @brief Gated query
     * @return The fresh result if the gate fired, else the cached one
     */
    const ScanResult& Scan(Time::TimePoint now, const Point& position);

    /**
     * @brief Make the next Scan() fire regardless of the gate
     */
    void Invalidate() noexcept { m_hasFired = false; }

    [[nodiscard]] const ScanResult& GetLastResult() const noexcept { return m_result; }
    [[nodiscard]] bool HasFired() const noexcept { return m_hasFired; }

    /** @brief Queries issued since the last counter reset */
    [[nodiscard]] uint64_t GetQueryCount() const noexcept { return m_queryCount; }
    void ResetQueryCount() noexcept { m_queryCount = 0; }

    [[nodiscard]] const ScannerSettings& GetSettings() const noexcept { return m_settings; }

private:
    [[nodiscard]] bool ShouldFire(Time::TimePoint now, const Point& position) const;
    void Fire(Time::TimePoint now, const Point& position);

    ISensingPort& m_sensing;
    ScannerSettings m_settings;
    ScanResult m_result;
    bool m_hasFired = false;
    uint64_t m_queryCount = 0;
};

} // namespace Bot
} // namespace Wayfarer
