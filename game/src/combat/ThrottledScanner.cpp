#include "ThrottledScanner.hpp"
#include <engine/core/Logger.hpp>

#include <cmath>

namespace Wayfarer {
namespace Bot {

ScannerSettings ScannerSettings::ForAggroRange(double aggroRange, double moveRatio,
                                               Time::Duration interval) {
    ScannerSettings settings;
    settings.aggroRange = aggroRange;
    settings.moveThreshold = aggroRange * moveRatio;
    settings.interval = interval;
    return settings;
}

ThrottledScanner::ThrottledScanner(ISensingPort& sensing, ScannerSettings settings)
    : m_sensing(sensing)
    , m_settings(settings)
{
}

const ScanResult& ThrottledScanner::Scan(Time::TimePoint now, const Point& position) {
    if (ShouldFire(now, position)) {
        Fire(now, position);
    }
    return m_result;
}

bool ThrottledScanner::ShouldFire(Time::TimePoint now, const Point& position) const {
    if (!m_hasFired) {
        return true;
    }
    return Distance(position, m_result.origin) >= m_settings.moveThreshold
        || (now - m_result.timestamp) >= m_settings.interval;
}

void ThrottledScanner::Fire(Time::TimePoint now, const Point& position) {
    ++m_queryCount;
    m_hasFired = true;
    m_result.origin = position;
    m_result.timestamp = now;
    m_result.target.reset();
    m_result.error.reset();

    auto hostiles = m_sensing.NearbyHostiles(position, m_settings.aggroRange);
    if (!hostiles) {
        m_result.error = hostiles.error();
        BOT_LOG_DEBUG("Hostile query failed ({}); treating as no hostile",
                      PortErrorToString(hostiles.error()));
        return;
    }

    // Strict comparison keeps the first entry on distance ties
    double bestDistance = 0.0;
    for (const HostileInfo& hostile : *hostiles) {
        if (!hostile.alive || hostile.id == INVALID_ENTITY) {
            continue;
        }
        const double d = Distance(position, hostile.position);
        // NaN distances fail the range test too
        if (!std::isfinite(d) || !(d <= m_settings.aggroRange)) {
            continue;
        }
        if (!m_result.target || d < bestDistance) {
            m_result.target = hostile;
            bestDistance = d;
        }
    }
}

} // namespace Bot
} // namespace Wayfarer
