#include "core/Time.hpp"

namespace Wayfarer {

// Stopwatch implementation
void Stopwatch::Start(Time::TimePoint now) noexcept {
    if (!m_running) {
        m_startTime = now;
        m_running = true;
    }
}

void Stopwatch::Stop(Time::TimePoint now) noexcept {
    if (m_running) {
        m_accumulated += now - m_startTime;
        m_running = false;
    }
}

void Stopwatch::Reset() noexcept {
    m_accumulated = Time::Duration{0};
    m_running = false;
}

void Stopwatch::Restart(Time::TimePoint now) noexcept {
    m_accumulated = Time::Duration{0};
    m_startTime = now;
    m_running = true;
}

double Stopwatch::GetElapsedSeconds(Time::TimePoint now) const noexcept {
    auto total = m_accumulated;
    if (m_running) {
        total += now - m_startTime;
    }
    return std::chrono::duration_cast<Time::Seconds>(total).count();
}

} // namespace Wayfarer
