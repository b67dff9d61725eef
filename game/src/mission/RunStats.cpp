#include "RunStats.hpp"
#include <algorithm>
#include <numeric>

namespace Wayfarer {
namespace Bot {

void RunStats::BeginRun(Time::TimePoint now) {
    if (!m_sessionTimer.IsRunning()) {
        m_sessionTimer.Start(now);
    }
    m_lapTimer.Restart(now);
    ++m_runsAttempted;
}

void RunStats::CompleteRun(Time::TimePoint now) {
    if (!m_lapTimer.IsRunning()) {
        return;
    }
    m_lapHistory.push_back(m_lapTimer.GetElapsedSeconds(now));
    m_lapTimer.Stop(now);
    ++m_runsCompleted;
}

void RunStats::EndSession(Time::TimePoint now) {
    m_lapTimer.Stop(now);
    m_sessionTimer.Stop(now);
}

void RunStats::Reset() {
    m_sessionTimer.Reset();
    m_lapTimer.Reset();
    m_lapHistory.clear();
    m_runsAttempted = 0;
    m_runsCompleted = 0;
}

double RunStats::GetMinLapSeconds() const noexcept {
    if (m_lapHistory.empty()) {
        return 0.0;
    }
    return *std::min_element(m_lapHistory.begin(), m_lapHistory.end());
}

double RunStats::GetMaxLapSeconds() const noexcept {
    if (m_lapHistory.empty()) {
        return 0.0;
    }
    return *std::max_element(m_lapHistory.begin(), m_lapHistory.end());
}

double RunStats::GetAverageLapSeconds() const noexcept {
    if (m_lapHistory.empty()) {
        return 0.0;
    }
    return std::accumulate(m_lapHistory.begin(), m_lapHistory.end(), 0.0) /
           static_cast<double>(m_lapHistory.size());
}

double RunStats::GetSuccessRate() const noexcept {
    if (m_runsAttempted == 0) {
        return 0.0;
    }
    return static_cast<double>(m_runsCompleted) / static_cast<double>(m_runsAttempted);
}

} // namespace Bot
} // namespace Wayfarer
