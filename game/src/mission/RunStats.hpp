#pragma once

#include <engine/core/Time.hpp>
#include <cstdint>
#include <vector>

namespace Wayfarer {
namespace Bot {

/**
 * @brief Session and per-run timing
 *
 * A session spans Start..Stop of the mission. Every Start begins a run;
 * a run counts as completed when the mission flow reaches its end.
 */
class RunStats {
public:
    RunStats() = default;

    /**
     * @brief Begin a new attempt; starts the session timer if needed
     */
    void BeginRun(Time::TimePoint now);

    /**
     * @brief Record the current run as completed with its lap time
     */
    void CompleteRun(Time::TimePoint now);

    /**
     * @brief Stop all timers; an unfinished run stays counted as attempted
     */
    void EndSession(Time::TimePoint now);

    /**
     * @brief Forget all history
     */
    void Reset();

    [[nodiscard]] uint32_t GetRunsAttempted() const noexcept { return m_runsAttempted; }
    [[nodiscard]] uint32_t GetRunsCompleted() const noexcept { return m_runsCompleted; }
    [[nodiscard]] const std::vector<double>& GetLapHistory() const noexcept { return m_lapHistory; }

    /** @brief Lap times in seconds; 0 without history */
    [[nodiscard]] double GetMinLapSeconds() const noexcept;
    [[nodiscard]] double GetMaxLapSeconds() const noexcept;
    [[nodiscard]] double GetAverageLapSeconds() const noexcept;

    /**
     * @brief Completed / attempted, in [0, 1]
     */
    [[nodiscard]] double GetSuccessRate() const noexcept;

    [[nodiscard]] bool IsRunActive() const noexcept { return m_lapTimer.IsRunning(); }
    [[nodiscard]] double GetCurrentLapSeconds(Time::TimePoint now) const noexcept {
        return m_lapTimer.GetElapsedSeconds(now);
    }
    [[nodiscard]] double GetSessionSeconds(Time::TimePoint now) const noexcept {
        return m_sessionTimer.GetElapsedSeconds(now);
    }

private:
    Stopwatch m_sessionTimer;
    Stopwatch m_lapTimer;
    std::vector<double> m_lapHistory;
    uint32_t m_runsAttempted = 0;
    uint32_t m_runsCompleted = 0;
};

} // namespace Bot
} // namespace Wayfarer
