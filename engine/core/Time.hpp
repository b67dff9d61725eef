#pragma once

#include <chrono>
#include <cstdint>

namespace Wayfarer {

/**
 * @brief Time types shared by every tick-driven component
 *
 * Components never read the clock themselves: the host samples
 * Clock::now() once per frame and passes the TimePoint down, which keeps
 * every decision within one tick consistent and makes tests deterministic.
 */
struct Time {
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = Clock::duration;
    using Seconds = std::chrono::duration<double>;
    using Milliseconds = std::chrono::milliseconds;

    /**
     * @brief Elapsed time between two points in seconds
     */
    [[nodiscard]] static double SecondsBetween(TimePoint from, TimePoint to) noexcept {
        return std::chrono::duration_cast<Seconds>(to - from).count();
    }
};

/**
 * @brief Manual stopwatch driven by host-supplied time points
 *
 * Can be started/stopped multiple times and accumulates total time.
 */
class Stopwatch {
public:
    Stopwatch() noexcept = default;

    /**
     * @brief Start or resume timing
     */
    void Start(Time::TimePoint now) noexcept;

    /**
     * @brief Pause timing (can be resumed with Start)
     */
    void Stop(Time::TimePoint now) noexcept;

    /**
     * @brief Reset accumulated time and stop timing
     */
    void Reset() noexcept;

    /**
     * @brief Restart from zero (equivalent to Reset + Start)
     */
    void Restart(Time::TimePoint now) noexcept;

    /**
     * @brief Get total elapsed time in seconds
     */
    [[nodiscard]] double GetElapsedSeconds(Time::TimePoint now) const noexcept;

    [[nodiscard]] bool IsRunning() const noexcept { return m_running; }

private:
    Time::TimePoint m_startTime{};
    Time::Duration m_accumulated{0};
    bool m_running = false;
};

/**
 * @brief Interval gate: "has at least N elapsed since the last Reset"
 *
 * A timer that was never reset reports every interval as elapsed.
 */
class IntervalTimer {
public:
    IntervalTimer() noexcept = default;

    void Reset(Time::TimePoint now) noexcept {
        m_last = now;
        m_armed = true;
    }

    void Clear() noexcept { m_armed = false; }

    [[nodiscard]] bool IsArmed() const noexcept { return m_armed; }

    [[nodiscard]] bool HasElapsed(Time::TimePoint now, Time::Duration interval) const noexcept {
        return !m_armed || (now - m_last) >= interval;
    }

    [[nodiscard]] Time::TimePoint GetLastReset() const noexcept { return m_last; }

private:
    Time::TimePoint m_last{};
    bool m_armed = false;
};

} // namespace Wayfarer
