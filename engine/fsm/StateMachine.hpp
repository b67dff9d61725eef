#pragma once

#include "core/Time.hpp"

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <functional>
#include <cstddef>

namespace Wayfarer {

/**
 * @brief Ordered, guard-driven state sequencer with nested sub-machines
 *
 * States run in insertion order. The current state's body executes on
 * every Update (or only once when runOnce is set) and the machine moves on
 * when its exit condition holds and the state has been active for at
 * least its transition delay.
 *
 * A subroutine entry hands the tick to another StateMachine while its
 * condition holds. The parent resumes its own list only after the condition
 * is false and the sub-machine has finished or been reset; until then the
 * sub-machine keeps receiving ticks so it can drain.
 *
 * The machine knows nothing about what its states do. Pause() freezes the
 * whole chain: a paused machine neither advances nor ticks its active
 * subroutine.
 */
class StateMachine {
public:
    using Action = std::function<void()>;
    using Condition = std::function<bool()>;

    /**
     * @brief A plain state
     */
    struct State {
        std::string name;
        Action execute;                         // May be empty
        Condition exitCondition;                // Empty means "exit immediately"
        bool runOnce = true;
        Time::Duration transitionDelay{0};
        bool executed = false;                  // Runtime flag
    };

    /**
     * @brief Delegation to a nested machine, owned elsewhere
     */
    struct Subroutine {
        std::string name;
        Condition condition;
        StateMachine* subMachine = nullptr;
        bool active = false;                    // Runtime flag
    };

    using Entry = std::variant<State, Subroutine>;

    explicit StateMachine(std::string name);
    ~StateMachine() = default;

    // Sub-machines are referenced by address
    StateMachine(const StateMachine&) = delete;
    StateMachine& operator=(const StateMachine&) = delete;
    StateMachine(StateMachine&&) = delete;
    StateMachine& operator=(StateMachine&&) = delete;

    // -------------------------------------------------------------------------
    // Setup
    // -------------------------------------------------------------------------

    /**
     * @brief Append a state
     * @param name Display name, used in logs and status text
     * @param execute State body (may be empty)
     * @param exitCondition Guard checked after the body; empty means true
     * @param runOnce Execute the body at most once per entry
     * @param transitionDelay Minimum time in the state before exiting
     */
    void AddState(std::string name,
                  Action execute = nullptr,
                  Condition exitCondition = nullptr,
                  bool runOnce = true,
                  Time::Duration transitionDelay = Time::Duration{0});

    /**
     * @brief Append a subroutine delegating to another machine
     * @param subMachine Must outlive this machine
     */
    void AddSubroutine(std::string name, Condition condition, StateMachine& subMachine);

    /**
     * @brief Remove every state and stop
     */
    void Clear();

    /**
     * @brief Log every transition through the engine logger
     */
    void SetLogBehavior(bool enabled) noexcept { m_logTransitions = enabled; }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    /**
     * @brief Rewind to the first state, clear pause, and start running
     */
    void Start(Time::TimePoint now);

    /**
     * @brief Stop running; the cursor is kept for inspection
     */
    void Stop();

    /**
     * @brief Rewind to the first state, clear runtime flags, and stop running
     *
     * Nested machines referenced by subroutines are reset as well.
     */
    void Reset();

    /**
     * @brief Freeze the machine. Idempotent.
     */
    void Pause();

    /**
     * @brief Unfreeze the machine. Idempotent.
     */
    void Resume();

    /**
     * @brief Advance the machine by one tick
     */
    void Update(Time::TimePoint now);

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::string& GetName() const noexcept { return m_name; }
    [[nodiscard]] bool IsStarted() const noexcept { return m_started; }
    [[nodiscard]] bool IsPaused() const noexcept { return m_paused; }

    /**
     * @brief True once the cursor has moved past the last state
     */
    [[nodiscard]] bool IsFinished() const noexcept { return m_cursor >= m_entries.size(); }

    [[nodiscard]] size_t GetStateCount() const noexcept { return m_entries.size(); }
    [[nodiscard]] size_t GetCursor() const noexcept { return m_cursor; }
    [[nodiscard]] Time::TimePoint GetLastEntryTime() const noexcept { return m_lastEntryTime; }

    /**
     * @brief Name of the current entry, or an empty view when finished
     */
    [[nodiscard]] std::string_view GetCurrentStateName() const noexcept;

    /**
     * @brief Name of the innermost active state, following subroutines
     */
    [[nodiscard]] std::string GetActivePath() const;

private:
    void UpdateState(State& state, Time::TimePoint now);
    void UpdateSubroutine(Subroutine& sub, Time::TimePoint now);
    void AdvanceCursor(Time::TimePoint now);
    void ClearRuntimeFlags();

    std::string m_name;
    std::vector<Entry> m_entries;
    size_t m_cursor = 0;
    bool m_started = false;
    bool m_paused = false;
    bool m_logTransitions = false;
    Time::TimePoint m_lastEntryTime{};
};

} // namespace Wayfarer
