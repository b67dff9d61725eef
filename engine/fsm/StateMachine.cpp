#include "fsm/StateMachine.hpp"
#include "core/Logger.hpp"

#include <utility>

namespace Wayfarer {

StateMachine::StateMachine(std::string name)
    : m_name(std::move(name))
{
}

void StateMachine::AddState(std::string name,
                            Action execute,
                            Condition exitCondition,
                            bool runOnce,
                            Time::Duration transitionDelay) {
    State state;
    state.name = std::move(name);
    state.execute = std::move(execute);
    state.exitCondition = std::move(exitCondition);
    state.runOnce = runOnce;
    state.transitionDelay = transitionDelay;
    m_entries.emplace_back(std::move(state));
}

void StateMachine::AddSubroutine(std::string name, Condition condition, StateMachine& subMachine) {
    Subroutine sub;
    sub.name = std::move(name);
    sub.condition = std::move(condition);
    sub.subMachine = &subMachine;
    m_entries.emplace_back(std::move(sub));
}

void StateMachine::Clear() {
    m_entries.clear();
    m_cursor = 0;
    m_started = false;
    m_paused = false;
}

// =============================================================================
// Lifecycle
// =============================================================================

void StateMachine::Start(Time::TimePoint now) {
    m_cursor = 0;
    m_paused = false;
    m_started = true;
    m_lastEntryTime = now;
    ClearRuntimeFlags();

    if (m_logTransitions) {
        WAYFARER_LOG_INFO("[{}] started at '{}'", m_name, GetCurrentStateName());
    }
}

void StateMachine::Stop() {
    if (m_started && m_logTransitions) {
        WAYFARER_LOG_INFO("[{}] stopped", m_name);
    }
    m_started = false;
}

void StateMachine::Reset() {
    m_cursor = 0;
    m_started = false;
    m_paused = false;
    ClearRuntimeFlags();

    for (auto& entry : m_entries) {
        if (auto* sub = std::get_if<Subroutine>(&entry); sub && sub->subMachine) {
            sub->subMachine->Reset();
        }
    }
}

void StateMachine::Pause() {
    if (m_paused) {
        return;
    }
    m_paused = true;
    if (m_logTransitions) {
        WAYFARER_LOG_INFO("[{}] paused in '{}'", m_name, GetCurrentStateName());
    }
}

void StateMachine::Resume() {
    if (!m_paused) {
        return;
    }
    m_paused = false;
    if (m_logTransitions) {
        WAYFARER_LOG_INFO("[{}] resumed in '{}'", m_name, GetCurrentStateName());
    }
}

// =============================================================================
// Update
// =============================================================================

void StateMachine::Update(Time::TimePoint now) {
    if (!m_started || m_paused || IsFinished()) {
        return;
    }

    Entry& entry = m_entries[m_cursor];
    if (auto* state = std::get_if<State>(&entry)) {
        UpdateState(*state, now);
    } else if (auto* sub = std::get_if<Subroutine>(&entry)) {
        UpdateSubroutine(*sub, now);
    }
}

void StateMachine::UpdateState(State& state, Time::TimePoint now) {
    const size_t cursor = m_cursor;

    if (state.execute && (!state.runOnce || !state.executed)) {
        state.execute();
    }
    state.executed = true;

    // The body may have stopped, reset or paused this machine
    if (!m_started || m_paused || m_cursor != cursor) {
        return;
    }

    const bool canExit = !state.exitCondition || state.exitCondition();
    if (canExit && (now - m_lastEntryTime) >= state.transitionDelay) {
        AdvanceCursor(now);
    }
}

void StateMachine::UpdateSubroutine(Subroutine& sub, Time::TimePoint now) {
    if (!sub.subMachine) {
        AdvanceCursor(now);
        return;
    }

    StateMachine& child = *sub.subMachine;
    const bool holds = sub.condition && sub.condition();

    if (holds) {
        if (!sub.active || !child.IsStarted()) {
            child.Start(now);
            sub.active = true;
            if (m_logTransitions) {
                WAYFARER_LOG_INFO("[{}] entering subroutine '{}' ({})", m_name, sub.name, child.GetName());
            }
        }
        if (!child.IsFinished()) {
            child.Update(now);
        }
        return;
    }

    // Condition dropped: let a running child drain before handing back
    if (sub.active && child.IsStarted() && !child.IsFinished()) {
        child.Update(now);
        if (child.IsStarted() && !child.IsFinished()) {
            return;
        }
    }

    if (sub.active) {
        child.Reset();
        sub.active = false;
    }
    AdvanceCursor(now);
}

void StateMachine::AdvanceCursor(Time::TimePoint now) {
    const std::string_view from = GetCurrentStateName();
    ++m_cursor;
    m_lastEntryTime = now;

    if (m_cursor < m_entries.size()) {
        Entry& next = m_entries[m_cursor];
        if (auto* state = std::get_if<State>(&next)) {
            state->executed = false;
        } else if (auto* sub = std::get_if<Subroutine>(&next)) {
            sub->active = false;
        }
    }

    if (m_logTransitions) {
        if (IsFinished()) {
            WAYFARER_LOG_INFO("[{}] '{}' -> finished", m_name, from);
        } else {
            WAYFARER_LOG_INFO("[{}] '{}' -> '{}'", m_name, from, GetCurrentStateName());
        }
    }
}

void StateMachine::ClearRuntimeFlags() {
    for (auto& entry : m_entries) {
        if (auto* state = std::get_if<State>(&entry)) {
            state->executed = false;
        } else if (auto* sub = std::get_if<Subroutine>(&entry)) {
            sub->active = false;
        }
    }
}

// =============================================================================
// Queries
// =============================================================================

std::string_view StateMachine::GetCurrentStateName() const noexcept {
    if (IsFinished()) {
        return {};
    }
    const Entry& entry = m_entries[m_cursor];
    if (const auto* state = std::get_if<State>(&entry)) {
        return state->name;
    }
    return std::get<Subroutine>(entry).name;
}

std::string StateMachine::GetActivePath() const {
    if (IsFinished()) {
        return {};
    }

    std::string path(GetCurrentStateName());
    if (const auto* sub = std::get_if<Subroutine>(&m_entries[m_cursor]);
        sub && sub->active && sub->subMachine) {
        const std::string inner = sub->subMachine->GetActivePath();
        if (!inner.empty()) {
            path += " > ";
            path += inner;
        }
    }
    return path;
}

} // namespace Wayfarer
