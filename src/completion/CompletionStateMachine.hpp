// src/completion/CompletionStateMachine.hpp
#pragma once
#include "CompletionTypes.hpp"

enum class StateEvent { RequestIssued, ResultSucceeded, ResultFailed, DeadlineExpired, Cancelled, Settled };

// One request cycle: Idle -> Requesting -> {Completed|Failed|TimedOut|Cancelled} -> Idle.
class CompletionStateMachine {
public:
    // Returns false and leaves *next untouched when the event is not valid in state.
    static bool transition(OrchestratorState state, StateEvent event, OrchestratorState *next);
    static bool isTransient(OrchestratorState state);

    bool apply(StateEvent event);
    OrchestratorState state() const { return m_state; }
    void reset() { m_state = OrchestratorState::Idle; }

private:
    OrchestratorState m_state = OrchestratorState::Idle;
};

QString toString(StateEvent event);
