// src/completion/CompletionStateMachine.cpp
#include "CompletionStateMachine.hpp"
#include "CompletionLog.hpp"

bool CompletionStateMachine::transition(OrchestratorState state, StateEvent event, OrchestratorState *next) {
    using S = OrchestratorState;
    S to = state;
    switch (state) {
    case S::Idle:
        if (event != StateEvent::RequestIssued) return false;
        to = S::Requesting;
        break;
    case S::Requesting:
        switch (event) {
        case StateEvent::ResultSucceeded: to = S::Completed; break;
        case StateEvent::ResultFailed:    to = S::Failed; break;
        case StateEvent::DeadlineExpired: to = S::TimedOut; break;
        case StateEvent::Cancelled:       to = S::Cancelled; break;
        default: return false;
        }
        break;
    case S::Completed:
    case S::Failed:
    case S::TimedOut:
    case S::Cancelled:
        if (event != StateEvent::Settled) return false;
        to = S::Idle;
        break;
    }
    if (next) *next = to;
    return true;
}

bool CompletionStateMachine::isTransient(OrchestratorState state) {
    return state != OrchestratorState::Idle && state != OrchestratorState::Requesting;
}

bool CompletionStateMachine::apply(StateEvent event) {
    OrchestratorState next = m_state;
    if (!transition(m_state, event, &next)) {
        qCDebug(lcCompletion) << "ignored" << toString(event) << "in state" << toString(m_state);
        return false;
    }
    qCDebug(lcCompletion) << toString(m_state) << "->" << toString(next);
    m_state = next;
    return true;
}

QString toString(StateEvent event) {
    switch (event) {
    case StateEvent::RequestIssued:   return QStringLiteral("RequestIssued");
    case StateEvent::ResultSucceeded: return QStringLiteral("ResultSucceeded");
    case StateEvent::ResultFailed:    return QStringLiteral("ResultFailed");
    case StateEvent::DeadlineExpired: return QStringLiteral("DeadlineExpired");
    case StateEvent::Cancelled:       return QStringLiteral("Cancelled");
    case StateEvent::Settled:         return QStringLiteral("Settled");
    }
    return QString();
}
