// src/completion/CompletionTypes.cpp
#include "CompletionTypes.hpp"

QString toString(CompletionMode mode) {
    switch (mode) {
    case CompletionMode::Disabled: return QStringLiteral("disabled");
    case CompletionMode::ManualOnly: return QStringLiteral("manual");
    case CompletionMode::AutoAssist: return QStringLiteral("auto");
    }
    return QString();
}

QString toString(TriggerKind kind) {
    return kind == TriggerKind::Manual ? QStringLiteral("manual") : QStringLiteral("auto");
}

QString toString(OrchestratorState state) {
    switch (state) {
    case OrchestratorState::Idle: return QStringLiteral("Idle");
    case OrchestratorState::Requesting: return QStringLiteral("Requesting");
    case OrchestratorState::Completed: return QStringLiteral("Completed");
    case OrchestratorState::Failed: return QStringLiteral("Failed");
    case OrchestratorState::TimedOut: return QStringLiteral("TimedOut");
    case OrchestratorState::Cancelled: return QStringLiteral("Cancelled");
    }
    return QString();
}

QString toString(CompletionStatus status) {
    switch (status) {
    case CompletionStatus::Idle: return QStringLiteral("Idle");
    case CompletionStatus::Requesting: return QStringLiteral("Requesting");
    case CompletionStatus::SuggestionReady: return QStringLiteral("SuggestionReady");
    case CompletionStatus::Error: return QStringLiteral("Error");
    }
    return QString();
}

QString toString(CompletionError error) {
    switch (error) {
    case CompletionError::None: return QStringLiteral("None");
    case CompletionError::ProviderError: return QStringLiteral("ProviderError");
    case CompletionError::TimeoutExceeded: return QStringLiteral("TimeoutExceeded");
    case CompletionError::AnchorMismatch: return QStringLiteral("AnchorMismatch");
    case CompletionError::ChannelUnavailable: return QStringLiteral("ChannelUnavailable");
    case CompletionError::NoSuggestion: return QStringLiteral("NoSuggestion");
    }
    return QString();
}

bool parseCompletionMode(const QString &text, CompletionMode *mode) {
    const QString key = text.trimmed().toLower();
    CompletionMode parsed;
    if (key == "disabled" || key == "off") parsed = CompletionMode::Disabled;
    else if (key == "manual" || key == "manual_ai") parsed = CompletionMode::ManualOnly;
    else if (key == "auto" || key == "auto_ai") parsed = CompletionMode::AutoAssist;
    else return false;
    if (mode) *mode = parsed;
    return true;
}
