// src/completion/CompletionTypes.hpp
#pragma once
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QtGlobal>

enum class CompletionMode { Disabled, ManualOnly, AutoAssist };

enum class TriggerKind { Manual, Auto };

// Completed/Failed/TimedOut/Cancelled only exist for the duration of their
// bookkeeping; outside a single cycle the machine is Idle or Requesting.
enum class OrchestratorState { Idle, Requesting, Completed, Failed, TimedOut, Cancelled };

enum class CompletionStatus { Idle, Requesting, SuggestionReady, Error };

enum class CompletionError {
    None,
    ProviderError,
    TimeoutExceeded,
    AnchorMismatch,
    ChannelUnavailable,
    NoSuggestion
};

struct CompletionRequest {
    quint64 sequence = 0;
    QString textBeforeCursor;
    QString textAfterCursor;
    int cursorOffset = 0;
    TriggerKind trigger = TriggerKind::Auto;
    qint64 issuedAtMs = 0;
    QStringList references;
    quint64 bufferVersion = 0;
};

struct RequestMetric {
    qint64 durationMs = 0;
    double complexityScore = 1.0;
    bool succeeded = false;
    bool timedOut = false;
    qint64 timestampMs = 0;
};

struct PendingSuggestion {
    int anchorOffset = -1;
    QString suggestedText;
    QString activeChannel;
    qint64 createdAtMs = 0;
    quint64 bufferVersion = 0;
    bool occupiesBuffer = false;
};

QString toString(CompletionMode mode);
QString toString(TriggerKind kind);
QString toString(OrchestratorState state);
QString toString(CompletionStatus status);
QString toString(CompletionError error);

// Accepts the config spellings ("disabled", "manual", "auto").
bool parseCompletionMode(const QString &text, CompletionMode *mode);

Q_DECLARE_METATYPE(CompletionMode)
Q_DECLARE_METATYPE(CompletionStatus)
Q_DECLARE_METATYPE(CompletionError)
