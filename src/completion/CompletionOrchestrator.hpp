// src/completion/CompletionOrchestrator.hpp
#pragma once
#include <QElapsedTimer>
#include <QObject>
#include <QTimer>
#include <functional>
#include <optional>
#include "CompletionConfig.hpp"
#include "CompletionStateMachine.hpp"
#include "CompletionTypes.hpp"
#include "DisplayChannel.hpp"
#include "SuggestionBuffer.hpp"
#include "TimeoutEstimator.hpp"
#include "TriggerPolicy.hpp"

class BufferAccessor;
class CompletionProvider;

// Drives one completion cycle at a time against a host buffer. Everything
// here runs on the editor's thread; provider answers come back as queued
// signals and are matched against the current sequence number.
class CompletionOrchestrator : public QObject {
    Q_OBJECT
public:
    using Clock = std::function<qint64()>;

    CompletionOrchestrator(BufferAccessor *buffer, CompletionProvider *provider,
                           const CompletionConfig &config, QObject *parent = nullptr);

    DisplayChannelChain *channels() { return &m_chain; }
    // Overlay and popup are skipped when disabled in the config; literal
    // insertion always goes last.
    void installDefaultChannels(OverlayHost *overlay, PopupHost *popup);

    void setMode(CompletionMode mode);
    CompletionMode mode() const { return m_mode; }
    void setReferences(const QStringList &references) { m_references = references; }
    void setClock(Clock clock);

    // No-op (returns false) when disabled, busy, or auto while manual-only.
    bool request(TriggerKind kind);

    TriggerDecision notifyKeystroke(const QString &text);
    TriggerDecision notifyManualTrigger();
    void notifyBufferChanged();
    void notifyCursorMoved();

    bool accept(CompletionError *error = nullptr);
    bool reject();
    bool cancel();

    OrchestratorState state() const { return m_machine.state(); }
    CompletionStatus status() const { return m_status; }
    CompletionError lastError() const { return m_lastError; }
    quint64 currentSequence() const { return m_sequence; }
    bool isRequesting() const { return state() == OrchestratorState::Requesting; }
    bool hasPendingSuggestion() const { return m_suggestions.hasPending(); }
    const PendingSuggestion *pendingSuggestion() const { return m_suggestions.pending(); }
    TimeoutEstimator &timeoutEstimator() { return m_timeouts; }
    const TriggerPolicy &triggerPolicy() const { return m_policy; }
    qint64 currentDeadlineMs() const { return m_deadlineMs; }
    const CompletionConfig &config() const { return m_config; }

public slots:
    void handleProviderResult(quint64 sequence, const QString &text);
    void handleProviderFailure(quint64 sequence, const QString &error);
    void handleTimeout(quint64 sequence);
    void handleDebounceElapsed();

signals:
    void statusChanged(CompletionStatus status, CompletionError error, const QString &message);
    void modeChanged(CompletionMode mode);
    void suggestionAccepted(const QString &text);
    void suggestionRejected();

private:
    bool isCurrent(quint64 sequence) const;
    bool anchorStillValid(const CompletionRequest &request) const;
    TriggerSnapshot snapshot() const;
    void invalidatePending(CompletionError reason);
    void finishCycle();
    void setStatus(CompletionStatus status, CompletionError error = CompletionError::None,
                   const QString &message = QString());

    BufferAccessor *m_buffer = nullptr;
    CompletionProvider *m_provider = nullptr;
    CompletionConfig m_config;
    CompletionMode m_mode = CompletionMode::ManualOnly;
    QStringList m_references;

    DisplayChannelChain m_chain;
    SuggestionBuffer m_suggestions;
    TimeoutEstimator m_timeouts;
    TriggerPolicy m_policy;
    CompletionStateMachine m_machine;

    std::optional<CompletionRequest> m_inFlight;
    quint64 m_sequence = 0;
    quint64 m_deadlineSequence = 0;
    qint64 m_deadlineMs = 0;

    CompletionStatus m_status = CompletionStatus::Idle;
    CompletionError m_lastError = CompletionError::None;
    bool m_applyingEdit = false;

    QTimer m_deadlineTimer;
    QTimer m_debounceTimer;
    QTimer m_continueTimer;
    QElapsedTimer m_elapsed;
    Clock m_clock;
};
