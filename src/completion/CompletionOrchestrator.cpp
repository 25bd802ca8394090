// src/completion/CompletionOrchestrator.cpp
#include "CompletionOrchestrator.hpp"
#include "BufferAccessor.hpp"
#include "CompletionLog.hpp"
#include "CompletionProvider.hpp"
#include <QScopedValueRollback>
#include <utility>

CompletionOrchestrator::CompletionOrchestrator(BufferAccessor *buffer, CompletionProvider *provider,
                                               const CompletionConfig &config, QObject *parent)
    : QObject(parent),
      m_buffer(buffer),
      m_provider(provider),
      m_config(config),
      m_mode(config.mode),
      m_suggestions(buffer, &m_chain, SuggestionBuffer::settingsFrom(config)),
      m_timeouts(TimeoutEstimator::settingsFrom(config)),
      m_policy(TriggerPolicy::settingsFrom(config)) {
    m_elapsed.start();
    m_clock = [this] { return m_elapsed.elapsed(); };

    m_deadlineTimer.setSingleShot(true);
    connect(&m_deadlineTimer, &QTimer::timeout, this, [this] { handleTimeout(m_deadlineSequence); });

    m_debounceTimer.setSingleShot(true);
    m_debounceTimer.setInterval(m_config.debounceMs);
    connect(&m_debounceTimer, &QTimer::timeout, this, &CompletionOrchestrator::handleDebounceElapsed);

    m_continueTimer.setSingleShot(true);
    m_continueTimer.setInterval(m_config.continueDelayMs);
    connect(&m_continueTimer, &QTimer::timeout, this, &CompletionOrchestrator::handleDebounceElapsed);

    if (m_provider) {
        connect(m_provider, &CompletionProvider::completed, this, &CompletionOrchestrator::handleProviderResult);
        connect(m_provider, &CompletionProvider::failed, this, &CompletionOrchestrator::handleProviderFailure);
    }
}

void CompletionOrchestrator::installDefaultChannels(OverlayHost *overlay, PopupHost *popup) {
    m_chain.clear();
    if (overlay && m_config.overlayEnabled)
        m_chain.addChannel(std::make_unique<GhostOverlayChannel>(overlay));
    if (popup && m_config.popupEnabled)
        m_chain.addChannel(std::make_unique<PopupChannel>(popup));
    m_chain.addChannel(std::make_unique<LiteralInsertChannel>(m_buffer));
}

void CompletionOrchestrator::setMode(CompletionMode mode) {
    if (mode == m_mode) return;
    qCInfo(lcCompletion) << "mode" << toString(m_mode) << "->" << toString(mode);
    m_mode = mode;
    if (m_mode != CompletionMode::AutoAssist) {
        m_debounceTimer.stop();
        m_continueTimer.stop();
    }
    if (m_mode == CompletionMode::Disabled) cancel();
    emit modeChanged(m_mode);
}

void CompletionOrchestrator::setClock(Clock clock) {
    if (clock) m_clock = std::move(clock);
}

// === Requests ===

bool CompletionOrchestrator::request(TriggerKind kind) {
    if (m_mode == CompletionMode::Disabled) return false;
    if (kind == TriggerKind::Auto && m_mode == CompletionMode::ManualOnly) return false;
    if (state() != OrchestratorState::Idle) {
        qCDebug(lcCompletion) << "request ignored, state is" << toString(state());
        return false;
    }
    if (!m_buffer || !m_provider) {
        qCWarning(lcCompletion) << "request ignored, no buffer or provider attached";
        return false;
    }

    if (m_suggestions.hasPending()) {
        QScopedValueRollback<bool> guard(m_applyingEdit, true);
        m_suggestions.reject();
    }
    m_continueTimer.stop();

    const TextContext context = m_buffer->textAround(m_config.contextBeforeChars, m_config.contextAfterChars);
    CompletionRequest req;
    req.sequence = ++m_sequence;
    req.textBeforeCursor = context.before;
    req.textAfterCursor = context.after;
    req.cursorOffset = m_buffer->cursorOffset();
    req.trigger = kind;
    req.issuedAtMs = m_clock();
    req.references = m_references;
    req.bufferVersion = m_buffer->version();

    m_machine.apply(StateEvent::RequestIssued);
    m_inFlight = req;
    m_deadlineMs = m_timeouts.estimate(req);
    m_deadlineSequence = req.sequence;
    m_deadlineTimer.start(int(m_deadlineMs));

    qCInfo(lcCompletion) << "request" << req.sequence << toString(kind) << "at" << req.cursorOffset
                         << "deadline" << m_deadlineMs << "ms";
    setStatus(CompletionStatus::Requesting);
    m_provider->complete(req);
    return true;
}

bool CompletionOrchestrator::isCurrent(quint64 sequence) const {
    return state() == OrchestratorState::Requesting && m_inFlight && m_inFlight->sequence == sequence;
}

bool CompletionOrchestrator::anchorStillValid(const CompletionRequest &request) const {
    if (m_buffer->version() == request.bufferVersion)
        return m_buffer->cursorOffset() == request.cursorOffset;
    if (m_buffer->cursorOffset() < request.cursorOffset) return false;
    const int start = request.cursorOffset - request.textBeforeCursor.size();
    return start >= 0 && m_buffer->textRange(start, request.cursorOffset) == request.textBeforeCursor;
}

void CompletionOrchestrator::handleProviderResult(quint64 sequence, const QString &text) {
    if (!isCurrent(sequence)) {
        qCDebug(lcCompletion) << "dropping stale result for request" << sequence;
        return;
    }
    if (text.trimmed().isEmpty()) {
        handleProviderFailure(sequence, tr("provider returned an empty completion"));
        return;
    }

    const CompletionRequest req = *m_inFlight;
    const qint64 now = m_clock();
    m_deadlineTimer.stop();
    m_inFlight.reset();
    m_machine.apply(StateEvent::ResultSucceeded);
    m_timeouts.record(now - req.issuedAtMs, req, true, false, now);

    CompletionError error = CompletionError::None;
    QString shown;
    if (!anchorStillValid(req)) {
        qCInfo(lcCompletion) << "buffer moved on while request" << sequence << "was running, discarding result";
        error = CompletionError::AnchorMismatch;
    } else {
        QScopedValueRollback<bool> guard(m_applyingEdit, true);
        shown = m_suggestions.show(text, m_buffer->cursorOffset(), now, &error);
    }
    finishCycle();

    if (!shown.isEmpty())
        setStatus(CompletionStatus::SuggestionReady, CompletionError::None, shown);
    else
        setStatus(CompletionStatus::Idle, error);
}

void CompletionOrchestrator::handleProviderFailure(quint64 sequence, const QString &error) {
    if (!isCurrent(sequence)) {
        qCDebug(lcCompletion) << "dropping stale failure for request" << sequence;
        return;
    }
    const CompletionRequest req = *m_inFlight;
    const qint64 now = m_clock();
    m_deadlineTimer.stop();
    m_inFlight.reset();
    m_machine.apply(StateEvent::ResultFailed);
    m_timeouts.record(now - req.issuedAtMs, req, false, false, now);
    qCWarning(lcCompletion) << "request" << sequence << "failed:" << error;
    finishCycle();
    setStatus(CompletionStatus::Error, CompletionError::ProviderError, error);
}

void CompletionOrchestrator::handleTimeout(quint64 sequence) {
    if (!isCurrent(sequence)) return;
    const CompletionRequest req = *m_inFlight;
    const qint64 now = m_clock();
    m_deadlineTimer.stop();
    m_inFlight.reset();
    m_machine.apply(StateEvent::DeadlineExpired);
    m_timeouts.record(now - req.issuedAtMs, req, false, true, now);
    qCWarning(lcTimeout) << "request" << sequence << "timed out after" << (now - req.issuedAtMs) << "ms";
    if (m_suggestions.hasPending()) {
        QScopedValueRollback<bool> guard(m_applyingEdit, true);
        m_suggestions.reject();
    }
    finishCycle();
    setStatus(CompletionStatus::Error, CompletionError::TimeoutExceeded,
              tr("completion timed out after %1 ms").arg(now - req.issuedAtMs));
}

bool CompletionOrchestrator::cancel() {
    bool changed = false;
    if (state() == OrchestratorState::Requesting) {
        m_deadlineTimer.stop();
        qCInfo(lcCompletion) << "request" << m_inFlight->sequence << "cancelled";
        m_inFlight.reset();
        m_machine.apply(StateEvent::Cancelled);
        finishCycle();
        changed = true;
    }
    if (m_suggestions.hasPending()) {
        QScopedValueRollback<bool> guard(m_applyingEdit, true);
        m_suggestions.reject();
        changed = true;
    }
    if (changed) setStatus(CompletionStatus::Idle);
    return changed;
}

void CompletionOrchestrator::finishCycle() {
    m_machine.apply(StateEvent::Settled);
    m_deadlineMs = 0;
}

// === Pending suggestion ===

bool CompletionOrchestrator::accept(CompletionError *error) {
    if (error) *error = CompletionError::None;
    if (!m_suggestions.hasPending()) {
        if (error) *error = CompletionError::NoSuggestion;
        return false;
    }
    const QString text = m_suggestions.pending()->suggestedText;
    CompletionError result = CompletionError::None;
    bool ok = false;
    {
        QScopedValueRollback<bool> guard(m_applyingEdit, true);
        ok = m_suggestions.accept(&result);
    }
    if (error) *error = result;
    if (!ok) {
        setStatus(CompletionStatus::Idle, result);
        return false;
    }

    qCInfo(lcCompletion) << "accepted" << text.size() << "chars";
    emit suggestionAccepted(text);
    setStatus(CompletionStatus::Idle);
    if (m_mode == CompletionMode::AutoAssist && m_config.continueAfterAccept)
        m_continueTimer.start();
    return true;
}

bool CompletionOrchestrator::reject() {
    if (!m_suggestions.hasPending()) return false;
    {
        QScopedValueRollback<bool> guard(m_applyingEdit, true);
        m_suggestions.reject();
    }
    qCInfo(lcCompletion) << "suggestion rejected";
    emit suggestionRejected();
    setStatus(CompletionStatus::Idle);
    return true;
}

void CompletionOrchestrator::invalidatePending(CompletionError reason) {
    if (!m_suggestions.hasPending()) return;
    {
        QScopedValueRollback<bool> guard(m_applyingEdit, true);
        m_suggestions.reject();
    }
    setStatus(CompletionStatus::Idle, reason);
}

// === Host notifications ===

TriggerSnapshot CompletionOrchestrator::snapshot() const {
    TriggerSnapshot s;
    s.mode = m_mode;
    s.requesting = isRequesting();
    s.hasPendingSuggestion = m_suggestions.hasPending();
    if (m_buffer) {
        const TextContext context = m_buffer->textAround(m_config.contextBeforeChars, m_config.contextAfterChars);
        s.textBefore = context.before;
        s.textAfter = context.after;
    }
    return s;
}

TriggerDecision CompletionOrchestrator::notifyKeystroke(const QString &text) {
    const TriggerDecision decision = m_policy.evaluate(TriggerEvent::keystroke(text, m_clock()), snapshot());
    if (decision.action == TriggerDecision::Action::Invalidate)
        invalidatePending(CompletionError::None);
    else if (m_suggestions.isStale())
        invalidatePending(CompletionError::AnchorMismatch);
    m_continueTimer.stop();
    if (m_mode == CompletionMode::AutoAssist)
        m_debounceTimer.start();
    return decision;
}

TriggerDecision CompletionOrchestrator::notifyManualTrigger() {
    const TriggerDecision decision = m_policy.evaluate(TriggerEvent::manualTrigger(m_clock()), snapshot());
    if (decision.isFire()) request(decision.kind);
    else qCDebug(lcCompletion) << "manual trigger suppressed:" << decision.reason;
    return decision;
}

void CompletionOrchestrator::handleDebounceElapsed() {
    const TriggerDecision decision = m_policy.evaluate(TriggerEvent::debounceElapsed(m_clock()), snapshot());
    if (decision.isFire()) request(decision.kind);
    else if (!decision.reason.isEmpty()) qCDebug(lcCompletion) << "auto trigger suppressed:" << decision.reason;
}

void CompletionOrchestrator::notifyBufferChanged() {
    if (m_applyingEdit || !m_suggestions.isStale()) return;
    qCDebug(lcCompletion) << "buffer edited under the pending suggestion";
    invalidatePending(CompletionError::AnchorMismatch);
}

void CompletionOrchestrator::notifyCursorMoved() {
    if (m_applyingEdit || !m_buffer) return;
    const PendingSuggestion *p = m_suggestions.pending();
    if (!p) return;
    const int expected = p->occupiesBuffer ? p->anchorOffset + p->suggestedText.size() : p->anchorOffset;
    if (m_buffer->cursorOffset() == expected) return;
    qCDebug(lcCompletion) << "cursor left the suggestion anchor";
    invalidatePending(CompletionError::None);
}

void CompletionOrchestrator::setStatus(CompletionStatus status, CompletionError error, const QString &message) {
    m_status = status;
    m_lastError = error;
    emit statusChanged(status, error, message);
}
