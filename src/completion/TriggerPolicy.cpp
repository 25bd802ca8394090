// src/completion/TriggerPolicy.cpp
#include "TriggerPolicy.hpp"
#include "CompletionConfig.hpp"
#include "CompletionLog.hpp"
#include <QHash>
#include <QRegularExpression>
#include <algorithm>

TriggerPolicy::TriggerPolicy() : TriggerPolicy(Settings()) {}

TriggerPolicy::TriggerPolicy(const Settings &settings) : m_settings(settings) {}

TriggerPolicy::Settings TriggerPolicy::settingsFrom(const CompletionConfig &config) {
    Settings s;
    s.debounceMs = config.debounceMs;
    s.minTriggerIntervalMs = config.minTriggerIntervalMs;
    s.programmaticThreshold = config.programmaticThreshold;
    s.lookbackBefore = config.lookbackBefore;
    s.lookbackAfter = config.lookbackAfter;
    return s;
}

TriggerDecision TriggerPolicy::evaluate(const TriggerEvent &event, const TriggerSnapshot &snapshot) {
    using Kind = TriggerEvent::Kind;
    if (event.kind == Kind::Keystroke)
        m_lastKeystrokeMs = event.timestampMs;

    if (snapshot.mode == CompletionMode::Disabled)
        return TriggerDecision::suppress("disabled");

    if (event.kind != Kind::ManualTrigger && isProgrammatic(snapshot.textBefore, snapshot.textAfter))
        return TriggerDecision::suppress("programmatic edit");

    if (snapshot.requesting)
        return TriggerDecision::suppress("request in flight");

    if (event.kind == Kind::ManualTrigger)
        return fireOnce(TriggerKind::Manual, event.timestampMs);

    if (event.kind == Kind::DebounceElapsed) {
        if (snapshot.mode != CompletionMode::AutoAssist)
            return TriggerDecision::suppress("auto trigger off");
        if (snapshot.hasPendingSuggestion)
            return TriggerDecision::suppress("suggestion pending");
        if (m_lastKeystrokeMs >= 0 && event.timestampMs - m_lastKeystrokeMs < m_settings.debounceMs)
            return TriggerDecision::suppress("debouncing");
        if (!isTriggerContext(snapshot.textBefore, snapshot.textAfter))
            return TriggerDecision::suppress("no trigger context");
        return fireOnce(TriggerKind::Auto, event.timestampMs);
    }

    if (snapshot.hasPendingSuggestion && isPrintable(event.text))
        return TriggerDecision::invalidate();

    return TriggerDecision::suppress(QString());
}

TriggerDecision TriggerPolicy::fireOnce(TriggerKind kind, qint64 nowMs) {
    if (m_lastFireMs >= 0 && nowMs - m_lastFireMs < m_settings.minTriggerIntervalMs)
        return TriggerDecision::suppress("retriggered too soon");
    m_lastFireMs = nowMs;
    return TriggerDecision::fire(kind);
}

bool TriggerPolicy::isProgrammatic(const QString &before, const QString &after) const {
    const QString window = before.right(m_settings.lookbackBefore) + after.left(m_settings.lookbackAfter);
    if (window.size() <= m_settings.minProgrammaticWindow) return false;

    QHash<QChar, int> counts;
    int most = 0;
    for (QChar c : window) {
        if (!c.isPrint()) continue;
        most = std::max(most, ++counts[c]);
    }
    const bool programmatic = most > m_settings.programmaticThreshold * window.size();
    if (programmatic)
        qCDebug(lcCompletion) << "looks like a programmatic edit:" << window;
    return programmatic;
}

bool TriggerPolicy::isTriggerContext(const QString &before, const QString &after) {
    if (!after.isEmpty()) {
        const QChar next = after.front();
        if (next.isLetterOrNumber() || next == QLatin1Char('_')) return false;
    }

    static const QRegularExpression tag(QStringLiteral("@\\w*$"));
    if (tag.match(before).hasMatch()) return true;

    if (before.isEmpty() || before.back() == QLatin1Char('\n')) return false;
    const QString trimmed = before.trimmed();
    if (trimmed.isEmpty()) return false;
    static const QString terminators = QStringLiteral(".!?。！？");
    return !terminators.contains(trimmed.back());
}

bool TriggerPolicy::isPrintable(const QString &text) {
    if (text.isEmpty()) return false;
    return std::all_of(text.begin(), text.end(), [](QChar c) { return c.isPrint(); });
}

void TriggerPolicy::reset() {
    m_lastKeystrokeMs = -1;
    m_lastFireMs = -1;
}
