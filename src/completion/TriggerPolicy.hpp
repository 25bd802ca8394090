// src/completion/TriggerPolicy.hpp
#pragma once
#include <QString>
#include "CompletionTypes.hpp"

struct CompletionConfig;

struct TriggerEvent {
    enum class Kind { Keystroke, ManualTrigger, DebounceElapsed };

    Kind kind = Kind::Keystroke;
    QString text;
    qint64 timestampMs = 0;

    static TriggerEvent keystroke(const QString &text, qint64 timestampMs) { return {Kind::Keystroke, text, timestampMs}; }
    static TriggerEvent manualTrigger(qint64 timestampMs) { return {Kind::ManualTrigger, QString(), timestampMs}; }
    static TriggerEvent debounceElapsed(qint64 timestampMs) { return {Kind::DebounceElapsed, QString(), timestampMs}; }
};

// What the policy needs to know about the world at evaluation time.
struct TriggerSnapshot {
    CompletionMode mode = CompletionMode::ManualOnly;
    bool requesting = false;
    bool hasPendingSuggestion = false;
    QString textBefore;
    QString textAfter;
};

struct TriggerDecision {
    enum class Action { Fire, Suppress, Invalidate };

    Action action = Action::Suppress;
    TriggerKind kind = TriggerKind::Auto;
    QString reason;

    static TriggerDecision fire(TriggerKind kind) { return {Action::Fire, kind, QString()}; }
    static TriggerDecision suppress(const QString &reason) { return {Action::Suppress, TriggerKind::Auto, reason}; }
    static TriggerDecision invalidate() { return {Action::Invalidate, TriggerKind::Auto, QString()}; }

    bool isFire() const { return action == Action::Fire; }
};

class TriggerPolicy {
public:
    struct Settings {
        int debounceMs = 300;
        int minTriggerIntervalMs = 300;
        double programmaticThreshold = 0.7;
        int lookbackBefore = 20;
        int lookbackAfter = 5;
        int minProgrammaticWindow = 10;
    };

    TriggerPolicy();
    explicit TriggerPolicy(const Settings &settings);

    static Settings settingsFrom(const CompletionConfig &config);

    TriggerDecision evaluate(const TriggerEvent &event, const TriggerSnapshot &snapshot);

    bool isProgrammatic(const QString &before, const QString &after) const;
    static bool isTriggerContext(const QString &before, const QString &after);
    static bool isPrintable(const QString &text);

    qint64 lastKeystrokeMs() const { return m_lastKeystrokeMs; }
    void reset();

    const Settings &settings() const { return m_settings; }

private:
    TriggerDecision fireOnce(TriggerKind kind, qint64 nowMs);

    Settings m_settings;
    qint64 m_lastKeystrokeMs = -1;
    qint64 m_lastFireMs = -1;
};
