// src/completion/CompletionConfig.cpp
#include "CompletionConfig.hpp"
#include "CompletionLog.hpp"
#include <QSettings>
#include <utility>

namespace {

int readInt(QSettings &s, const QString &key, int fallback) {
    bool ok = false;
    int v = s.value(key, fallback).toInt(&ok);
    return ok ? v : fallback;
}

double readDouble(QSettings &s, const QString &key, double fallback) {
    bool ok = false;
    double v = s.value(key, fallback).toDouble(&ok);
    return ok ? v : fallback;
}

void resetIfNotPositive(int &value, int fallback, const QString &name, QStringList &out) {
    if (value > 0) return;
    out << QString("%1=%2 is not positive, using %3").arg(name).arg(value).arg(fallback);
    value = fallback;
}

}

CompletionConfig CompletionConfig::load(QSettings &s, QStringList *warnings) {
    CompletionConfig c;
    QStringList problems;

    const QString modeText = s.value("completion/mode", toString(c.mode)).toString();
    if (!parseCompletionMode(modeText, &c.mode))
        problems << QString("unknown completion/mode '%1', using %2").arg(modeText, toString(c.mode));

    c.baseTimeoutMs = readInt(s, "timeout/base_ms", c.baseTimeoutMs);
    c.minTimeoutMs = readInt(s, "timeout/min_ms", c.minTimeoutMs);
    c.maxTimeoutMs = readInt(s, "timeout/max_ms", c.maxTimeoutMs);
    c.historyCapacity = readInt(s, "timeout/history_capacity", c.historyCapacity);
    c.minHistorySamples = readInt(s, "timeout/min_samples", c.minHistorySamples);

    c.debounceMs = readInt(s, "trigger/debounce_ms", c.debounceMs);
    c.minTriggerIntervalMs = readInt(s, "trigger/min_interval_ms", c.minTriggerIntervalMs);
    c.programmaticThreshold = readDouble(s, "trigger/programmatic_threshold", c.programmaticThreshold);
    c.lookbackBefore = readInt(s, "trigger/lookback_before", c.lookbackBefore);
    c.lookbackAfter = readInt(s, "trigger/lookback_after", c.lookbackAfter);
    c.manualShortcut = s.value("trigger/manual_shortcut", c.manualShortcut).toString();

    c.contextBeforeChars = readInt(s, "context/before_chars", c.contextBeforeChars);
    c.contextAfterChars = readInt(s, "context/after_chars", c.contextAfterChars);

    c.minOverlapChars = readInt(s, "suggestion/min_overlap", c.minOverlapChars);
    c.maxSuggestionChars = readInt(s, "suggestion/max_chars", c.maxSuggestionChars);
    c.continueAfterAccept = s.value("suggestion/continue_after_accept", c.continueAfterAccept).toBool();
    c.continueDelayMs = readInt(s, "suggestion/continue_delay_ms", c.continueDelayMs);

    c.overlayEnabled = s.value("display/overlay", c.overlayEnabled).toBool();
    c.popupEnabled = s.value("display/popup", c.popupEnabled).toBool();

    c.loggingRules = s.value("logging/rules").toString();

    s.beginGroup("provider");
    c.provider.kind = s.value("kind", c.provider.kind).toString().trimmed().toLower();
    c.provider.command = s.value("command").toString();
    c.provider.arguments = s.value("arguments").toStringList();
    c.provider.endpoint = s.value("endpoint").toString();
    c.provider.apiKey = s.value("api_key").toString();
    c.provider.model = s.value("model").toString();
    c.provider.maxTokens = readInt(s, "max_tokens", c.provider.maxTokens);
    c.provider.temperature = readDouble(s, "temperature", c.provider.temperature);
    c.provider.systemPrompt = s.value("system_prompt").toString();
    s.endGroup();

    problems << c.normalize();
    for (const QString &p : std::as_const(problems))
        qCWarning(lcCompletion) << "config:" << p;
    if (warnings) *warnings = problems;
    return c;
}

void CompletionConfig::save(QSettings &s) const {
    s.setValue("completion/mode", toString(mode));

    s.setValue("timeout/base_ms", baseTimeoutMs);
    s.setValue("timeout/min_ms", minTimeoutMs);
    s.setValue("timeout/max_ms", maxTimeoutMs);
    s.setValue("timeout/history_capacity", historyCapacity);
    s.setValue("timeout/min_samples", minHistorySamples);

    s.setValue("trigger/debounce_ms", debounceMs);
    s.setValue("trigger/min_interval_ms", minTriggerIntervalMs);
    s.setValue("trigger/programmatic_threshold", programmaticThreshold);
    s.setValue("trigger/lookback_before", lookbackBefore);
    s.setValue("trigger/lookback_after", lookbackAfter);
    s.setValue("trigger/manual_shortcut", manualShortcut);

    s.setValue("context/before_chars", contextBeforeChars);
    s.setValue("context/after_chars", contextAfterChars);

    s.setValue("suggestion/min_overlap", minOverlapChars);
    s.setValue("suggestion/max_chars", maxSuggestionChars);
    s.setValue("suggestion/continue_after_accept", continueAfterAccept);
    s.setValue("suggestion/continue_delay_ms", continueDelayMs);

    s.setValue("display/overlay", overlayEnabled);
    s.setValue("display/popup", popupEnabled);

    if (!loggingRules.isEmpty()) s.setValue("logging/rules", loggingRules);

    s.beginGroup("provider");
    s.setValue("kind", provider.kind);
    s.setValue("command", provider.command);
    s.setValue("arguments", provider.arguments);
    s.setValue("endpoint", provider.endpoint);
    s.setValue("api_key", provider.apiKey);
    s.setValue("model", provider.model);
    s.setValue("max_tokens", provider.maxTokens);
    s.setValue("temperature", provider.temperature);
    s.setValue("system_prompt", provider.systemPrompt);
    s.endGroup();
}

QStringList CompletionConfig::normalize() {
    const CompletionConfig d;
    QStringList out;

    resetIfNotPositive(minTimeoutMs, d.minTimeoutMs, "timeout/min_ms", out);
    resetIfNotPositive(maxTimeoutMs, d.maxTimeoutMs, "timeout/max_ms", out);
    if (minTimeoutMs > maxTimeoutMs) {
        out << QString("timeout/min_ms %1 > timeout/max_ms %2, swapped").arg(minTimeoutMs).arg(maxTimeoutMs);
        std::swap(minTimeoutMs, maxTimeoutMs);
    }
    resetIfNotPositive(baseTimeoutMs, d.baseTimeoutMs, "timeout/base_ms", out);
    resetIfNotPositive(historyCapacity, d.historyCapacity, "timeout/history_capacity", out);
    resetIfNotPositive(minHistorySamples, d.minHistorySamples, "timeout/min_samples", out);

    if (debounceMs < 0) { out << "trigger/debounce_ms is negative, using 0"; debounceMs = 0; }
    if (minTriggerIntervalMs < 0) { out << "trigger/min_interval_ms is negative, using 0"; minTriggerIntervalMs = 0; }
    if (!(programmaticThreshold > 0.0) || programmaticThreshold > 1.0) {
        const double clamped = programmaticThreshold > 1.0 ? 1.0 : d.programmaticThreshold;
        out << QString("trigger/programmatic_threshold %1 outside (0, 1], using %2").arg(programmaticThreshold).arg(clamped);
        programmaticThreshold = clamped;
    }
    resetIfNotPositive(lookbackBefore, d.lookbackBefore, "trigger/lookback_before", out);
    if (lookbackAfter < 0) { out << "trigger/lookback_after is negative, using 0"; lookbackAfter = 0; }

    resetIfNotPositive(contextBeforeChars, d.contextBeforeChars, "context/before_chars", out);
    if (contextAfterChars < 0) { out << "context/after_chars is negative, using 0"; contextAfterChars = 0; }

    resetIfNotPositive(minOverlapChars, d.minOverlapChars, "suggestion/min_overlap", out);
    resetIfNotPositive(maxSuggestionChars, d.maxSuggestionChars, "suggestion/max_chars", out);
    if (continueDelayMs < 0) { out << "suggestion/continue_delay_ms is negative, using 0"; continueDelayMs = 0; }

    if (provider.kind != "process" && provider.kind != "http") {
        out << QString("unknown provider/kind '%1', using process").arg(provider.kind);
        provider.kind = "process";
    }
    resetIfNotPositive(provider.maxTokens, d.provider.maxTokens, "provider/max_tokens", out);
    return out;
}
