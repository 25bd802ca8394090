// src/completion/CompletionConfig.hpp
#pragma once
#include <QString>
#include <QStringList>
#include "CompletionTypes.hpp"

class QSettings;

struct ProviderConfig {
    QString kind = "process";
    QString command;
    QStringList arguments;
    QString endpoint;
    QString apiKey;
    QString model;
    int maxTokens = 256;
    double temperature = 0.8;
    QString systemPrompt;
};

struct CompletionConfig {
    CompletionMode mode = CompletionMode::ManualOnly;

    int baseTimeoutMs = 15000;
    int minTimeoutMs = 8000;
    int maxTimeoutMs = 30000;
    int historyCapacity = 50;
    int minHistorySamples = 3;

    int debounceMs = 300;
    int minTriggerIntervalMs = 300;
    double programmaticThreshold = 0.7;
    int lookbackBefore = 20;
    int lookbackAfter = 5;
    QString manualShortcut = "Ctrl+Space";

    int contextBeforeChars = 500;
    int contextAfterChars = 100;

    int minOverlapChars = 5;
    int maxSuggestionChars = 200;
    bool continueAfterAccept = true;
    int continueDelayMs = 500;

    bool overlayEnabled = true;
    bool popupEnabled = true;

    QString loggingRules;

    ProviderConfig provider;

    static CompletionConfig load(QSettings &settings, QStringList *warnings = nullptr);
    void save(QSettings &settings) const;

    // Repairs inconsistent values in place; returns one message per correction.
    QStringList normalize();
};
