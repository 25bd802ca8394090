// src/completion/TimeoutEstimator.hpp
#pragma once
#include <QList>
#include "CompletionTypes.hpp"

struct CompletionConfig;

// Adaptive request deadline. Learns from the durations of past requests
// and scales the result by how heavy the current request looks.
class TimeoutEstimator {
public:
    struct Settings {
        int baseTimeoutMs = 15000;
        int minTimeoutMs = 8000;
        int maxTimeoutMs = 30000;
        int historyCapacity = 50;
        int minSamples = 3;
    };

    struct Statistics {
        int totalRequests = 0;
        int successfulRequests = 0;
        int timedOutRequests = 0;
        double successRate = 0.0;
        qint64 avgDurationMs = 0;
        qint64 minDurationMs = 0;
        qint64 maxDurationMs = 0;
        qint64 historicalTimeoutMs = 0;
    };

    TimeoutEstimator();
    explicit TimeoutEstimator(const Settings &settings);

    static Settings settingsFrom(const CompletionConfig &config);

    qint64 estimate(const CompletionRequest &request) const;
    double complexityFactor(const CompletionRequest &request) const;
    qint64 historicalTimeout() const;

    void record(qint64 durationMs, const CompletionRequest &request, bool succeeded,
                bool timedOut = false, qint64 timestampMs = 0);

    Statistics statistics() const;
    void reset();
    bool adjustBaseTimeout(qint64 baseMs);
    bool isReasonable(qint64 timeoutMs) const;

    const QList<RequestMetric> &history() const { return m_history; }
    const Settings &settings() const { return m_settings; }

private:
    Settings m_settings;
    QList<RequestMetric> m_history;
};
