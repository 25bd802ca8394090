// src/completion/TimeoutEstimator.cpp
#include "TimeoutEstimator.hpp"
#include "CompletionConfig.hpp"
#include "CompletionLog.hpp"
#include <QDateTime>
#include <algorithm>
#include <cmath>
#include <utility>

TimeoutEstimator::TimeoutEstimator() : TimeoutEstimator(Settings()) {}

TimeoutEstimator::TimeoutEstimator(const Settings &settings) : m_settings(settings) {
    if (m_settings.minTimeoutMs > m_settings.maxTimeoutMs)
        std::swap(m_settings.minTimeoutMs, m_settings.maxTimeoutMs);
    m_settings.historyCapacity = std::max(1, m_settings.historyCapacity);
    m_settings.minSamples = std::max(1, m_settings.minSamples);
    qCInfo(lcTimeout) << "timeout estimator: base" << m_settings.baseTimeoutMs
                      << "ms, range" << m_settings.minTimeoutMs << "-" << m_settings.maxTimeoutMs << "ms";
}

TimeoutEstimator::Settings TimeoutEstimator::settingsFrom(const CompletionConfig &config) {
    Settings s;
    s.baseTimeoutMs = config.baseTimeoutMs;
    s.minTimeoutMs = config.minTimeoutMs;
    s.maxTimeoutMs = config.maxTimeoutMs;
    s.historyCapacity = config.historyCapacity;
    s.minSamples = config.minHistorySamples;
    return s;
}

qint64 TimeoutEstimator::estimate(const CompletionRequest &request) const {
    const qint64 historical = historicalTimeout();
    const double factor = complexityFactor(request);
    const double scaled = static_cast<double>(historical) * factor;
    const qint64 lo = m_settings.minTimeoutMs;
    const qint64 hi = m_settings.maxTimeoutMs;
    qint64 result = hi;
    if (std::isfinite(scaled))
        result = std::clamp(static_cast<qint64>(std::llround(std::min(scaled, double(hi)))), lo, hi);
    qCDebug(lcTimeout) << "estimate: historical" << historical << "ms, complexity" << factor
                       << ", final" << result << "ms";
    return result;
}

qint64 TimeoutEstimator::historicalTimeout() const {
    QList<qint64> durations;
    for (const RequestMetric &m : m_history)
        if (m.succeeded) durations.append(m.durationMs);
    if (durations.size() < m_settings.minSamples)
        return m_settings.baseTimeoutMs;

    double sum = 0.0;
    for (qint64 d : std::as_const(durations)) sum += double(d);
    const double mean = sum / durations.size();
    double variance = 0.0;
    for (qint64 d : std::as_const(durations)) variance += (double(d) - mean) * (double(d) - mean);
    variance /= durations.size();
    const double stddev = std::sqrt(variance);

    qCDebug(lcTimeout) << "historical: mean" << mean << "ms, stddev" << stddev << "ms over"
                       << durations.size() << "samples";
    return static_cast<qint64>(std::llround(mean + 2.0 * stddev));
}

double TimeoutEstimator::complexityFactor(const CompletionRequest &request) const {
    double factor = 1.0;

    const int textLength = request.textBeforeCursor.size() + request.textAfterCursor.size();
    if (textLength > 2000) factor *= 1.5;
    else if (textLength > 1000) factor *= 1.2;
    else if (textLength > 500) factor *= 1.1;

    const int references = request.references.size();
    if (references > 10) factor *= 1.3;
    else if (references > 5) factor *= 1.1;

    // the user is explicitly waiting on a manual request
    if (request.trigger == TriggerKind::Manual) factor *= 1.1;

    return factor;
}

void TimeoutEstimator::record(qint64 durationMs, const CompletionRequest &request, bool succeeded,
                              bool timedOut, qint64 timestampMs) {
    RequestMetric m;
    m.durationMs = std::max<qint64>(0, durationMs);
    m.complexityScore = complexityFactor(request);
    m.succeeded = succeeded;
    m.timedOut = timedOut;
    m.timestampMs = timestampMs ? timestampMs : QDateTime::currentMSecsSinceEpoch();

    m_history.append(m);
    while (m_history.size() > m_settings.historyCapacity)
        m_history.removeFirst();

    qCDebug(lcTimeout) << "record: duration" << m.durationMs << "ms, complexity" << m.complexityScore
                       << (succeeded ? "ok" : (timedOut ? "timed out" : "failed"))
                       << "history" << m_history.size();
}

TimeoutEstimator::Statistics TimeoutEstimator::statistics() const {
    Statistics st;
    st.historicalTimeoutMs = historicalTimeout();
    st.totalRequests = m_history.size();
    if (m_history.isEmpty()) return st;

    qint64 successSum = 0;
    st.minDurationMs = m_history.first().durationMs;
    st.maxDurationMs = m_history.first().durationMs;
    for (const RequestMetric &m : m_history) {
        if (m.succeeded) { ++st.successfulRequests; successSum += m.durationMs; }
        if (m.timedOut) ++st.timedOutRequests;
        st.minDurationMs = std::min(st.minDurationMs, m.durationMs);
        st.maxDurationMs = std::max(st.maxDurationMs, m.durationMs);
    }
    st.successRate = 100.0 * st.successfulRequests / st.totalRequests;
    if (st.successfulRequests > 0) st.avgDurationMs = successSum / st.successfulRequests;
    return st;
}

void TimeoutEstimator::reset() {
    m_history.clear();
    qCInfo(lcTimeout) << "timeout history cleared";
}

bool TimeoutEstimator::adjustBaseTimeout(qint64 baseMs) {
    if (!isReasonable(baseMs)) {
        qCWarning(lcTimeout) << "base timeout" << baseMs << "ms outside" << m_settings.minTimeoutMs
                             << "-" << m_settings.maxTimeoutMs << "ms, ignored";
        return false;
    }
    qCInfo(lcTimeout) << "base timeout" << m_settings.baseTimeoutMs << "->" << baseMs << "ms";
    m_settings.baseTimeoutMs = static_cast<int>(baseMs);
    return true;
}

bool TimeoutEstimator::isReasonable(qint64 timeoutMs) const {
    return timeoutMs >= m_settings.minTimeoutMs && timeoutMs <= m_settings.maxTimeoutMs;
}
