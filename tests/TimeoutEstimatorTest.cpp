// tests/TimeoutEstimatorTest.cpp
#include <gtest/gtest.h>
#include "completion/TimeoutEstimator.hpp"

namespace {

CompletionRequest smallRequest(TriggerKind kind = TriggerKind::Auto) {
    CompletionRequest r;
    r.textBeforeCursor = "The cat sat on the ";
    r.trigger = kind;
    return r;
}

}

TEST(TimeoutEstimator, FallsBackToBaseWithFewSamples) {
    TimeoutEstimator est;
    EXPECT_EQ(est.historicalTimeout(), 15000);
    est.record(1000, smallRequest(), true);
    est.record(1200, smallRequest(), true);
    EXPECT_EQ(est.historicalTimeout(), 15000);
    EXPECT_EQ(est.estimate(smallRequest()), 15000);
}

TEST(TimeoutEstimator, HistoricalIsMeanPlusTwoStddevOfSuccesses) {
    TimeoutEstimator est;
    est.record(1000, smallRequest(), true);
    est.record(2000, smallRequest(), true);
    est.record(3000, smallRequest(), true);
    // Failures never feed the historical figure.
    est.record(29000, smallRequest(), false, true);
    // mean 2000, population stddev 816.5
    EXPECT_EQ(est.historicalTimeout(), 3633);
    // below the floor, so the estimate clamps up
    EXPECT_EQ(est.estimate(smallRequest()), 8000);
}

TEST(TimeoutEstimator, ComplexityFactorScalesWithContext) {
    TimeoutEstimator est;
    EXPECT_DOUBLE_EQ(est.complexityFactor(smallRequest()), 1.0);
    EXPECT_NEAR(est.complexityFactor(smallRequest(TriggerKind::Manual)), 1.1, 1e-9);

    CompletionRequest heavy = smallRequest(TriggerKind::Manual);
    heavy.textBeforeCursor = QString(2500, QLatin1Char('a'));
    for (int i = 0; i < 6; ++i) heavy.references << QString("ref %1").arg(i);
    EXPECT_NEAR(est.complexityFactor(heavy), 1.5 * 1.1 * 1.1, 1e-9);

    CompletionRequest medium = smallRequest();
    medium.textBeforeCursor = QString(800, QLatin1Char('a'));
    medium.textAfterCursor = QString(300, QLatin1Char('b'));
    EXPECT_NEAR(est.complexityFactor(medium), 1.2, 1e-9);
}

TEST(TimeoutEstimator, EstimateNeverLeavesConfiguredRange) {
    TimeoutEstimator est;
    CompletionRequest heavy = smallRequest(TriggerKind::Manual);
    heavy.textBeforeCursor = QString(3000, QLatin1Char('x'));
    for (int i = 0; i < 12; ++i) heavy.references << QString::number(i);

    const qint64 durations[] = {0, 1, 50, 9000, 29999, 120000, 1000000000LL};
    for (qint64 d : durations) {
        est.record(d, smallRequest(), true);
        for (const CompletionRequest &r : {smallRequest(), heavy}) {
            const qint64 t = est.estimate(r);
            EXPECT_GE(t, 8000) << "after recording " << d;
            EXPECT_LE(t, 30000) << "after recording " << d;
        }
    }
}

TEST(TimeoutEstimator, HistoryEvictsOldestAtCapacity) {
    TimeoutEstimator::Settings s;
    s.historyCapacity = 3;
    TimeoutEstimator est(s);
    for (int i = 1; i <= 5; ++i) est.record(i * 100, smallRequest(), true, false, i);
    ASSERT_EQ(est.history().size(), 3);
    EXPECT_EQ(est.history().first().durationMs, 300);
    EXPECT_EQ(est.history().last().durationMs, 500);
}

TEST(TimeoutEstimator, StatisticsSummarizeHistory) {
    TimeoutEstimator est;
    est.record(1000, smallRequest(), true);
    est.record(3000, smallRequest(), true);
    est.record(9000, smallRequest(), false, true);
    est.record(500, smallRequest(), false);

    const TimeoutEstimator::Statistics st = est.statistics();
    EXPECT_EQ(st.totalRequests, 4);
    EXPECT_EQ(st.successfulRequests, 2);
    EXPECT_EQ(st.timedOutRequests, 1);
    EXPECT_DOUBLE_EQ(st.successRate, 50.0);
    EXPECT_EQ(st.avgDurationMs, 2000);
    EXPECT_EQ(st.minDurationMs, 500);
    EXPECT_EQ(st.maxDurationMs, 9000);
    EXPECT_EQ(st.historicalTimeoutMs, 15000);

    est.reset();
    EXPECT_TRUE(est.history().isEmpty());
    EXPECT_EQ(est.statistics().totalRequests, 0);
}

TEST(TimeoutEstimator, BaseTimeoutOnlyAdjustsWithinRange) {
    TimeoutEstimator est;
    EXPECT_TRUE(est.isReasonable(8000));
    EXPECT_FALSE(est.isReasonable(7999));
    EXPECT_TRUE(est.adjustBaseTimeout(20000));
    EXPECT_EQ(est.settings().baseTimeoutMs, 20000);
    EXPECT_FALSE(est.adjustBaseTimeout(40000));
    EXPECT_EQ(est.settings().baseTimeoutMs, 20000);
    EXPECT_EQ(est.estimate(smallRequest()), 20000);
}

TEST(TimeoutEstimator, SwappedRangeIsRepaired) {
    TimeoutEstimator::Settings s;
    s.minTimeoutMs = 30000;
    s.maxTimeoutMs = 8000;
    TimeoutEstimator est(s);
    EXPECT_EQ(est.settings().minTimeoutMs, 8000);
    EXPECT_EQ(est.settings().maxTimeoutMs, 30000);
}
