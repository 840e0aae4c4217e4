#include <gtest/gtest.h>
#include "../src/audio/QualityEstimator.h"
#include <thread>
#include <vector>

using namespace Parley;

TEST(QualityEstimator, FreshStateIsExcellent) {
    QualityEstimator q;
    const QualitySnapshot s = q.Snapshot();
    EXPECT_DOUBLE_EQ(s.score, 100.0);
    EXPECT_STREQ(s.label, "excellent");
}

TEST(QualityEstimator, SteadyArrivalsKeepJitterAtZero) {
    QualityEstimator q;
    for (int i = 0; i < 50; ++i) q.OnArrival(1000 + i * 20);
    const QualitySnapshot s = q.Snapshot();
    EXPECT_DOUBLE_EQ(s.jitterMs, 0.0);
    EXPECT_DOUBLE_EQ(s.lossScore, 0.0);
}

TEST(QualityEstimator, GapUpdatesJitterAndLoss) {
    QualityEstimator q;
    q.OnArrival(0);
    q.OnArrival(75);
    const QualitySnapshot s = q.Snapshot();
    // |75 - 20| * 0.1
    EXPECT_NEAR(s.jitterMs, 5.5, 1e-9);
    // 10 * (75 - 35) / 20
    EXPECT_NEAR(s.lossScore, 20.0, 1e-9);
}

TEST(QualityEstimator, LossIsCapped) {
    QualityEstimator q;
    q.OnArrival(0);
    q.OnArrival(100'000);
    EXPECT_DOUBLE_EQ(q.Snapshot().lossScore, 100.0);
}

TEST(QualityEstimator, EventScoresDecayPerArrival) {
    QualityEstimator q;
    q.OnUnderflow();
    q.OnUnderflow();
    q.OnOverflow();
    QualitySnapshot s = q.Snapshot();
    EXPECT_DOUBLE_EQ(s.underflowScore, 16.0);
    EXPECT_DOUBLE_EQ(s.overflowScore, 8.0);

    q.OnArrival(0);
    s = q.Snapshot();
    EXPECT_NEAR(s.underflowScore, 16.0 * 0.95, 1e-9);
    EXPECT_NEAR(s.overflowScore, 8.0 * 0.95, 1e-9);
}

TEST(QualityEstimator, ScoreFormulaAndClamp) {
    EXPECT_DOUBLE_EQ(QualityEstimator::Score(0, 60, 0, 0, 0), 100.0);
    EXPECT_NEAR(QualityEstimator::Score(10, 110, 5, 10, 10), 100.0 - (15 + 30 + 4 + 3 + 2), 1e-9);
    EXPECT_DOUBLE_EQ(QualityEstimator::Score(100, 500, 100, 100, 100), 0.0);
}

TEST(QualityEstimator, Labels) {
    EXPECT_STREQ(QualityEstimator::Label(75.0), "excellent");
    EXPECT_STREQ(QualityEstimator::Label(74.9), "good");
    EXPECT_STREQ(QualityEstimator::Label(50.0), "good");
    EXPECT_STREQ(QualityEstimator::Label(30.0), "fair");
    EXPECT_STREQ(QualityEstimator::Label(29.9), "poor");
}

TEST(QualityEstimator, LatencyFeedsScore) {
    QualityEstimator q;
    q.OnLatency(160.0);
    const QualitySnapshot s = q.Snapshot();
    EXPECT_DOUBLE_EQ(s.latencyMs, 160.0);
    EXPECT_DOUBLE_EQ(s.score, 40.0);
    EXPECT_STREQ(s.label, "fair");
}

TEST(PingTracker, MatchesOutstandingSequence) {
    PingTracker t;
    const uint32_t a = t.Register(1000);
    const uint32_t b = t.Register(1010);
    EXPECT_NE(a, b);
    EXPECT_EQ(t.Outstanding(), 2u);
    EXPECT_DOUBLE_EQ(t.Complete(b, 1050), 40.0);
    EXPECT_LT(t.Complete(b, 1060), 0.0);
    EXPECT_LT(t.Complete(999, 1060), 0.0);
    EXPECT_EQ(t.Outstanding(), 1u);
}

TEST(PingTracker, OldEntriesArePurged) {
    PingTracker t;
    const uint32_t old = t.Register(0);
    t.Register(PingTracker::kMaxAgeMs + 1);
    EXPECT_EQ(t.Outstanding(), 1u);
    EXPECT_LT(t.Complete(old, PingTracker::kMaxAgeMs + 2), 0.0);
}

TEST(PingTracker, LateReplyIsIgnored) {
    PingTracker t;
    const uint32_t seq = t.Register(0);
    EXPECT_LT(t.Complete(seq, PingTracker::kMaxAgeMs + 1), 0.0);
}

TEST(QualityEstimator, UnderflowsFromSeveralThreadsAreAllCounted) {
    QualityEstimator q;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
        threads.emplace_back([&q] { for (int i = 0; i < 1'000; ++i) q.OnUnderflow(); });
    for (auto& t : threads) t.join();
    EXPECT_DOUBLE_EQ(q.Snapshot().underflowScore, 4'000 * 8.0);

    // Folded into the score on the next arrival, then decayed.
    q.OnArrival(0);
    EXPECT_NEAR(q.Snapshot().underflowScore, 4'000 * 8.0 * 0.95, 1e-6);
}

