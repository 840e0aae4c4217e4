#include "QualityEstimator.h"
#include <algorithm>
#include <cmath>

namespace Parley {

    namespace {
        constexpr double kEventScoreStep = 8.0;
        constexpr double kEventScoreDecay = 0.95;
    }

    void QualityEstimator::OnArrival(int64_t nowMs) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        if (m_HasArrival) {
            const double gap = static_cast<double>(nowMs - m_LastArrivalMs);
            m_JitterMs = 0.9 * m_JitterMs + 0.1 * std::fabs(gap - kExpectedGapMs);
            const double miss = std::max(0.0, (gap - 35.0) / 20.0);
            m_LossScore = std::min(100.0, 0.9 * m_LossScore + 10.0 * miss);
        }
        m_LastArrivalMs = nowMs;
        m_HasArrival = true;
        m_UnderflowScore += kEventScoreStep * m_PendingUnderflows.exchange(0, std::memory_order_relaxed);
        m_UnderflowScore *= kEventScoreDecay;
        m_OverflowScore *= kEventScoreDecay;
    }

    void QualityEstimator::OnUnderflow() {
        m_PendingUnderflows.fetch_add(1, std::memory_order_relaxed);
    }

    void QualityEstimator::OnOverflow() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_OverflowScore += kEventScoreStep;
    }

    void QualityEstimator::OnLatency(double latencyMs) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_LatencyMs = std::max(0.0, latencyMs);
    }

    double QualityEstimator::Score(double jitterMs, double latencyMs, double lossScore,
        double underflowScore, double overflowScore)
    {
        const double penalty = 1.5 * jitterMs
            + 0.6 * std::max(0.0, latencyMs - 60.0)
            + 0.8 * lossScore
            + 0.3 * underflowScore
            + 0.2 * overflowScore;
        return std::clamp(100.0 - penalty, 0.0, 100.0);
    }

    const char* QualityEstimator::Label(double score) {
        if (score >= 75.0) return "excellent";
        if (score >= 50.0) return "good";
        if (score >= 30.0) return "fair";
        return "poor";
    }

    QualitySnapshot QualityEstimator::Snapshot() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        QualitySnapshot s;
        s.jitterMs = m_JitterMs;
        s.lossScore = m_LossScore;
        s.latencyMs = m_LatencyMs;
        s.underflowScore = m_UnderflowScore
            + kEventScoreStep * m_PendingUnderflows.load(std::memory_order_relaxed);
        s.overflowScore = m_OverflowScore;
        s.score = Score(m_JitterMs, m_LatencyMs, m_LossScore, s.underflowScore, m_OverflowScore);
        s.label = Label(s.score);
        return s;
    }

    void QualityEstimator::Reset() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_LastArrivalMs = 0;
        m_HasArrival = false;
        m_JitterMs = m_LossScore = m_LatencyMs = 0.0;
        m_UnderflowScore = m_OverflowScore = 0.0;
        m_PendingUnderflows.store(0, std::memory_order_relaxed);
    }

    // ---------------------------------------------------------------------------

    uint32_t PingTracker::Register(int64_t nowMs) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        for (auto it = m_Sent.begin(); it != m_Sent.end(); ) {
            if (nowMs - it->second > kMaxAgeMs) it = m_Sent.erase(it);
            else ++it;
        }
        const uint32_t seq = m_NextSeq++;
        m_Sent[seq] = nowMs;
        return seq;
    }

    double PingTracker::Complete(uint32_t seq, int64_t nowMs) {
        std::lock_guard<std::mutex> lock(m_Mutex);
        auto it = m_Sent.find(seq);
        if (it == m_Sent.end()) return -1.0;
        const int64_t sent = it->second;
        m_Sent.erase(it);
        if (nowMs - sent > kMaxAgeMs) return -1.0;
        return static_cast<double>(std::max<int64_t>(0, nowMs - sent));
    }

    size_t PingTracker::Outstanding() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Sent.size();
    }

    void PingTracker::Reset() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Sent.clear();
        m_NextSeq = 0;
    }

} // namespace Parley
