#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace Parley {

    struct QualitySnapshot {
        double      jitterMs = 0.0;
        double      lossScore = 0.0;
        double      latencyMs = 0.0;
        double      underflowScore = 0.0;
        double      overflowScore = 0.0;
        double      score = 100.0;
        const char* label = "excellent";
    };

    // Link quality from the receive side only. Display only; nothing gates on it.
    class QualityEstimator {
    public:
        static constexpr double kExpectedGapMs = 20.0;

        // Inter-arrival update for one relayed frame. The first arrival only
        // seeds the clock.
        void OnArrival(int64_t nowMs);
        // Lock-free; safe from the playback callback.
        void OnUnderflow();
        void OnOverflow();
        void OnLatency(double latencyMs);

        QualitySnapshot Snapshot() const;
        void Reset();

        static double Score(double jitterMs, double latencyMs, double lossScore,
            double underflowScore, double overflowScore);
        static const char* Label(double score);

    private:
        mutable std::mutex m_Mutex;
        int64_t m_LastArrivalMs = 0;
        bool    m_HasArrival = false;
        double  m_JitterMs = 0.0;
        double  m_LossScore = 0.0;
        double  m_LatencyMs = 0.0;
        double  m_UnderflowScore = 0.0;
        double  m_OverflowScore = 0.0;
        // Underflows not yet folded into m_UnderflowScore.
        std::atomic<uint32_t> m_PendingUnderflows{ 0 };
    };

    // Outstanding P| probes keyed by sequence number.
    class PingTracker {
    public:
        static constexpr int64_t kMaxAgeMs = 5'000;

        uint32_t Register(int64_t nowMs);
        // Round trip in ms for a known sequence, or a negative value.
        double Complete(uint32_t seq, int64_t nowMs);
        size_t Outstanding() const;
        void Reset();

    private:
        mutable std::mutex m_Mutex;
        uint32_t m_NextSeq = 0;
        std::unordered_map<uint32_t, int64_t> m_Sent;
    };

} // namespace Parley
