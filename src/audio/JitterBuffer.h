#pragma once
#include "../shared/Protocol.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace Parley {

    enum class PlayoutResult {
        Frame,      // queued audio
        Concealed,  // repeat of the last frame
        Priming,    // silence while the prefill cushion builds
        Underflow,  // silence after the stream stalled
        Busy        // lock held by another thread; silence, state untouched
    };

    struct JitterStats {
        uint64_t pushed = 0;
        uint64_t played = 0;
        uint64_t underflows = 0;
        uint64_t overflows = 0;
        uint64_t concealed = 0;
        uint64_t busy = 0;
        size_t   depth = 0;
        bool     primed = false;
    };

    // ---------------------------------------------------------------------------
    // Bounded FIFO of fixed-size PCM frames between the receive thread and the
    // playback callback. Overflow evicts the oldest frame. Playout waits for
    // `prefill` frames before starting; an empty buffer repeats the last frame
    // for a short while (PLC) and otherwise plays silence and re-primes.
    // Pull runs on the playback callback and never waits for the lock.
    // ---------------------------------------------------------------------------
    class JitterBuffer {
    public:
        JitterBuffer(size_t capacity = 12, size_t prefill = 3, size_t frameSamples = kFrameSamples);

        // Short frames are zero padded, long ones truncated. Returns false when
        // the push evicted the oldest frame.
        bool Push(const int16_t* samples, size_t count, int64_t nowMs);

        // Fills exactly frameSamples samples. Non-blocking.
        PlayoutResult Pull(int16_t* out, int64_t nowMs, int64_t plcWindowMs, int maxPlcFrames);

        void Clear();

        size_t Size() const;
        size_t FrameSamples() const { return m_FrameSamples; }
        JitterStats Stats() const;

    private:
        const size_t m_Capacity;
        const size_t m_Prefill;
        const size_t m_FrameSamples;

        mutable std::mutex m_Mutex;
        std::deque<std::vector<int16_t>> m_Frames;
        std::vector<int16_t> m_LastPlayed;
        bool    m_HasLastPlayed = false;
        bool    m_Primed = false;
        int     m_ConsecutivePlc = 0;
        int64_t m_LastArrivalMs = 0;
        bool    m_HasArrival = false;

        JitterStats m_Stats;
        std::atomic<uint64_t> m_Busy{ 0 };
    };

} // namespace Parley
