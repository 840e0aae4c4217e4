#include "JitterBuffer.h"
#include <algorithm>
#include <cstring>

namespace Parley {

    JitterBuffer::JitterBuffer(size_t capacity, size_t prefill, size_t frameSamples)
        : m_Capacity(std::max<size_t>(1, capacity))
        , m_Prefill(std::min(std::max<size_t>(1, prefill), std::max<size_t>(1, capacity)))
        , m_FrameSamples(std::max<size_t>(1, frameSamples))
        , m_LastPlayed(m_FrameSamples, 0)
    {
    }

    bool JitterBuffer::Push(const int16_t* samples, size_t count, int64_t nowMs) {
        std::vector<int16_t> frame(m_FrameSamples, 0);
        if (samples && count > 0)
            std::memcpy(frame.data(), samples, std::min(count, m_FrameSamples) * sizeof(int16_t));

        std::lock_guard<std::mutex> lock(m_Mutex);
        bool kept = true;
        if (m_Frames.size() >= m_Capacity) {
            m_Frames.pop_front();
            ++m_Stats.overflows;
            kept = false;
        }
        m_Frames.push_back(std::move(frame));
        ++m_Stats.pushed;
        m_LastArrivalMs = nowMs;
        m_HasArrival = true;
        return kept;
    }

    PlayoutResult JitterBuffer::Pull(int16_t* out, int64_t nowMs, int64_t plcWindowMs, int maxPlcFrames) {
        std::unique_lock<std::mutex> lock(m_Mutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            m_Busy.fetch_add(1, std::memory_order_relaxed);
            std::memset(out, 0, m_FrameSamples * sizeof(int16_t));
            return PlayoutResult::Busy;
        }

        if (!m_Primed) {
            if (m_Frames.size() < m_Prefill) {
                std::memset(out, 0, m_FrameSamples * sizeof(int16_t));
                return PlayoutResult::Priming;
            }
            m_Primed = true;
        }

        if (m_Frames.empty()) {
            ++m_Stats.underflows;
            const bool recent = m_HasArrival && nowMs - m_LastArrivalMs < plcWindowMs;
            if (recent && m_HasLastPlayed && m_ConsecutivePlc < maxPlcFrames) {
                ++m_ConsecutivePlc;
                ++m_Stats.concealed;
                std::memcpy(out, m_LastPlayed.data(), m_FrameSamples * sizeof(int16_t));
                return PlayoutResult::Concealed;
            }
            // Stream stalled: rebuild the cushion before playing again.
            m_Primed = false;
            std::memset(out, 0, m_FrameSamples * sizeof(int16_t));
            return PlayoutResult::Underflow;
        }

        m_LastPlayed.swap(m_Frames.front());
        m_Frames.pop_front();
        m_HasLastPlayed = true;
        m_ConsecutivePlc = 0;
        ++m_Stats.played;
        std::memcpy(out, m_LastPlayed.data(), m_FrameSamples * sizeof(int16_t));
        return PlayoutResult::Frame;
    }

    void JitterBuffer::Clear() {
        std::lock_guard<std::mutex> lock(m_Mutex);
        m_Frames.clear();
        std::fill(m_LastPlayed.begin(), m_LastPlayed.end(), int16_t{ 0 });
        m_HasLastPlayed = false;
        m_Primed = false;
        m_ConsecutivePlc = 0;
        m_LastArrivalMs = 0;
        m_HasArrival = false;
        m_Stats = JitterStats{};
        m_Busy.store(0, std::memory_order_relaxed);
    }

    size_t JitterBuffer::Size() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        return m_Frames.size();
    }

    JitterStats JitterBuffer::Stats() const {
        std::lock_guard<std::mutex> lock(m_Mutex);
        JitterStats s = m_Stats;
        s.busy = m_Busy.load(std::memory_order_relaxed);
        s.depth = m_Frames.size();
        s.primed = m_Primed;
        return s;
    }

} // namespace Parley
