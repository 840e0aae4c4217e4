#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>

namespace Parley {

    // RMS of signed 16-bit samples normalized to [0, 1]. 0 for an empty block.
    [[nodiscard]] float ComputeRmsS16(const int16_t* samples, size_t count) noexcept;

    // Level meter with speaking hysteresis: speaking while the last block at or
    // above the threshold is younger than holdMs. Written by one thread, read
    // from any.
    class VoiceActivity {
    public:
        VoiceActivity(float threshold, int64_t holdMs) : m_Threshold(threshold), m_HoldMs(holdMs) {}

        float Update(const int16_t* samples, size_t count, int64_t nowMs) noexcept;

        bool IsSpeaking(int64_t nowMs) const noexcept;
        float Level() const noexcept { return m_Level.load(std::memory_order_relaxed); }
        void Reset() noexcept;

    private:
        float   m_Threshold;
        int64_t m_HoldMs;

        std::atomic<float>   m_Level{ 0.0f };
        std::atomic<int64_t> m_LastVoiceMs{ 0 };
        std::atomic<bool>    m_HeardVoice{ false };
    };

} // namespace Parley
