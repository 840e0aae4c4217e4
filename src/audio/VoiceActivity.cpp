#include "VoiceActivity.h"
#include <cmath>

namespace Parley {

    float ComputeRmsS16(const int16_t* samples, size_t count) noexcept {
        if (!samples || count == 0) return 0.0f;
        double sum = 0.0;
        for (size_t i = 0; i < count; ++i) {
            const double s = samples[i] / 32768.0;
            sum += s * s;
        }
        return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
    }

    float VoiceActivity::Update(const int16_t* samples, size_t count, int64_t nowMs) noexcept {
        const float rms = ComputeRmsS16(samples, count);
        m_Level.store(rms, std::memory_order_relaxed);
        if (rms >= m_Threshold) {
            m_LastVoiceMs.store(nowMs, std::memory_order_relaxed);
            m_HeardVoice.store(true, std::memory_order_release);
        }
        return rms;
    }

    bool VoiceActivity::IsSpeaking(int64_t nowMs) const noexcept {
        if (!m_HeardVoice.load(std::memory_order_acquire)) return false;
        return nowMs - m_LastVoiceMs.load(std::memory_order_relaxed) < m_HoldMs;
    }

    void VoiceActivity::Reset() noexcept {
        m_Level.store(0.0f, std::memory_order_relaxed);
        m_LastVoiceMs.store(0, std::memory_order_relaxed);
        m_HeardVoice.store(false, std::memory_order_release);
    }

} // namespace Parley
