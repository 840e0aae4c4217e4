#include "AudioPipeline.h"
#include "../core/Logger.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <iterator>

namespace Parley {

    AudioPipeline::AudioPipeline(const AudioSettings& settings)
        : m_Settings(settings)
        , m_Mic(settings.vadThreshold, settings.speakingHoldMs)
        , m_Peer(settings.vadThreshold, settings.speakingHoldMs)
        , m_MicEnabled(settings.micEnabled)
        , m_SoundEnabled(settings.soundEnabled)
    {
    }

    // ---------------------------------------------------------------------------
    // Capture
    // ---------------------------------------------------------------------------
    void AudioPipeline::ProcessCapture(const int16_t* in, size_t samples, int64_t nowMs) {
        if (!in || samples == 0) return;
        m_Mic.Update(in, samples, nowMs);

        const bool send = m_MicEnabled.load(std::memory_order_relaxed) && m_Sink;
        if (!send) {
            m_CaptureFill = 0;
            return;
        }

        size_t offset = 0;
        while (offset < samples) {
            const size_t n = std::min(samples - offset, m_CaptureStage.size() - m_CaptureFill);
            std::memcpy(m_CaptureStage.data() + m_CaptureFill, in + offset, n * sizeof(int16_t));
            m_CaptureFill += n;
            offset += n;
            if (m_CaptureFill == m_CaptureStage.size()) {
                m_Sink(m_CaptureStage.data(), m_CaptureStage.size());
                m_CaptureFill = 0;
            }
        }
    }

    // ---------------------------------------------------------------------------
    // Playback
    // ---------------------------------------------------------------------------
    void AudioPipeline::PlayFrame(int16_t* out, int64_t nowMs) {
        std::unique_lock<std::mutex> lock(m_SpeakersMutex, std::try_to_lock);
        if (!lock.owns_lock()) {
            // out still holds the previous block.
            m_MixContended.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        m_Mix.fill(0);
        uint64_t stalls = 0;
        for (auto& entry : m_Speakers) {
            const PlayoutResult r = entry.second->jitter.Pull(m_SpeakerFrame.data(), nowMs,
                m_Settings.plcWindowMs, m_Settings.maxPlcFrames);
            if (r == PlayoutResult::Concealed || r == PlayoutResult::Underflow) {
                m_Quality.OnUnderflow();
                ++stalls;
            }
            if (r == PlayoutResult::Frame || r == PlayoutResult::Concealed) {
                for (size_t i = 0; i < m_Mix.size(); ++i) m_Mix[i] += m_SpeakerFrame[i];
            }
        }
        const size_t speakers = m_Speakers.size();
        lock.unlock();

        for (size_t i = 0; i < m_Mix.size(); ++i)
            out[i] = static_cast<int16_t>(std::clamp<int32_t>(m_Mix[i], -32768, 32767));

        if (stalls > 0) {
            const uint64_t n = m_PlayoutStalls.fetch_add(stalls, std::memory_order_relaxed) + stalls;
            if (n <= 10 || (n - stalls) / 50 != n / 50) {
                char buf[96];
                std::snprintf(buf, sizeof(buf), "step=playout_underflow total=%llu speakers=%zu",
                    static_cast<unsigned long long>(n), speakers);
                Logger::Instance().LogVoiceTraceBufNonBlocking(buf);
            }
        }
    }

    void AudioPipeline::ProcessPlayback(int16_t* out, size_t samples, int64_t nowMs) {
        if (!out || samples == 0) return;

        size_t written = 0;
        while (written < samples) {
            if (m_PlayPos == m_PlayStage.size()) {
                PlayFrame(m_PlayStage.data(), nowMs);
                m_PlayPos = 0;
            }
            const size_t n = std::min(samples - written, m_PlayStage.size() - m_PlayPos);
            std::memcpy(out + written, m_PlayStage.data() + m_PlayPos, n * sizeof(int16_t));
            m_PlayPos += n;
            written += n;
        }

        // Muted output still drains the buffer so unmuting resumes with fresh audio.
        if (!m_SoundEnabled.load(std::memory_order_relaxed))
            std::memset(out, 0, samples * sizeof(int16_t));
    }

    // ---------------------------------------------------------------------------
    // Receive side (transport thread)
    // ---------------------------------------------------------------------------
    void AudioPipeline::OnRelayedAudio(const std::string& from, const uint8_t* pcm, size_t bytes, int64_t nowMs) {
        // The datagram payload has no alignment guarantee.
        std::array<int16_t, kFrameSamples> frame{};
        const size_t samples = std::min(bytes / sizeof(int16_t), frame.size());
        if (samples > 0) std::memcpy(frame.data(), pcm, samples * sizeof(int16_t));

        m_Quality.OnArrival(nowMs);
        m_Peer.Update(frame.data(), samples, nowMs);

        size_t added = 0;
        bool kept = true;
        {
            std::lock_guard<std::mutex> lock(m_SpeakersMutex);
            EvictIdleLocked(nowMs);
            auto it = m_Speakers.find(from);
            if (it == m_Speakers.end()) {
                if (m_Speakers.size() >= kMaxSpeakers) {
                    auto oldest = m_Speakers.begin();
                    for (auto s = m_Speakers.begin(); s != m_Speakers.end(); ++s)
                        if (s->second->lastArrivalMs < oldest->second->lastArrivalMs) oldest = s;
                    RetireLocked(oldest);
                }
                it = m_Speakers.emplace(from, std::make_unique<Speaker>(m_Settings)).first;
                added = m_Speakers.size();
            }
            it->second->lastArrivalMs = nowMs;
            kept = it->second->jitter.Push(frame.data(), samples, nowMs);
        }
        if (!kept) m_Quality.OnOverflow();
        if (added > 0) LOG_AUDIO("new speaker " + from + ", " + std::to_string(added) + " mixed");
    }

    void AudioPipeline::RetireLocked(std::unordered_map<std::string, std::unique_ptr<Speaker>>::iterator it) {
        const JitterStats s = it->second->jitter.Stats();
        m_Retired.pushed += s.pushed;
        m_Retired.played += s.played;
        m_Retired.underflows += s.underflows;
        m_Retired.overflows += s.overflows;
        m_Retired.concealed += s.concealed;
        m_Retired.busy += s.busy;
        m_Speakers.erase(it);
    }

    void AudioPipeline::EvictIdleLocked(int64_t nowMs) {
        if (nowMs - m_LastEvictScanMs < 1'000) return;
        m_LastEvictScanMs = nowMs;
        for (auto it = m_Speakers.begin(); it != m_Speakers.end();) {
            auto next = std::next(it);
            if (nowMs - it->second->lastArrivalMs > kSpeakerIdleMs) RetireLocked(it);
            it = next;
        }
    }

    size_t AudioPipeline::QueuedFrames() const {
        std::lock_guard<std::mutex> lock(m_SpeakersMutex);
        size_t n = 0;
        for (const auto& entry : m_Speakers) n += entry.second->jitter.Size();
        return n;
    }

    size_t AudioPipeline::SpeakerCount() const {
        std::lock_guard<std::mutex> lock(m_SpeakersMutex);
        return m_Speakers.size();
    }

    JitterStats AudioPipeline::Jitter() const {
        std::lock_guard<std::mutex> lock(m_SpeakersMutex);
        JitterStats total = m_Retired;
        for (const auto& entry : m_Speakers) {
            const JitterStats s = entry.second->jitter.Stats();
            total.pushed += s.pushed;
            total.played += s.played;
            total.underflows += s.underflows;
            total.overflows += s.overflows;
            total.concealed += s.concealed;
            total.busy += s.busy;
            total.depth += s.depth;
            total.primed = total.primed || s.primed;
        }
        return total;
    }

    ActivitySnapshot AudioPipeline::Activity(int64_t nowMs) const {
        ActivitySnapshot a;
        const bool mic = m_MicEnabled.load(std::memory_order_relaxed);
        const bool sound = m_SoundEnabled.load(std::memory_order_relaxed);
        a.micLevel = m_Mic.Level();
        a.peerLevel = m_Peer.Level();
        a.meSpeaking = mic && m_Mic.IsSpeaking(nowMs);
        a.peerSpeaking = sound && m_Peer.IsSpeaking(nowMs);

        const QualitySnapshot q = m_Quality.Snapshot();
        a.latencyMs = q.latencyMs;
        a.jitterMs = q.jitterMs;
        a.lossScore = q.lossScore;
        a.qualityScore = q.score;
        a.quality = q.label;
        a.jitter = Jitter();
        return a;
    }

    void AudioPipeline::Reset() {
        {
            std::lock_guard<std::mutex> lock(m_SpeakersMutex);
            m_Speakers.clear();
            m_Retired = JitterStats{};
            m_LastEvictScanMs = 0;
        }
        m_PlayoutStalls.store(0, std::memory_order_relaxed);
        m_MixContended.store(0, std::memory_order_relaxed);
        m_PlayStage.fill(0);
        m_Quality.Reset();
        m_Mic.Reset();
        m_Peer.Reset();
        m_CaptureFill = 0;
        m_PlayPos = m_PlayStage.size();
    }

} // namespace Parley
