#pragma once
#include "JitterBuffer.h"
#include "QualityEstimator.h"
#include "VoiceActivity.h"
#include "../core/ConfigManager.h"
#include "../shared/Protocol.h"
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace Parley {

    struct ActivitySnapshot {
        float       micLevel = 0.0f;
        float       peerLevel = 0.0f;
        bool        meSpeaking = false;
        bool        peerSpeaking = false;
        double      latencyMs = 0.0;
        double      jitterMs = 0.0;
        double      lossScore = 0.0;
        double      qualityScore = 100.0;
        const char* quality = "excellent";
        JitterStats jitter;
    };

    // ---------------------------------------------------------------------------
    // Device-independent half of the audio engine. The device callback feeds
    // ProcessCapture/ProcessPlayback, the transport thread feeds
    // OnRelayedAudio. Every sender gets its own jitter buffer and playback sums
    // them, so room speakers overlap instead of queueing behind each other.
    // The playback callback only ever try-locks; on contention the previous
    // block repeats.
    // ---------------------------------------------------------------------------
    class AudioPipeline {
    public:
        // Non-blocking handoff of one captured frame; false when it was dropped.
        using CaptureSink = std::function<bool(const int16_t* pcm, size_t samples)>;

        explicit AudioPipeline(const AudioSettings& settings);

        // Must be set before the device starts.
        void SetCaptureSink(CaptureSink sink) { m_Sink = std::move(sink); }

        void ProcessCapture(const int16_t* in, size_t samples, int64_t nowMs);
        void ProcessPlayback(int16_t* out, size_t samples, int64_t nowMs);

        void OnRelayedAudio(const std::string& from, const uint8_t* pcm, size_t bytes, int64_t nowMs);
        void OnLatency(double latencyMs) { m_Quality.OnLatency(latencyMs); }

        void SetMicEnabled(bool enabled) { m_MicEnabled.store(enabled, std::memory_order_relaxed); }
        bool IsMicEnabled() const { return m_MicEnabled.load(std::memory_order_relaxed); }
        void SetSoundEnabled(bool enabled) { m_SoundEnabled.store(enabled, std::memory_order_relaxed); }
        bool IsSoundEnabled() const { return m_SoundEnabled.load(std::memory_order_relaxed); }

        ActivitySnapshot Activity(int64_t nowMs) const;

        // Clears queued audio and estimator state. Call with the device stopped.
        void Reset();

        // Frames queued across all senders.
        size_t QueuedFrames() const;
        size_t SpeakerCount() const;
        // Counters summed over current and retired senders.
        JitterStats Jitter() const;

        static constexpr size_t kMaxSpeakers = 32;
        static constexpr int64_t kSpeakerIdleMs = 10'000;

    private:
        struct Speaker {
            explicit Speaker(const AudioSettings& s)
                : jitter(s.jitterCapacity, s.jitterPrefill, kFrameSamples) {}
            JitterBuffer jitter;
            int64_t lastArrivalMs = 0;
        };

        void PlayFrame(int16_t* out, int64_t nowMs);
        // Caller holds m_SpeakersMutex.
        void RetireLocked(std::unordered_map<std::string, std::unique_ptr<Speaker>>::iterator it);
        void EvictIdleLocked(int64_t nowMs);

        AudioSettings m_Settings;
        QualityEstimator m_Quality;
        VoiceActivity m_Mic;
        VoiceActivity m_Peer;

        std::atomic<bool> m_MicEnabled{ true };
        std::atomic<bool> m_SoundEnabled{ true };
        CaptureSink m_Sink;

        // Device periods that are not a whole frame are restaged here.
        std::array<int16_t, kFrameSamples> m_CaptureStage{};
        size_t m_CaptureFill = 0;
        std::array<int16_t, kFrameSamples> m_PlayStage{};
        size_t m_PlayPos = kFrameSamples;
        std::array<int16_t, kFrameSamples> m_SpeakerFrame{};
        std::array<int32_t, kFrameSamples> m_Mix{};

        mutable std::mutex m_SpeakersMutex;
        std::unordered_map<std::string, std::unique_ptr<Speaker>> m_Speakers;
        JitterStats m_Retired;
        int64_t m_LastEvictScanMs = 0;

        std::atomic<uint64_t> m_PlayoutStalls{ 0 };
        std::atomic<uint64_t> m_MixContended{ 0 };
    };

} // namespace Parley
