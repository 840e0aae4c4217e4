#pragma once
#include "AudioEngineDevice.h"
#include "AudioPipeline.h"
#include "QualityEstimator.h"
#include "../app/VoiceSendPacer.h"
#include "../core/ConfigManager.h"
#include "../network/VoiceTransport.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Parley {

    enum class VoiceMode { Idle, Call, Room };

    // ---------------------------------------------------------------------------
    // Real-time side of the client: relay transport, capture sender, jitter
    // buffered playback and the liveness loop that keeps the relay binding
    // (J or C) and latency probes (P) going. One call or one room at a time.
    // ---------------------------------------------------------------------------
    class AudioEngine {
    public:
        explicit AudioEngine(const ClientConfig& config);
        ~AudioEngine();

        AudioEngine(const AudioEngine&) = delete;
        AudioEngine& operator=(const AudioEngine&) = delete;

        // Both fail only when the relay transport cannot start. A missing audio
        // device is reported through DeviceError() and the network side runs.
        bool StartCall(const std::string& login, const std::string& token, const std::string& peer);
        bool StartRoom(const std::string& login, const std::string& token, int64_t roomId);

        // Idempotent.
        void Stop();

        bool IsRunning() const { return m_Running.load(std::memory_order_relaxed); }
        VoiceMode Mode() const;
        bool HasDevice() const { return m_Device && m_Device->IsStarted(); }
        std::string DeviceError() const;

        void SetMicEnabled(bool enabled) { m_Pipeline.SetMicEnabled(enabled); }
        void SetSoundEnabled(bool enabled) { m_Pipeline.SetSoundEnabled(enabled); }

        ActivitySnapshot GetActivity() const;

        // One datagram from the relay. Runs on the transport thread.
        void HandleDatagram(const uint8_t* data, size_t len);

        AudioPipeline& Pipeline() { return m_Pipeline; }

        // Route datagrams re-sent every rejoin interval: J then S|..|1 for a
        // call, C for a room. A lost S| or a relay eviction heals on the next
        // round.
        static std::vector<std::vector<uint8_t>> BindingDatagrams(VoiceMode mode,
            const std::string& login, const std::string& token,
            const std::string& peer, int64_t roomId);

    private:
        bool StartCommon();
        void LivenessLoop();
        void SendBinding();
        void SendPing();
        void LogQuality();

        ClientConfig m_Config;
        AudioPipeline m_Pipeline;
        VoiceTransport m_Transport;
        VoiceSendPacer m_Sender;
        PingTracker m_Pings;
        std::unique_ptr<AudioDevice> m_Device;

        mutable std::mutex m_StateMutex;
        VoiceMode   m_Mode = VoiceMode::Idle;
        std::string m_Login;
        std::string m_Token;
        std::string m_Peer;
        int64_t     m_RoomId = 0;
        std::string m_DeviceError;

        std::atomic<bool> m_Running{ false };
        std::mutex m_LoopMutex;
        std::condition_variable m_LoopCv;
        std::thread m_LivenessThread;

        std::atomic<uint64_t> m_BadDatagrams{ 0 };
    };

} // namespace Parley
