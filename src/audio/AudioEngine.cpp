#include "AudioEngine.h"
#include "../core/Logger.h"
#include "../shared/Clock.h"
#include "../shared/VoiceDatagram.h"
#include <algorithm>
#include <cstdio>

namespace Parley {

    namespace {
        constexpr int64_t kQualityLogIntervalMs = 5'000;
    }

    AudioEngine::AudioEngine(const ClientConfig& config)
        : m_Config(config)
        , m_Pipeline(config.audio)
        , m_Sender(config.audio.sendQueueFrames)
    {
        m_Transport.SetReceiveCallback([this](const uint8_t* data, size_t len) {
            HandleDatagram(data, len);
            });
    }

    AudioEngine::~AudioEngine() {
        Stop();
    }

    VoiceMode AudioEngine::Mode() const {
        std::lock_guard lock(m_StateMutex);
        return m_Mode;
    }

    std::string AudioEngine::DeviceError() const {
        std::lock_guard lock(m_StateMutex);
        return m_DeviceError;
    }

    bool AudioEngine::StartCall(const std::string& login, const std::string& token, const std::string& peer) {
        if (m_Running.load()) Stop();
        {
            std::lock_guard lock(m_StateMutex);
            m_Mode = VoiceMode::Call;
            m_Login = login;
            m_Token = token;
            m_Peer = peer;
            m_RoomId = 0;
        }
        if (!StartCommon()) return false;
        LOG_AUDIO("call audio started with " + peer);
        return true;
    }

    bool AudioEngine::StartRoom(const std::string& login, const std::string& token, int64_t roomId) {
        if (m_Running.load()) Stop();
        {
            std::lock_guard lock(m_StateMutex);
            m_Mode = VoiceMode::Room;
            m_Login = login;
            m_Token = token;
            m_Peer.clear();
            m_RoomId = roomId;
        }
        if (!StartCommon()) return false;
        LOG_AUDIO("room audio started, room " + std::to_string(roomId));
        return true;
    }

    bool AudioEngine::StartCommon() {
        m_Pipeline.Reset();
        m_Pings.Reset();

        if (!m_Transport.Start(m_Config.serverHost, m_Config.voicePort)) {
            LOG_ERROR("voice relay unreachable at " + m_Config.serverHost);
            std::lock_guard lock(m_StateMutex);
            m_Mode = VoiceMode::Idle;
            return false;
        }
        m_Running.store(true);

        std::string login;
        {
            std::lock_guard lock(m_StateMutex);
            login = m_Login;
        }
        m_Sender.Start([this, login](const int16_t* pcm, size_t samples) {
            m_Transport.SendAudio(login, pcm, samples);
            });
        m_Pipeline.SetCaptureSink([this](const int16_t* pcm, size_t samples) {
            return m_Sender.TryEnqueue(pcm, samples);
            });

        SendBinding();
        SendPing();

        m_Device = std::make_unique<AudioDevice>(m_Pipeline);
        std::string error;
        if (!m_Device->Start(error)) {
            LOG_ERROR("audio device unavailable (" + error + "), continuing without audio I/O");
            std::lock_guard lock(m_StateMutex);
            m_DeviceError = error;
        }
        else {
            std::lock_guard lock(m_StateMutex);
            m_DeviceError.clear();
        }

        m_LivenessThread = std::thread(&AudioEngine::LivenessLoop, this);
        return true;
    }

    void AudioEngine::Stop() {
        if (!m_Running.exchange(false)) return;

        if (m_Device) {
            m_Device->Stop();
            m_Device.reset();
        }
        m_LoopCv.notify_all();
        if (m_LivenessThread.joinable()) m_LivenessThread.join();

        VoiceMode mode;
        std::string login, token, peer;
        int64_t roomId;
        {
            std::lock_guard lock(m_StateMutex);
            mode = m_Mode;
            login = m_Login;
            token = m_Token;
            peer = m_Peer;
            roomId = m_RoomId;
        }
        if (mode == VoiceMode::Call && !peer.empty())
            m_Transport.SendRaw(BuildPair(login, token, login, peer, false));
        else if (mode == VoiceMode::Room && roomId > 0)
            m_Transport.SendRaw(BuildRoomLeave(login, roomId));

        m_Sender.Stop();
        m_Transport.Stop();
        m_Pipeline.Reset();
        m_Pings.Reset();

        {
            std::lock_guard lock(m_StateMutex);
            m_Mode = VoiceMode::Idle;
            m_Peer.clear();
            m_RoomId = 0;
        }
        LOG_AUDIO("voice stopped");
    }

    // ---------------------------------------------------------------------------
    // Liveness
    // ---------------------------------------------------------------------------

    std::vector<std::vector<uint8_t>> AudioEngine::BindingDatagrams(VoiceMode mode,
        const std::string& login, const std::string& token, const std::string& peer, int64_t roomId)
    {
        std::vector<std::vector<uint8_t>> out;
        if (mode == VoiceMode::Call) {
            out.push_back(BuildJoin(login, token));
            if (!peer.empty()) out.push_back(BuildPair(login, token, login, peer, true));
        }
        else if (mode == VoiceMode::Room) {
            out.push_back(BuildRoomJoin(login, token, roomId));
        }
        return out;
    }

    void AudioEngine::SendBinding() {
        std::vector<std::vector<uint8_t>> datagrams;
        {
            std::lock_guard lock(m_StateMutex);
            datagrams = BindingDatagrams(m_Mode, m_Login, m_Token, m_Peer, m_RoomId);
        }
        for (const auto& d : datagrams) m_Transport.SendRaw(d);
    }

    void AudioEngine::SendPing() {
        const int64_t now = SteadyClock::Instance().NowMs();
        const uint32_t seq = m_Pings.Register(now);
        m_Transport.SendRaw(BuildPing(seq, now));
    }

    void AudioEngine::LogQuality() {
        const ActivitySnapshot a = GetActivity();
        std::string target;
        {
            std::lock_guard lock(m_StateMutex);
            target = m_Mode == VoiceMode::Room ? "room:" + std::to_string(m_RoomId) : "call:" + m_Peer;
        }
        Logger::Instance().LogQualityStats(target, static_cast<int>(a.qualityScore), a.quality,
            a.jitterMs, a.lossScore, a.latencyMs, a.jitter.underflows, a.jitter.overflows);
    }

    void AudioEngine::LivenessLoop() {
        const int64_t start = SteadyClock::Instance().NowMs();
        int64_t nextBinding = start + m_Config.rejoinIntervalMs;
        int64_t nextPing = start + m_Config.pingIntervalMs;
        int64_t nextQuality = start + kQualityLogIntervalMs;

        std::unique_lock<std::mutex> lk(m_LoopMutex);
        while (m_Running.load(std::memory_order_relaxed)) {
            const int64_t now = SteadyClock::Instance().NowMs();
            const int64_t wake = std::min({ nextBinding, nextPing, nextQuality });
            if (now < wake) {
                m_LoopCv.wait_for(lk, std::chrono::milliseconds(wake - now));
                continue;
            }
            lk.unlock();
            if (now >= nextBinding) {
                SendBinding();
                nextBinding = now + m_Config.rejoinIntervalMs;
            }
            if (now >= nextPing) {
                SendPing();
                nextPing = now + m_Config.pingIntervalMs;
            }
            if (now >= nextQuality) {
                LogQuality();
                nextQuality = now + kQualityLogIntervalMs;
            }
            lk.lock();
        }
    }

    // ---------------------------------------------------------------------------
    // Receive path
    // ---------------------------------------------------------------------------

    void AudioEngine::HandleDatagram(const uint8_t* data, size_t len) {
        auto d = ParseVoiceDatagram(data, len);
        if (!d) {
            const uint64_t n = m_BadDatagrams.fetch_add(1, std::memory_order_relaxed) + 1;
            if (n <= 10 || n % 50 == 0) {
                char buf[96];
                std::snprintf(buf, sizeof(buf), "step=recv_drop reason=malformed size=%zu total=%llu",
                    len, static_cast<unsigned long long>(n));
                Logger::Instance().LogVoiceTraceBuf(buf);
            }
            return;
        }

        const int64_t now = SteadyClock::Instance().NowMs();
        switch (d->type) {
        case DatagramType::Pong: {
            const double rtt = m_Pings.Complete(static_cast<uint32_t>(d->pingSeq), now);
            if (rtt >= 0.0) m_Pipeline.OnLatency(rtt);
            break;
        }
        case DatagramType::Relayed:
            m_Pipeline.OnRelayedAudio(d->login, d->pcm.data(), d->pcm.size(), now);
            break;
        default:
            break;
        }
    }

    ActivitySnapshot AudioEngine::GetActivity() const {
        return m_Pipeline.Activity(SteadyClock::Instance().NowMs());
    }

} // namespace Parley
