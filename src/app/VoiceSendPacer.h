#pragma once

#include <array>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <atomic>
#include <vector>
#include "../shared/Protocol.h"

namespace Parley {

// Hands captured frames from the audio callback to a dedicated sender thread.
// TryEnqueue() never blocks: a frame is dropped when the queue lock is
// contended or the ring is full. The sender transmits every frame as soon as
// it is woken, one datagram per frame.
class VoiceSendPacer {
public:
    using Frame  = std::array<int16_t, kFrameSamples>;
    using SendFn = std::function<void(const int16_t* pcm, size_t samples)>;

    explicit VoiceSendPacer(size_t capacity = 16);
    ~VoiceSendPacer() { Stop(); }

    VoiceSendPacer(const VoiceSendPacer&)            = delete;
    VoiceSendPacer& operator=(const VoiceSendPacer&) = delete;

    void Start(SendFn fn);
    void Stop();

    bool TryEnqueue(const int16_t* pcm, size_t samples);

    bool     IsRunning() const { return m_Running.load(std::memory_order_relaxed); }
    uint64_t Sent() const      { return m_Sent.load(std::memory_order_relaxed); }
    uint64_t Dropped() const   { return m_Dropped.load(std::memory_order_relaxed); }

private:
    void Run();

    SendFn                  m_SendFn;
    std::vector<Frame>      m_Ring;
    size_t                  m_Head = 0;
    size_t                  m_Count = 0;
    std::mutex              m_Mutex;
    std::condition_variable m_Cv;
    std::thread             m_Thread;
    std::atomic<bool>       m_Running{ false };
    std::atomic<uint64_t>   m_Sent{ 0 };
    std::atomic<uint64_t>   m_Dropped{ 0 };
};

} // namespace Parley
