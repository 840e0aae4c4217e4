#include "VoiceSendPacer.h"
#include "../core/Logger.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <exception>

namespace Parley {

VoiceSendPacer::VoiceSendPacer(size_t capacity)
    : m_Ring(std::max<size_t>(1, capacity)) {
}

void VoiceSendPacer::Start(SendFn fn) {
    if (m_Running.exchange(true)) return;
    m_SendFn = std::move(fn);
    {
        std::lock_guard<std::mutex> lk(m_Mutex);
        m_Head = 0;
        m_Count = 0;
    }
    m_Thread = std::thread(&VoiceSendPacer::Run, this);
}

void VoiceSendPacer::Stop() {
    if (!m_Running.exchange(false)) return; // already stopped or never started
    m_Cv.notify_all();
    if (m_Thread.joinable())
        m_Thread.join();

    std::lock_guard<std::mutex> lk(m_Mutex);
    m_Head = 0;
    m_Count = 0;
}

bool VoiceSendPacer::TryEnqueue(const int16_t* pcm, size_t samples) {
    if (!pcm || !m_Running.load(std::memory_order_relaxed)) return false;

    std::unique_lock<std::mutex> lk(m_Mutex, std::try_to_lock);
    if (!lk.owns_lock() || m_Count == m_Ring.size()) {
        const uint64_t n = m_Dropped.fetch_add(1, std::memory_order_relaxed) + 1;
        if (n <= 10 || n % 50 == 0) {
            char buf[96];
            std::snprintf(buf, sizeof(buf), "step=send_drop total=%llu", static_cast<unsigned long long>(n));
            Logger::Instance().LogVoiceTraceBufNonBlocking(buf);
        }
        return false;
    }

    Frame& slot = m_Ring[(m_Head + m_Count) % m_Ring.size()];
    const size_t n = std::min(samples, slot.size());
    std::memcpy(slot.data(), pcm, n * sizeof(int16_t));
    if (n < slot.size()) std::fill(slot.begin() + n, slot.end(), int16_t{ 0 });
    ++m_Count;
    lk.unlock();
    m_Cv.notify_one();
    return true;
}

void VoiceSendPacer::Run() {
    Frame frame;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(m_Mutex);
            m_Cv.wait(lk, [this] { return m_Count > 0 || !m_Running.load(std::memory_order_relaxed); });
            if (!m_Running.load(std::memory_order_relaxed)) break;
            frame = m_Ring[m_Head];
            m_Head = (m_Head + 1) % m_Ring.size();
            --m_Count;
        }
        if (!m_SendFn) continue;
        try {
            m_SendFn(frame.data(), frame.size());
            m_Sent.fetch_add(1, std::memory_order_relaxed);
        }
        catch (const std::exception& e) {
            // A throwing send must not take down the sender thread.
            LOG_ERROR(std::string("voice send failed: ") + e.what());
        }
    }
}

} // namespace Parley
