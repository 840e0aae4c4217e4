#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <atomic>
#include <array>
#include <asio.hpp>

namespace Parley {

    // UDP socket to the voice relay with its own io_context thread for receives.
    class VoiceTransport {
    public:
        VoiceTransport();
        ~VoiceTransport();

        VoiceTransport(const VoiceTransport&) = delete;
        VoiceTransport& operator=(const VoiceTransport&) = delete;

        // Resolves the relay and starts the receive loop. Safe to call again
        // after Stop(); the io_context is restarted internally.
        bool Start(const std::string& host, uint16_t port);
        void Stop();

        // Synchronous send_to on the calling thread. No-ops when stopped.
        void SendRaw(const std::vector<uint8_t>& datagram);
        // "A|login|" + pcm without building a joined buffer.
        void SendAudio(const std::string& login, const int16_t* pcm, size_t samples);

        bool IsRunning() const { return m_Running.load(std::memory_order_relaxed); }
        uint64_t SendErrors() const { return m_SendErrors.load(std::memory_order_relaxed); }

        // Receives a raw pointer into the receive buffer, valid only for the call.
        using ReceiveCallback = std::function<void(const uint8_t* data, size_t length)>;
        void SetReceiveCallback(ReceiveCallback cb) { m_Callback = std::move(cb); }

    private:
        void DoReceive();

        static constexpr size_t kRecvBufferSize = 65536;

        asio::io_context                     m_Context;
        asio::ip::udp::socket                m_Socket;
        asio::ip::udp::endpoint              m_RemoteEndpoint;
        std::array<uint8_t, kRecvBufferSize> m_RecvArray{};
        asio::ip::udp::endpoint              m_SenderEndpoint;
        std::thread                          m_Thread;
        ReceiveCallback                      m_Callback;
        std::atomic<bool>                    m_Running{ false };
        std::mutex                           m_SendMutex;
        std::atomic<uint64_t>                m_SendErrors{ 0 };
    };

} // namespace Parley
