#include "VoiceTransport.h"
#include "../core/Logger.h"
#include "../shared/Protocol.h"
#include <cstdint>
#include <cstdio>

using asio::ip::udp;

namespace Parley {

    namespace {

        inline void LogError(const char* step, const char* detail) noexcept {
            char buf[256];
            std::snprintf(buf, sizeof(buf), "step=%s msg=%.200s", step, detail);
            Logger::Instance().LogVoiceTraceBuf(buf);
        }

        inline void LogError(const char* step, const std::error_code& ec) noexcept {
            LogError(step, ec.message().c_str());
        }

    } // namespace

    VoiceTransport::VoiceTransport() : m_Socket(m_Context) {}
    VoiceTransport::~VoiceTransport() { Stop(); }

    bool VoiceTransport::Start(const std::string& host, uint16_t port) {
        if (m_Running.load()) return true;
        try {
            m_Context.restart();

            udp::resolver resolver(m_Context);
            auto results = resolver.resolve(udp::v4(), host, std::to_string(port));
            if (results.empty()) {
                LogError("udp_start_error", "relay address did not resolve");
                return false;
            }
            m_RemoteEndpoint = *results.begin();

            if (!m_Socket.is_open()) m_Socket.open(udp::v4());
            m_Socket.bind(udp::endpoint(udp::v4(), 0));
            m_Socket.set_option(asio::socket_base::receive_buffer_size(256 * 1024));
            m_Socket.set_option(asio::socket_base::send_buffer_size(64 * 1024));

            m_Running.store(true);

            m_Thread = std::thread([this] {
                try {
                    auto guard = asio::make_work_guard(m_Context);
                    DoReceive();
                    m_Context.run();
                }
                catch (const std::exception& e) { LogError("udp_error", e.what()); }
                m_Running.store(false);
                });
            LOG_NETWORK("voice transport up, relay " + m_RemoteEndpoint.address().to_string()
                + ":" + std::to_string(port));
            return true;
        }
        catch (const std::exception& e) {
            LogError("udp_start_error", e.what());
            LOG_ERROR(std::string("voice transport start failed: ") + e.what());
            std::error_code ec;
            if (m_Socket.is_open()) m_Socket.close(ec);
            return false;
        }
    }

    void VoiceTransport::Stop() {
        m_Running.store(false);
        {
            std::lock_guard<std::mutex> lk(m_SendMutex);
            std::error_code ec;
            if (m_Socket.is_open()) m_Socket.close(ec);
        }
        m_Context.stop();
        if (m_Thread.joinable()) m_Thread.join();
    }

    void VoiceTransport::SendRaw(const std::vector<uint8_t>& datagram) {
        if (datagram.empty() || !m_Running.load(std::memory_order_relaxed)) return;
        std::lock_guard<std::mutex> lk(m_SendMutex);
        if (!m_Socket.is_open()) return;
        std::error_code ec;
        m_Socket.send_to(asio::buffer(datagram), m_RemoteEndpoint, 0, ec);
        if (ec) {
            m_SendErrors.fetch_add(1, std::memory_order_relaxed);
            LogError("udp_send_error", ec);
        }
    }

    void VoiceTransport::SendAudio(const std::string& login, const int16_t* pcm, size_t samples) {
        if (!pcm || samples == 0 || !m_Running.load(std::memory_order_relaxed)) return;
        // Scatter-gather: header and PCM go out as one datagram without a copy.
        const char tag[2] = { kUdpAudio, kUdpSeparator };
        const char sep = kUdpSeparator;
        const std::array<asio::const_buffer, 4> bufs = {
            asio::buffer(tag, 2),
            asio::buffer(login),
            asio::buffer(&sep, 1),
            asio::buffer(pcm, samples * sizeof(int16_t))
        };
        std::lock_guard<std::mutex> lk(m_SendMutex);
        if (!m_Socket.is_open()) return;
        std::error_code ec;
        m_Socket.send_to(bufs, m_RemoteEndpoint, 0, ec);
        if (ec) {
            m_SendErrors.fetch_add(1, std::memory_order_relaxed);
            LogError("udp_send_error", ec);
        }
    }

    void VoiceTransport::DoReceive() {
        if (!m_Running.load(std::memory_order_relaxed)) return;

        m_Socket.async_receive_from(
            asio::buffer(m_RecvArray), m_SenderEndpoint,
            [this](std::error_code ec, std::size_t n) {
                if (ec) {
                    if (ec != asio::error::operation_aborted) {
                        m_Running.store(false);
                        LogError("udp_recv_error", ec);
                    }
                    return;
                }

                if (n > 0 && m_Callback) {
                    try {
                        m_Callback(m_RecvArray.data(), n);
                    }
                    catch (const std::exception& e) {
                        LogError("udp_callback_error", e.what());
                    }
                }

                DoReceive();
            });
    }

} // namespace Parley
