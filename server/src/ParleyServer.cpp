#include "ParleyServer.h"
#include "ControlSession.h"
#include "Logger.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>

using asio::ip::tcp;
using asio::ip::udp;

namespace Parley {

    ParleyServer::ParleyServer(asio::io_context& io_context, const ServerConfig& config)
        : m_IoContext(io_context)
        , m_Config(config)
        , m_Db(config.databasePath)
        , m_Events(SystemClock::Instance(), config.events)
        , m_Sessions(m_Db, SystemClock::Instance(), config.sessions)
        , m_Calls(m_Db, m_Sessions, m_Events, SystemClock::Instance(), config.calls)
        , m_Voice(m_Db, m_Sessions, SystemClock::Instance(), config.voice)
        , m_Authority(m_Sessions, m_Db, m_Calls, m_Voice)
        , m_Router(m_Authority, config.relay)
        , m_Dispatcher(m_Db, m_Sessions, m_Events, m_Calls, m_Voice, SystemClock::Instance())
        , m_Acceptor(io_context, tcp::endpoint(asio::ip::make_address(config.bindAddress), config.controlPort))
        , m_VoiceUdpSocket(io_context, udp::endpoint(asio::ip::make_address(config.bindAddress), config.voicePort))
    {
        if (!m_Db.IsOpen())
            throw std::runtime_error("cannot open database " + config.databasePath);

        DoAccept();
        StartVoiceUdpReceive();
        StartRelaySweep();
        StartCallPrune();

        std::fprintf(stderr, "[Parley Server] control tcp %s:%u, voice udp %s:%u, db %s\n",
            config.bindAddress.c_str(), static_cast<unsigned>(config.controlPort),
            config.bindAddress.c_str(), static_cast<unsigned>(config.voicePort),
            config.databasePath.c_str());
    }

    // ---------------------------------------------------------------------------
    // TCP accept loop
    // ---------------------------------------------------------------------------
    void ParleyServer::DoAccept() {
        m_Acceptor.async_accept([this](std::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::error_code optEc;
                socket.set_option(tcp::no_delay(true), optEc);
                std::make_shared<ControlSession>(std::move(socket), m_Dispatcher, m_Config.control)->Start();
            }
            else if (ec == asio::error::operation_aborted) {
                return;
            }
            else {
                std::fprintf(stderr, "[Parley Server] accept error: %s (%d)\n", ec.message().c_str(), ec.value());
            }
            DoAccept();
            });
    }

    // ---------------------------------------------------------------------------
    // UDP receive loop
    // ---------------------------------------------------------------------------
    void ParleyServer::StartVoiceUdpReceive() {
        m_VoiceUdpSocket.async_receive_from(
            asio::buffer(m_VoiceRecvBuffer), m_VoiceRecvFrom,
            [this](const std::error_code& ec, std::size_t bytes) {
                if (ec == asio::error::operation_aborted) return;
                if (!ec && bytes > 0) {
                    try {
                        SendDatagrams(m_Router.Handle(m_VoiceRecvBuffer.data(), bytes,
                            m_VoiceRecvFrom, SteadyClock::Instance().NowMs()));
                    }
                    catch (const std::exception& e) {
                        VoiceTrace::log(std::string("step=relay_error reason=exception what=") + e.what());
                    }
                }
                StartVoiceUdpReceive();
            });
    }

    void ParleyServer::SendDatagrams(const std::vector<OutboundDatagram>& out) {
        for (const auto& d : out) {
            auto buffer = d.data;
            m_VoiceUdpSocket.async_send_to(asio::buffer(*buffer), d.to,
                [buffer](const std::error_code&, std::size_t) {});
        }
    }

    // ---------------------------------------------------------------------------
    // Timers
    // ---------------------------------------------------------------------------
    void ParleyServer::StartRelaySweep() {
        auto timer = std::make_shared<asio::steady_timer>(
            m_IoContext, std::chrono::milliseconds(m_Config.relay.sweepIntervalMs));

        timer->async_wait([this, timer](const std::error_code& ec) {
            if (ec) return;
            const size_t evicted = m_Router.Sweep(SteadyClock::Instance().NowMs());
            if (evicted > 0) {
                const RelayStats s = m_Router.Stats();
                VoiceTrace::log("step=relay_sweep evicted=" + std::to_string(evicted)
                    + " bindings=" + std::to_string(m_Router.BindingCount())
                    + " rx=" + std::to_string(s.received) + " fwd=" + std::to_string(s.forwarded)
                    + " drop=" + std::to_string(s.dropped));
            }
            StartRelaySweep();
            });
    }

    // Idle servers still release abandoned calls so the relay stops pairing them.
    void ParleyServer::StartCallPrune() {
        auto timer = std::make_shared<asio::steady_timer>(
            m_IoContext, std::chrono::milliseconds(std::max<int64_t>(1000, m_Config.calls.staleMs / 5)));

        timer->async_wait([this, timer](const std::error_code& ec) {
            if (ec) return;
            m_Calls.PruneStale();
            StartCallPrune();
            });
    }

} // namespace Parley
