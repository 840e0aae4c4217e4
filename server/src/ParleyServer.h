#pragma once
#include "CallSignaling.h"
#include "ChannelVoice.h"
#include "CoreRelayAuthority.h"
#include "Database.h"
#include "EventOutbox.h"
#include "RelayRouter.h"
#include "RequestDispatcher.h"
#include "ServerConfig.h"
#include "SessionManager.h"
#include <asio.hpp>
#include <array>
#include <memory>

namespace Parley {

    // ---------------------------------------------------------------------------
    // ParleyServer
    // TCP control plane and UDP voice relay on one io_context. Owns the core
    // services; sessions and the relay only ever see references to them.
    // ---------------------------------------------------------------------------
    class ParleyServer {
    public:
        ParleyServer(asio::io_context& io_context, const ServerConfig& config);

        RelayStats RelayCounters() const { return m_Router.Stats(); }

    private:
        void DoAccept();
        void StartVoiceUdpReceive();
        void StartRelaySweep();
        void StartCallPrune();

        void SendDatagrams(const std::vector<OutboundDatagram>& out);

        asio::io_context& m_IoContext;
        ServerConfig m_Config;

        // --- Core services (declaration order is construction order) ------------
        Database       m_Db;
        EventOutbox    m_Events;
        SessionManager m_Sessions;
        CallSignaling  m_Calls;
        ChannelVoice   m_Voice;
        CoreRelayAuthority m_Authority;
        RelayRouter    m_Router;
        RequestDispatcher m_Dispatcher;

        // --- ASIO handles -------------------------------------------------------
        asio::ip::tcp::acceptor m_Acceptor;
        asio::ip::udp::socket   m_VoiceUdpSocket;

        // --- UDP receive scratch space ------------------------------------------
        std::array<uint8_t, 65'535> m_VoiceRecvBuffer{};
        asio::ip::udp::endpoint     m_VoiceRecvFrom;
    };

} // namespace Parley
