#pragma once
#include "RequestDispatcher.h"
#include "ServerConfig.h"
#include "../../src/shared/Protocol.h"
#include <asio.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace Parley {

    // One control connection: read one request, write one framed response,
    // close. Every handler runs on m_Strand; the deadline timer bounds the whole
    // exchange.
    class ControlSession : public std::enable_shared_from_this<ControlSession> {
    public:
        ControlSession(asio::ip::tcp::socket socket, RequestDispatcher& dispatcher, const ControlSettings& settings);

        void Start();

    private:
        void ReadPrefix();
        void ReadBody();
        void ReadLegacy();
        void ArmIdleTimer();
        void FinishLegacy();
        void Process(const std::string& payload);
        void Respond(const nlohmann::json& response);
        void Close();

        asio::ip::tcp::socket m_Socket;
        RequestDispatcher& m_Dispatcher;
        ControlSettings m_Settings;
        asio::strand<asio::any_io_executor> m_Strand;
        asio::steady_timer m_Deadline;
        asio::steady_timer m_IdleTimer;

        std::array<uint8_t, kFramePrefixSize> m_Prefix{};
        std::vector<uint8_t> m_Body;

        std::string m_Legacy;
        std::array<char, 65'536> m_Chunk{};
        uint32_t m_IdleGeneration = 0;
        bool m_Responded = false;

        std::string m_Peer;
    };

} // namespace Parley
