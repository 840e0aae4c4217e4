#include "ControlSession.h"
#include "Logger.h"
#include "../../src/shared/ControlFrame.h"
#include <cstdio>

using asio::ip::tcp;
using json = nlohmann::json;

namespace Parley {

    ControlSession::ControlSession(tcp::socket socket, RequestDispatcher& dispatcher, const ControlSettings& settings)
        : m_Socket(std::move(socket))
        , m_Dispatcher(dispatcher)
        , m_Settings(settings)
        , m_Strand(asio::make_strand(m_Socket.get_executor()))
        , m_Deadline(m_Strand)
        , m_IdleTimer(m_Strand)
    {
        std::error_code ec;
        auto ep = m_Socket.remote_endpoint(ec);
        if (!ec) m_Peer = ep.address().to_string() + ':' + std::to_string(ep.port());
    }

    void ControlSession::Start() {
        m_Deadline.expires_after(std::chrono::milliseconds(m_Settings.requestDeadlineMs));
        m_Deadline.async_wait(asio::bind_executor(m_Strand,
            [this, self = shared_from_this()](const std::error_code& ec) {
                if (ec) return;
                std::fprintf(stderr, "[Parley Server] control deadline expired peer=%s\n", m_Peer.c_str());
                Close();
            }));
        ReadPrefix();
    }

    void ControlSession::ReadPrefix() {
        asio::async_read(m_Socket, asio::buffer(m_Prefix),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (ec) {
                    if (ec != asio::error::eof && ec != asio::error::operation_aborted)
                        std::fprintf(stderr, "[Parley Server] ReadPrefix error: %s (%d)\n", ec.message().c_str(), ec.value());
                    Close();
                    return;
                }
                const FramePrefixInfo info = ClassifyFramePrefix(m_Prefix.data());
                switch (info.kind) {
                case FramePrefix::Length:
                    m_Body.resize(info.length);
                    ReadBody();
                    break;
                case FramePrefix::LegacyJson:
                    if (!m_Settings.allowLegacyJson) {
                        VoiceTrace::log("step=control_reject reason=legacy_framing peer=" + m_Peer);
                        Respond(RequestDispatcher::ErrorResponse(ErrorKind::Malformed, "empty request"));
                        return;
                    }
                    m_Legacy.assign(m_Prefix.begin(), m_Prefix.end());
                    ReadLegacy();
                    break;
                case FramePrefix::Invalid:
                    VoiceTrace::log("step=control_reject reason=frame_length len=" + std::to_string(info.length)
                        + " peer=" + m_Peer);
                    Respond(RequestDispatcher::ErrorResponse(ErrorKind::Malformed, "empty request"));
                    break;
                }
            }));
    }

    void ControlSession::ReadBody() {
        asio::async_read(m_Socket, asio::buffer(m_Body),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t) {
                if (ec) {
                    if (ec != asio::error::operation_aborted)
                        std::fprintf(stderr, "[Parley Server] ReadBody error: %s (%d)\n", ec.message().c_str(), ec.value());
                    Close();
                    return;
                }
                Process(std::string(m_Body.begin(), m_Body.end()));
            }));
    }

    // ---------------------------------------------------------------------------
    // Legacy unprefixed JSON: read until the document parses, the peer closes,
    // or the line goes quiet for legacyIdleMs.
    // ---------------------------------------------------------------------------
    void ControlSession::ReadLegacy() {
        if (json::accept(m_Legacy)) {
            FinishLegacy();
            return;
        }
        if (m_Legacy.size() >= kMaxControlFrame) {
            FinishLegacy();
            return;
        }
        ArmIdleTimer();
        m_Socket.async_read_some(asio::buffer(m_Chunk),
            asio::bind_executor(m_Strand, [this, self = shared_from_this()](std::error_code ec, std::size_t n) {
                ++m_IdleGeneration;
                m_IdleTimer.cancel();
                if (m_Responded) return;
                if (n > 0) m_Legacy.append(m_Chunk.data(), n);
                if (ec) {
                    FinishLegacy();
                    return;
                }
                ReadLegacy();
            }));
    }

    void ControlSession::ArmIdleTimer() {
        const uint32_t generation = ++m_IdleGeneration;
        m_IdleTimer.expires_after(std::chrono::milliseconds(m_Settings.legacyIdleMs));
        m_IdleTimer.async_wait(asio::bind_executor(m_Strand,
            [this, self = shared_from_this(), generation](const std::error_code& ec) {
                if (ec || generation != m_IdleGeneration) return;
                // Quiet line: abort the pending read so its handler finishes.
                std::error_code ignored;
                m_Socket.cancel(ignored);
            }));
    }

    void ControlSession::FinishLegacy() {
        if (m_Responded) return;
        VoiceTrace::log("step=control_legacy bytes=" + std::to_string(m_Legacy.size()) + " peer=" + m_Peer);
        Process(m_Legacy);
    }

    void ControlSession::Process(const std::string& payload) {
        json request = json::parse(payload, nullptr, false);
        if (request.is_discarded() || !request.is_object()) {
            Respond(RequestDispatcher::ErrorResponse(ErrorKind::Malformed, "empty request"));
            return;
        }
        Respond(m_Dispatcher.Dispatch(request));
    }

    void ControlSession::Respond(const json& response) {
        if (m_Responded) return;
        m_Responded = true;
        auto buffer = std::make_shared<std::vector<uint8_t>>(
            EncodeControlFrame(response.dump(-1, ' ', false, json::error_handler_t::replace)));
        asio::async_write(m_Socket, asio::buffer(*buffer),
            asio::bind_executor(m_Strand, [this, self = shared_from_this(), buffer](std::error_code ec, std::size_t) {
                if (ec && ec != asio::error::operation_aborted)
                    std::fprintf(stderr, "[Parley Server] write error: %s (%d)\n", ec.message().c_str(), ec.value());
                Close();
            }));
    }

    void ControlSession::Close() {
        m_Deadline.cancel();
        m_IdleTimer.cancel();
        if (!m_Socket.is_open()) return;
        std::error_code ignored;
        m_Socket.shutdown(tcp::socket::shutdown_both, ignored);
        m_Socket.close(ignored);
    }

} // namespace Parley
