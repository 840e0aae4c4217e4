#include "ControlClient.h"
#include "../core/Logger.h"
#include "../shared/Actions.h"
#include "../shared/ControlFrame.h"
#include "../shared/Protocol.h"
#include <asio.hpp>
#include <chrono>
#include <random>
#include <thread>

namespace Parley {

    namespace {

        ControlResponse Transient(const std::string& message) {
            ControlResponse r;
            r.result = OpResult::Fail(ErrorKind::Transient, message);
            return r;
        }

        int RandomJitterMs(int maxMs) {
            if (maxMs <= 0) return 0;
            static thread_local std::mt19937 rng{ std::random_device{}() };
            return std::uniform_int_distribution<int>(0, maxMs)(rng);
        }

    } // namespace

    ControlClient::ControlClient(const ClientConfig& config)
        : m_Config(config)
    {
        m_Sleep = [](int64_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); };
    }

    // ---------------------------------------------------------------------------
    // Response parsing
    // ---------------------------------------------------------------------------

    ControlResponse ControlClient::ParseResponse(const std::string& raw) {
        if (raw.empty()) return Transient("empty response");

        std::string body;
        if (IsLegacyJsonStart(static_cast<uint8_t>(raw[0]))) {
            body = raw;
        }
        else {
            if (raw.size() < kFramePrefixSize) return Transient("truncated response");
            const uint32_t len = ReadU32BE(reinterpret_cast<const uint8_t*>(raw.data()));
            if (len == 0 || len > kMaxControlFrame || raw.size() - kFramePrefixSize < len)
                return Transient("truncated response");
            body = raw.substr(kFramePrefixSize, len);
        }

        json j = json::parse(body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) return Transient("unreadable response");

        ControlResponse r;
        r.body = std::move(j);
        const std::string status = r.body.value("status", "");
        if (status == "ok") return r;

        std::string message = "request failed";
        if (r.body.contains("message") && r.body["message"].is_string())
            message = r.body["message"].get<std::string>();
        ErrorKind kind = ErrorKind::Transient;
        if (r.body.contains("code") && r.body["code"].is_string()) {
            const ErrorKind mapped = ErrorKindFromCode(r.body["code"].get<std::string>());
            if (mapped != ErrorKind::None) kind = mapped;
        }
        r.result = OpResult::Fail(kind, message);
        return r;
    }

    bool ControlClient::ShouldRetry(const std::string& action, const OpResult& result) {
        if (result.kind != ErrorKind::Transient) return false;
        const ActionInfo* info = FindAction(action);
        return info && info->idempotent;
    }

    int64_t ControlClient::BackoffMs(int attempt, int baseMs, int jitterMs) {
        if (attempt < 0) attempt = 0;
        if (attempt > 16) attempt = 16;
        return static_cast<int64_t>(baseMs) * (int64_t{ 1 } << attempt) + jitterMs;
    }

    // ---------------------------------------------------------------------------
    // Transport
    // ---------------------------------------------------------------------------

    ControlResponse ControlClient::Send(const json& request) {
        ++m_Attempts;
        if (m_Transport) return m_Transport(request);

        const std::string payload = request.dump(-1, ' ', false, json::error_handler_t::replace);
        if (payload.size() > kMaxControlFrame) return Transient("request too large");
        const std::vector<uint8_t> frame = EncodeControlFrame(payload);

        asio::io_context ctx;
        asio::ip::tcp::socket socket(ctx);
        asio::steady_timer deadline(ctx);
        std::error_code failure;
        bool timedOut = false;
        std::string in;

        asio::ip::tcp::resolver resolver(ctx);
        std::error_code ec;
        auto endpoints = resolver.resolve(m_Config.serverHost, std::to_string(m_Config.controlPort), ec);
        if (ec) return Transient("cannot resolve " + m_Config.serverHost + ": " + ec.message());

        auto onDeadline = [&](const std::error_code& e) {
            if (e) return;
            timedOut = true;
            std::error_code ignored;
            socket.close(ignored);
        };

        deadline.expires_after(std::chrono::milliseconds(m_Config.connectTimeoutMs));
        deadline.async_wait(onDeadline);

        asio::async_connect(socket, endpoints,
            [&](const std::error_code& e, const asio::ip::tcp::endpoint&) {
                if (e) {
                    failure = e;
                    deadline.cancel();
                    return;
                }
                deadline.expires_after(std::chrono::milliseconds(m_Config.requestTimeoutMs));
                deadline.async_wait(onDeadline);
                asio::async_write(socket, asio::buffer(frame),
                    [&](const std::error_code& we, std::size_t) {
                        if (we) {
                            failure = we;
                            deadline.cancel();
                            return;
                        }
                        asio::async_read(socket, asio::dynamic_buffer(in, kMaxControlFrame + kFramePrefixSize),
                            [&](const std::error_code& re, std::size_t) {
                                if (re && re != asio::error::eof) failure = re;
                                deadline.cancel();
                            });
                    });
            });

        ctx.run();

        if (timedOut) return Transient("request timed out");
        if (failure) return Transient("connection failed: " + failure.message());
        return ParseResponse(in);
    }

    ControlResponse ControlClient::Call(const std::string& action, json params, const std::string& token) {
        if (!params.is_object()) params = json::object();
        params["action"] = action;
        if (!token.empty()) params["token"] = token;

        ControlResponse r;
        for (int attempt = 0;; ++attempt) {
            r = Send(params);
            if (r.Ok() || attempt >= m_Config.maxRetries || !ShouldRetry(action, r.result))
                break;
            const int base = static_cast<int>(m_Config.retryBaseMs);
            const int64_t wait = BackoffMs(attempt, base, RandomJitterMs(base / 2));
            LOG_NETWORK(action + " failed (" + r.result.message + "), retry in " + std::to_string(wait) + " ms");
            m_Sleep(wait);
        }
        if (!r.Ok())
            LOG_NETWORK(action + " -> " + ErrorKindName(r.result.kind) + ": " + r.result.message);
        return r;
    }

} // namespace Parley
