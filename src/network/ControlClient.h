#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>
#include "../core/ConfigManager.h"
#include "../shared/Errors.h"

namespace Parley {

    using json = nlohmann::json;

    struct ControlResponse {
        OpResult result;
        json     body = json::object();

        bool Ok() const { return result.Ok(); }
    };

    // Request/response client for the TCP control channel. Every request opens
    // its own connection: connect, write one frame, read until the server
    // closes. Idempotent actions are retried on Transient failures.
    class ControlClient {
    public:
        explicit ControlClient(const ClientConfig& config);

        // Adds "action" and, when non-empty, "token" to params.
        ControlResponse Call(const std::string& action, json params = json::object(),
            const std::string& token = {});

        // One attempt, no retry.
        ControlResponse Send(const json& request);

        uint64_t Attempts() const { return m_Attempts; }

        // Accepts a length-prefixed frame or a bare JSON body.
        static ControlResponse ParseResponse(const std::string& raw);
        static bool ShouldRetry(const std::string& action, const OpResult& result);
        // Backoff before retry number attempt (0-based): base * 2^attempt + jitter.
        static int64_t BackoffMs(int attempt, int baseMs, int jitterMs);

        // Overrides the sleep between retries; tests use it to stay fast.
        void SetSleeper(std::function<void(int64_t)> sleeper) { m_Sleep = std::move(sleeper); }
        // Overrides the transport; tests use it to script responses.
        void SetTransport(std::function<ControlResponse(const json&)> transport) { m_Transport = std::move(transport); }

    private:
        ClientConfig m_Config;
        uint64_t m_Attempts = 0;
        std::function<void(int64_t)> m_Sleep;
        std::function<ControlResponse(const json&)> m_Transport;
    };

} // namespace Parley
