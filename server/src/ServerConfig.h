#pragma once
#include "../../src/shared/Protocol.h"
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Parley {

    struct SessionSettings {
        int64_t ttlMs = 30LL * 24 * 3600 * 1000;
        int64_t onlineWindowMs = 45'000;
        int64_t touchMinIntervalMs = 3'000;
        int64_t offlineSlackMs = 5'000;     // soft offline lands this far outside the window
        int     pbkdf2Iterations = 200'000;
    };

    struct EventSettings {
        size_t  maxPerUser = 200;
        int64_t ttlMs = 180'000;
    };

    struct CallSettings {
        int64_t staleMs = 25'000;
    };

    struct VoicePresenceSettings {
        int64_t presenceTtlMs = 8'000;
    };

    struct ControlSettings {
        bool    allowLegacyJson = false;
        int64_t legacyIdleMs = 400;
        int64_t requestDeadlineMs = 15'000;
    };

    struct RelaySettings {
        bool    allowLegacyJoin = false;
        bool    allowLegacyPairing = false;
        int64_t endpointTtlMs = 20'000;
        int64_t roomTtlMs = 6'000;          // room membership lapses unless C| renews it
        int64_t sweepIntervalMs = 5'000;
        int     controlRateLimit = 40;
        int64_t controlRateWindowMs = 1'000;
    };

    struct ServerConfig {
        std::string bindAddress = "0.0.0.0";
        uint16_t    controlPort = CONTROL_PORT;
        uint16_t    voicePort = VOICE_PORT;
        std::string databasePath = "parley.db";
        unsigned    threads = 0;            // 0: hardware concurrency, capped
        bool        voiceTrace = false;
        std::string voiceTracePath = "voice_trace.log";

        SessionSettings       sessions;
        EventSettings         events;
        CallSettings          calls;
        VoicePresenceSettings voice;
        ControlSettings       control;
        RelaySettings         relay;

        // Missing file keeps the defaults; a malformed file is reported and ignored.
        static ServerConfig Load(const std::string& path);
        static ServerConfig FromJson(const nlohmann::json& j);

        // PARLEY_DB and PARLEY_VOICE_TRACE override the file.
        void ApplyEnvironment();
    };

} // namespace Parley
