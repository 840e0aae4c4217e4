#pragma once
#include "../shared/Protocol.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace Parley {

    struct AudioSettings {
        size_t  jitterCapacity = 12;
        size_t  jitterPrefill = 3;
        int64_t plcWindowMs = 120;
        int     maxPlcFrames = 6;
        float   vadThreshold = 0.015f;
        int64_t speakingHoldMs = 350;
        size_t  sendQueueFrames = 16;
        bool    micEnabled = true;
        bool    soundEnabled = true;
    };

    struct ClientConfig {
        std::string serverHost = "127.0.0.1";
        uint16_t    controlPort = CONTROL_PORT;
        uint16_t    voicePort = VOICE_PORT;

        int64_t connectTimeoutMs = 3'000;
        int64_t requestTimeoutMs = 8'000;
        int     maxRetries = 2;             // idempotent actions only
        int64_t retryBaseMs = 200;

        int64_t pollIntervalMs = 1'000;
        int64_t heartbeatIntervalMs = 10'000;
        int64_t rejoinIntervalMs = 2'000;
        int64_t pingIntervalMs = 2'000;
        int64_t presencePushIntervalMs = 1'500;

        AudioSettings audio;

        std::string logPath = "parley-client.log";
        std::string statsLogPath;           // empty: no stats log
        std::string voiceTracePath = "parley_voice_trace.log";
        bool        voiceTrace = false;

        static ClientConfig FromJson(const nlohmann::json& j);
    };

    struct StoredSession {
        std::string login;
        std::string token;
        int64_t     expiresAt = 0;

        bool Valid() const { return !login.empty() && !token.empty(); }
    };

    class ConfigManager {
    public:
        static ConfigManager& Get() { static ConfigManager instance; return instance; }

        // PARLEY_CONFIG, else <config dir>/client.json. Missing keys keep defaults.
        ClientConfig Load(const std::string& explicitPath = {});

        StoredSession LoadSession();
        bool SaveSession(const StoredSession& session);
        void ClearSession();

        // $XDG_CONFIG_HOME/parley, falling back to ~/.config/parley.
        std::filesystem::path GetConfigDir();
        void SetConfigDir(const std::filesystem::path& dir);

    private:
        ConfigManager() = default;

        std::filesystem::path SessionPath() { return GetConfigDir() / "session.json"; }

        std::mutex m_Mutex;
        std::filesystem::path m_DirOverride;
    };

} // namespace Parley
