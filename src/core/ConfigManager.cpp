#include "ConfigManager.h"
#include "Logger.h"
#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace Parley {

    ClientConfig ClientConfig::FromJson(const json& j) {
        ClientConfig c;
        if (!j.is_object()) return c;
        c.serverHost = j.value("server_host", c.serverHost);
        c.controlPort = j.value("control_port", c.controlPort);
        c.voicePort = j.value("voice_port", c.voicePort);
        c.connectTimeoutMs = j.value("connect_timeout_ms", c.connectTimeoutMs);
        c.requestTimeoutMs = j.value("request_timeout_ms", c.requestTimeoutMs);
        c.maxRetries = j.value("max_retries", c.maxRetries);
        c.retryBaseMs = j.value("retry_base_ms", c.retryBaseMs);
        c.pollIntervalMs = j.value("poll_interval_ms", c.pollIntervalMs);
        c.heartbeatIntervalMs = j.value("heartbeat_interval_ms", c.heartbeatIntervalMs);
        c.rejoinIntervalMs = j.value("rejoin_interval_ms", c.rejoinIntervalMs);
        c.pingIntervalMs = j.value("ping_interval_ms", c.pingIntervalMs);
        c.presencePushIntervalMs = j.value("presence_push_interval_ms", c.presencePushIntervalMs);
        c.logPath = j.value("log_path", c.logPath);
        c.statsLogPath = j.value("stats_log_path", c.statsLogPath);
        c.voiceTracePath = j.value("voice_trace_path", c.voiceTracePath);
        c.voiceTrace = j.value("voice_trace", c.voiceTrace);

        if (auto it = j.find("audio"); it != j.end() && it->is_object()) {
            const json& a = *it;
            c.audio.jitterCapacity = a.value("jitter_capacity", c.audio.jitterCapacity);
            c.audio.jitterPrefill = a.value("jitter_prefill", c.audio.jitterPrefill);
            c.audio.plcWindowMs = a.value("plc_window_ms", c.audio.plcWindowMs);
            c.audio.maxPlcFrames = a.value("max_plc_frames", c.audio.maxPlcFrames);
            c.audio.vadThreshold = a.value("vad_threshold", c.audio.vadThreshold);
            c.audio.speakingHoldMs = a.value("speaking_hold_ms", c.audio.speakingHoldMs);
            c.audio.sendQueueFrames = a.value("send_queue_frames", c.audio.sendQueueFrames);
            c.audio.micEnabled = a.value("mic_enabled", c.audio.micEnabled);
            c.audio.soundEnabled = a.value("sound_enabled", c.audio.soundEnabled);
        }
        if (c.audio.jitterCapacity == 0) c.audio.jitterCapacity = 1;
        if (c.audio.jitterPrefill > c.audio.jitterCapacity) c.audio.jitterPrefill = c.audio.jitterCapacity;
        if (c.maxRetries < 0) c.maxRetries = 0;
        return c;
    }

    ClientConfig ConfigManager::Load(const std::string& explicitPath) {
        std::filesystem::path path;
        if (!explicitPath.empty()) path = explicitPath;
        else if (const char* env = std::getenv("PARLEY_CONFIG"); env && env[0]) path = env;
        else path = GetConfigDir() / "client.json";

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) return ClientConfig{};

        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        json j = json::parse(buffer.str(), nullptr, false);
        if (j.is_discarded()) {
            LOG_ERROR("config " + path.string() + " is not valid JSON, using defaults");
            return ClientConfig{};
        }
        try {
            return ClientConfig::FromJson(j);
        }
        catch (const json::exception& e) {
            LOG_ERROR("config " + path.string() + " has a bad value (" + e.what() + "), using defaults");
            return ClientConfig{};
        }
    }

    // ---------------------------------------------------------------------------
    // Session token persistence
    // ---------------------------------------------------------------------------

    StoredSession ConfigManager::LoadSession() {
        std::lock_guard lock(m_Mutex);
        StoredSession session;
        std::ifstream file(SessionPath());
        if (!file.is_open()) return session;

        std::stringstream buffer;
        buffer << file.rdbuf();
        json j = json::parse(buffer.str(), nullptr, false);
        if (j.is_discarded() || !j.is_object()) return session;
        try {
            session.login = j.value("login", "");
            session.token = j.value("token", "");
            session.expiresAt = j.value("expires_at", int64_t{ 0 });
        }
        catch (const json::exception& e) {
            LOG_ERROR(std::string("stored session unreadable: ") + e.what());
            return StoredSession{};
        }
        return session;
    }

    bool ConfigManager::SaveSession(const StoredSession& session) {
        std::lock_guard lock(m_Mutex);
        json j;
        j["login"] = session.login;
        j["token"] = session.token;
        j["expires_at"] = session.expiresAt;

        const std::filesystem::path path = SessionPath();
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        std::ofstream file(path, std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("cannot write " + path.string());
            return false;
        }
        file << j.dump(4);
        file.close();
        std::filesystem::permissions(path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace, ec);
        return true;
    }

    void ConfigManager::ClearSession() {
        std::lock_guard lock(m_Mutex);
        std::error_code ec;
        std::filesystem::remove(SessionPath(), ec);
    }

    std::filesystem::path ConfigManager::GetConfigDir() {
        if (!m_DirOverride.empty()) return m_DirOverride;
        if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && xdg[0])
            return std::filesystem::path(xdg) / "parley";
        if (const char* home = std::getenv("HOME"); home && home[0])
            return std::filesystem::path(home) / ".config" / "parley";
        return std::filesystem::path(".parley");
    }

    void ConfigManager::SetConfigDir(const std::filesystem::path& dir) {
        m_DirOverride = dir;
    }

} // namespace Parley
