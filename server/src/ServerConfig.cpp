#include "ServerConfig.h"
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace Parley {

    namespace {

        template <typename T>
        void Read(const json& j, const char* key, T& out) {
            auto it = j.find(key);
            if (it != j.end() && !it->is_null()) out = it->get<T>();
        }

        const json& Section(const json& j, const char* key) {
            static const json kEmpty = json::object();
            auto it = j.find(key);
            return (it != j.end() && it->is_object()) ? *it : kEmpty;
        }

    } // namespace

    ServerConfig ServerConfig::FromJson(const json& j) {
        ServerConfig c;
        Read(j, "bind_address", c.bindAddress);
        Read(j, "control_port", c.controlPort);
        Read(j, "voice_port", c.voicePort);
        Read(j, "database", c.databasePath);
        Read(j, "threads", c.threads);
        Read(j, "voice_trace", c.voiceTrace);
        Read(j, "voice_trace_path", c.voiceTracePath);

        const json& s = Section(j, "sessions");
        Read(s, "ttl_ms", c.sessions.ttlMs);
        Read(s, "online_window_ms", c.sessions.onlineWindowMs);
        Read(s, "touch_min_interval_ms", c.sessions.touchMinIntervalMs);
        Read(s, "offline_slack_ms", c.sessions.offlineSlackMs);
        Read(s, "pbkdf2_iterations", c.sessions.pbkdf2Iterations);

        const json& e = Section(j, "events");
        Read(e, "max_per_user", c.events.maxPerUser);
        Read(e, "ttl_ms", c.events.ttlMs);

        Read(Section(j, "calls"), "stale_ms", c.calls.staleMs);
        Read(Section(j, "voice"), "presence_ttl_ms", c.voice.presenceTtlMs);

        const json& ctl = Section(j, "control");
        Read(ctl, "allow_legacy_json", c.control.allowLegacyJson);
        Read(ctl, "legacy_idle_ms", c.control.legacyIdleMs);
        Read(ctl, "request_deadline_ms", c.control.requestDeadlineMs);

        const json& r = Section(j, "relay");
        Read(r, "allow_legacy_join", c.relay.allowLegacyJoin);
        Read(r, "allow_legacy_pairing", c.relay.allowLegacyPairing);
        Read(r, "endpoint_ttl_ms", c.relay.endpointTtlMs);
        Read(r, "room_ttl_ms", c.relay.roomTtlMs);
        Read(r, "sweep_interval_ms", c.relay.sweepIntervalMs);
        Read(r, "control_rate_limit", c.relay.controlRateLimit);
        Read(r, "control_rate_window_ms", c.relay.controlRateWindowMs);
        return c;
    }

    ServerConfig ServerConfig::Load(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) return ServerConfig{};
        try {
            json j;
            file >> j;
            if (!j.is_object()) {
                std::fprintf(stderr, "[Parley Server] Config %s is not an object, using defaults\n", path.c_str());
                return ServerConfig{};
            }
            return FromJson(j);
        }
        catch (const json::exception& e) {
            std::fprintf(stderr, "[Parley Server] Config %s ignored: %s\n", path.c_str(), e.what());
            return ServerConfig{};
        }
    }

    void ServerConfig::ApplyEnvironment() {
        if (const char* db = std::getenv("PARLEY_DB"); db && db[0])
            databasePath = db;
        if (const char* t = std::getenv("PARLEY_VOICE_TRACE"))
            voiceTrace = (t[0] == '1' || t[0] == 'y' || t[0] == 'Y');
    }

} // namespace Parley
