#pragma once
#include "Database.h"
#include "ServerConfig.h"
#include "../../src/shared/Clock.h"
#include "../../src/shared/Errors.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace Parley {

    struct IssuedSession {
        std::string token;
        int64_t     expiresAt = 0;
    };

    struct AuthContext {
        std::string login;
        std::string token;
    };

    // Bearer-token sessions persisted in the sessions table. Presence is derived
    // from last_seen, so nothing has to be cleared when a client disappears.
    class SessionManager {
    public:
        SessionManager(Database& db, const Clock& clock, SessionSettings settings);

        std::optional<IssuedSession> CreateSession(const std::string& login);

        // Login of a live session; nullopt for empty, unknown or expired tokens.
        std::optional<std::string> Validate(const std::string& token);
        std::optional<SessionRecord> Lookup(const std::string& token);

        // Writes last_seen at most once per touchMinIntervalMs per token.
        void Touch(const std::string& token);
        void Invalidate(const std::string& token);
        void SoftOffline(const std::string& token);
        bool IsOnline(const std::string& login);

        // AuthRequired when token is empty, AuthInvalid when it does not validate.
        // Touches the session on success.
        OpResult RequireAuth(const std::string& token, AuthContext& out);

        const SessionSettings& Settings() const { return m_Settings; }

        // Size of the touch throttle map.
        size_t TrackedTouches();

    private:
        void ForgetTouch(const std::string& token);

        Database& m_Db;
        const Clock& m_Clock;
        SessionSettings m_Settings;

        std::mutex m_TouchMutex;
        std::unordered_map<std::string, int64_t> m_LastTouchMs;
        int64_t m_LastTouchPruneMs = 0;
    };

} // namespace Parley
