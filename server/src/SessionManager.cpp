#include "SessionManager.h"
#include "Crypto.h"
#include "Logger.h"

namespace Parley {

    SessionManager::SessionManager(Database& db, const Clock& clock, SessionSettings settings)
        : m_Db(db), m_Clock(clock), m_Settings(settings) {
    }

    std::optional<IssuedSession> SessionManager::CreateSession(const std::string& login) {
        const int64_t nowMs = m_Clock.NowMs();
        SessionRecord s;
        s.token = GenerateSessionToken();
        s.login = login;
        s.createdAt = nowMs;
        s.lastSeen = nowMs;
        s.expiresAt = nowMs + m_Settings.ttlMs;
        if (!m_Db.InsertSession(s)) return std::nullopt;
        return IssuedSession{ s.token, s.expiresAt };
    }

    std::optional<SessionRecord> SessionManager::Lookup(const std::string& token) {
        if (token.empty()) return std::nullopt;
        const int64_t nowMs = m_Clock.NowMs();
        m_Db.DeleteExpiredSessions(nowMs);
        auto s = m_Db.FindSession(token);
        if (!s || s->expiresAt < nowMs) {
            ForgetTouch(token);
            return std::nullopt;
        }
        return s;
    }

    std::optional<std::string> SessionManager::Validate(const std::string& token) {
        auto s = Lookup(token);
        if (!s) return std::nullopt;
        return s->login;
    }

    void SessionManager::Touch(const std::string& token) {
        if (token.empty()) return;
        const int64_t nowMs = m_Clock.NowMs();
        {
            std::lock_guard lock(m_TouchMutex);
            auto it = m_LastTouchMs.find(token);
            if (it != m_LastTouchMs.end() && nowMs - it->second < m_Settings.touchMinIntervalMs) return;
            m_LastTouchMs[token] = nowMs;

            // Entries past the interval no longer throttle anything; tokens that
            // expire without a logout would otherwise stay forever.
            if (nowMs - m_LastTouchPruneMs >= m_Settings.touchMinIntervalMs) {
                m_LastTouchPruneMs = nowMs;
                for (auto e = m_LastTouchMs.begin(); e != m_LastTouchMs.end();) {
                    if (nowMs - e->second >= m_Settings.touchMinIntervalMs) e = m_LastTouchMs.erase(e);
                    else ++e;
                }
            }
        }
        if (!m_Db.UpdateSessionLastSeen(token, nowMs)) {
            // Let the next request retry the write instead of waiting out the throttle.
            ForgetTouch(token);
            VoiceTrace::log("step=session_touch_fail");
        }
    }

    void SessionManager::Invalidate(const std::string& token) {
        if (token.empty()) return;
        m_Db.DeleteSession(token);
        ForgetTouch(token);
    }

    void SessionManager::SoftOffline(const std::string& token) {
        if (token.empty()) return;
        const int64_t stale = m_Clock.NowMs() - (m_Settings.onlineWindowMs + m_Settings.offlineSlackMs);
        m_Db.UpdateSessionLastSeen(token, stale);
        ForgetTouch(token);
    }

    bool SessionManager::IsOnline(const std::string& login) {
        if (login.empty()) return false;
        const int64_t nowMs = m_Clock.NowMs();
        return m_Db.HasSessionActiveSince(login, nowMs - m_Settings.onlineWindowMs, nowMs);
    }

    OpResult SessionManager::RequireAuth(const std::string& token, AuthContext& out) {
        if (token.empty())
            return OpResult::Fail(ErrorKind::AuthRequired, "authorization required");
        auto login = Validate(token);
        if (!login)
            return OpResult::Fail(ErrorKind::AuthInvalid, "session is invalid, log in again");
        Touch(token);
        out.login = *login;
        out.token = token;
        return OpResult::Success();
    }

    size_t SessionManager::TrackedTouches() {
        std::lock_guard lock(m_TouchMutex);
        return m_LastTouchMs.size();
    }

    void SessionManager::ForgetTouch(const std::string& token) {
        std::lock_guard lock(m_TouchMutex);
        m_LastTouchMs.erase(token);
    }

} // namespace Parley
