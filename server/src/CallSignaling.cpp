#include "CallSignaling.h"
#include "Logger.h"
#include <vector>

using json = nlohmann::json;

namespace Parley {

    CallSignaling::CallSignaling(Database& db, SessionManager& sessions, EventOutbox& events,
        const Clock& clock, CallSettings settings)
        : m_Db(db), m_Sessions(sessions), m_Events(events), m_Clock(clock), m_Settings(settings) {
    }

    CallSignaling::PairKey CallSignaling::Canon(const std::string& a, const std::string& b) {
        return a <= b ? PairKey{ a, b } : PairKey{ b, a };
    }

    void CallSignaling::RemovePairLocked(const PairKey& key) {
        m_Pairs.erase(key);
        m_PeerOf.erase(key.first);
        m_PeerOf.erase(key.second);
        m_ActivityMs.erase(key.first);
        m_ActivityMs.erase(key.second);
    }

    OpResult CallSignaling::StartCall(const std::string& caller, const std::string& callee) {
        PruneStale();

        if (callee.empty()) return OpResult::Fail(ErrorKind::Malformed, "no user given");
        if (callee == caller) return OpResult::Fail(ErrorKind::Malformed, "cannot call yourself");
        if (!m_Db.UserExists(callee)) return OpResult::Fail(ErrorKind::NotFound, "user not found");
        if (!m_Db.AreFriends(caller, callee)) return OpResult::Fail(ErrorKind::Forbidden, "you can only call friends");
        if (!m_Sessions.IsOnline(callee)) return OpResult::Fail(ErrorKind::Conflict, "user offline");

        {
            std::lock_guard lock(m_Mutex);
            if (m_PeerOf.count(caller) || m_PeerOf.count(callee))
                return OpResult::Fail(ErrorKind::Conflict, "user busy");

            const int64_t nowMs = m_Clock.NowMs();
            const PairKey key = Canon(caller, callee);
            CallPair pair;
            pair.userA = key.first;
            pair.userB = key.second;
            pair.caller = caller;
            pair.status = CallStatus::Ringing;
            pair.createdAt = nowMs;
            pair.updatedAt = nowMs;
            m_Pairs[key] = pair;
            m_PeerOf[caller] = callee;
            m_PeerOf[callee] = caller;
            m_ActivityMs[caller] = nowMs;
            m_ActivityMs[callee] = nowMs;
        }

        VoiceTrace::log("step=call_start from=" + caller + " to=" + callee);
        m_Events.Push(callee, "incoming_call", json{ { "from_user", caller } });
        return OpResult::Success();
    }

    OpResult CallSignaling::AcceptCall(const std::string& acceptor, const std::string& caller) {
        PruneStale();
        {
            std::lock_guard lock(m_Mutex);
            auto it = m_Pairs.find(Canon(acceptor, caller));
            if (acceptor == caller || it == m_Pairs.end() || it->second.caller != caller)
                return OpResult::Fail(ErrorKind::Conflict, "no active call");
            if (it->second.status != CallStatus::Ringing)
                return OpResult::Fail(ErrorKind::Conflict, "call already accepted");

            const int64_t nowMs = m_Clock.NowMs();
            it->second.status = CallStatus::Active;
            it->second.updatedAt = nowMs;
            m_ActivityMs[acceptor] = nowMs;
            m_ActivityMs[caller] = nowMs;
        }

        VoiceTrace::log("step=call_accept by=" + acceptor + " caller=" + caller);
        m_Events.Push(caller, "call_accepted", json{ { "by_user", acceptor }, { "with_user", acceptor } });
        m_Events.Push(acceptor, "call_started", json{ { "with_user", caller } });
        return OpResult::Success();
    }

    OpResult CallSignaling::DeclineCall(const std::string& decliner, const std::string& caller) {
        PruneStale();
        {
            std::lock_guard lock(m_Mutex);
            auto it = m_PeerOf.find(decliner);
            if (it == m_PeerOf.end() || it->second != caller)
                return OpResult::Fail(ErrorKind::Conflict, "no active call");
            RemovePairLocked(Canon(decliner, caller));
        }

        VoiceTrace::log("step=call_decline by=" + decliner + " caller=" + caller);
        m_Events.Push(caller, "call_declined", json{ { "by_user", decliner } });
        return OpResult::Success();
    }

    OpResult CallSignaling::EndCall(const std::string& user, const std::string& peer) {
        PruneStale();
        {
            std::lock_guard lock(m_Mutex);
            auto it = m_PeerOf.find(user);
            if (it == m_PeerOf.end() || it->second != peer)
                return OpResult::Fail(ErrorKind::Conflict, "no active call");
            RemovePairLocked(Canon(user, peer));
        }

        VoiceTrace::log("step=call_end by=" + user + " peer=" + peer);
        m_Events.Push(peer, "call_ended", json{ { "with_user", user }, { "by_user", user } });
        return OpResult::Success();
    }

    void CallSignaling::MarkActivity(const std::string& login) {
        if (login.empty()) return;
        std::lock_guard lock(m_Mutex);
        if (m_PeerOf.count(login)) m_ActivityMs[login] = m_Clock.NowMs();
    }

    size_t CallSignaling::PruneStale() {
        const int64_t nowMs = m_Clock.NowMs();
        std::vector<PairKey> stale;
        {
            std::lock_guard lock(m_Mutex);
            for (const auto& [key, pair] : m_Pairs) {
                auto ta = m_ActivityMs.find(key.first);
                auto tb = m_ActivityMs.find(key.second);
                const int64_t lastA = ta == m_ActivityMs.end() ? 0 : ta->second;
                const int64_t lastB = tb == m_ActivityMs.end() ? 0 : tb->second;
                if (nowMs - lastA > m_Settings.staleMs || nowMs - lastB > m_Settings.staleMs)
                    stale.push_back(key);
            }
            for (const auto& key : stale) RemovePairLocked(key);
        }

        for (const auto& [a, b] : stale) {
            VoiceTrace::log("step=call_prune a=" + a + " b=" + b + " reason=stale");
            m_Events.Push(a, "call_ended", json{ { "with_user", b }, { "by_user", "system" } });
            m_Events.Push(b, "call_ended", json{ { "with_user", a }, { "by_user", "system" } });
        }
        return stale.size();
    }

    void CallSignaling::CleanupForUser(const std::string& login) {
        std::string peer;
        {
            std::lock_guard lock(m_Mutex);
            auto it = m_PeerOf.find(login);
            if (it == m_PeerOf.end()) return;
            peer = it->second;
            RemovePairLocked(Canon(login, peer));
        }
        VoiceTrace::log("step=call_cleanup user=" + login + " peer=" + peer);
        m_Events.Push(peer, "call_ended", json{ { "with_user", login }, { "by_user", login } });
    }

    bool CallSignaling::HasActivePair(const std::string& a, const std::string& b) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_Pairs.find(Canon(a, b));
        return it != m_Pairs.end() && it->second.status == CallStatus::Active;
    }

    std::optional<std::string> CallSignaling::PeerOf(const std::string& login) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_PeerOf.find(login);
        if (it == m_PeerOf.end()) return std::nullopt;
        return it->second;
    }

    std::optional<CallPair> CallSignaling::PairOf(const std::string& login) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_PeerOf.find(login);
        if (it == m_PeerOf.end()) return std::nullopt;
        auto pit = m_Pairs.find(Canon(login, it->second));
        if (pit == m_Pairs.end()) return std::nullopt;
        return pit->second;
    }

    size_t CallSignaling::PairCount() const {
        std::lock_guard lock(m_Mutex);
        return m_Pairs.size();
    }

} // namespace Parley
