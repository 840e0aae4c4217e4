#pragma once
#include "Database.h"
#include "EventOutbox.h"
#include "ServerConfig.h"
#include "SessionManager.h"
#include "../../src/shared/Clock.h"
#include "../../src/shared/Errors.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace Parley {

    enum class CallStatus { Ringing, Active };

    struct CallPair {
        std::string userA;      // canonical order: userA < userB
        std::string userB;
        std::string caller;
        CallStatus  status = CallStatus::Ringing;
        int64_t     createdAt = 0;
        int64_t     updatedAt = 0;

        const std::string& Other(const std::string& login) const { return login == userA ? userB : userA; }
    };

    // One-to-one call lifecycle. A login is in at most one pair; all pair state
    // stays behind m_Mutex and is only reachable through these operations.
    class CallSignaling {
    public:
        CallSignaling(Database& db, SessionManager& sessions, EventOutbox& events,
            const Clock& clock, CallSettings settings);

        OpResult StartCall(const std::string& caller, const std::string& callee);
        OpResult AcceptCall(const std::string& acceptor, const std::string& caller);
        OpResult DeclineCall(const std::string& decliner, const std::string& caller);
        OpResult EndCall(const std::string& user, const std::string& peer);

        void MarkActivity(const std::string& login);

        // Releases every pair with a side silent longer than staleMs and tells both
        // sides call_ended by "system". Returns the number of pairs released.
        size_t PruneStale();

        // Logout / app close: drops the login's pair and notifies the peer.
        void CleanupForUser(const std::string& login);

        bool HasActivePair(const std::string& a, const std::string& b) const;
        std::optional<std::string> PeerOf(const std::string& login) const;
        std::optional<CallPair> PairOf(const std::string& login) const;
        size_t PairCount() const;

    private:
        using PairKey = std::pair<std::string, std::string>;
        static PairKey Canon(const std::string& a, const std::string& b);

        // Caller holds m_Mutex.
        void RemovePairLocked(const PairKey& key);

        Database& m_Db;
        SessionManager& m_Sessions;
        EventOutbox& m_Events;
        const Clock& m_Clock;
        CallSettings m_Settings;

        mutable std::mutex m_Mutex;
        std::map<PairKey, CallPair> m_Pairs;
        std::unordered_map<std::string, std::string> m_PeerOf;
        std::unordered_map<std::string, int64_t> m_ActivityMs;
    };

} // namespace Parley
