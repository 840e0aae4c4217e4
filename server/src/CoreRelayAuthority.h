#pragma once
#include "CallSignaling.h"
#include "ChannelVoice.h"
#include "Database.h"
#include "RelayRouter.h"
#include "SessionManager.h"

namespace Parley {

    // Wires the relay's questions to the live control-plane services.
    class CoreRelayAuthority : public RelayAuthority {
    public:
        CoreRelayAuthority(SessionManager& sessions, Database& db, CallSignaling& calls, ChannelVoice& voice)
            : m_Sessions(sessions), m_Db(db), m_Calls(calls), m_Voice(voice) {}

        std::optional<std::string> ValidateToken(const std::string& token) override;
        bool AreFriends(const std::string& a, const std::string& b) override;
        bool HasActiveCall(const std::string& a, const std::string& b) override;
        bool CanJoinVoice(const std::string& login, int64_t roomId) override;

    private:
        SessionManager& m_Sessions;
        Database& m_Db;
        CallSignaling& m_Calls;
        ChannelVoice& m_Voice;
    };

} // namespace Parley
