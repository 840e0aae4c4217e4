#include "CoreRelayAuthority.h"

namespace Parley {

    std::optional<std::string> CoreRelayAuthority::ValidateToken(const std::string& token) {
        if (token.empty()) return std::nullopt;
        return m_Sessions.Validate(token);
    }

    bool CoreRelayAuthority::AreFriends(const std::string& a, const std::string& b) {
        return m_Db.AreFriends(a, b);
    }

    bool CoreRelayAuthority::HasActiveCall(const std::string& a, const std::string& b) {
        return m_Calls.HasActivePair(a, b);
    }

    bool CoreRelayAuthority::CanJoinVoice(const std::string& login, int64_t roomId) {
        return roomId > 0 && m_Voice.CanJoinVoice(login, roomId);
    }

} // namespace Parley
