#pragma once
#include "Database.h"
#include "ServerConfig.h"
#include "SessionManager.h"
#include "../../src/shared/Clock.h"
#include "../../src/shared/Errors.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Parley {

    enum class ChannelRole : int { Member = 1, Moderator = 2, Admin = 3, Owner = 4 };

    // Unknown strings normalize to Member.
    ChannelRole ParseChannelRole(const std::string& role);
    const char* ChannelRoleName(ChannelRole role);
    int RoleRank(ChannelRole role);

    struct VoiceParticipant {
        std::string login;
        std::string nickname;
        ChannelRole role = ChannelRole::Member;
        bool        speaking = false;
        bool        online = false;
    };

    // Channel voice rooms: role-gated membership and a presence lease that
    // clients renew while they are in the room.
    class ChannelVoice {
    public:
        ChannelVoice(Database& db, SessionManager& sessions, const Clock& clock, VoicePresenceSettings settings);

        // Effective role of a member (owner_login wins); nullopt if not a member.
        std::optional<ChannelRole> RoleOf(const std::string& login, int64_t channelId);

        bool CanJoinVoice(const std::string& login, int64_t channelId);
        bool CanSendText(const std::string& login, int64_t channelId);

        OpResult SetPresence(const std::string& login, int64_t channelId, bool speaking, bool joined);
        OpResult Leave(const std::string& login, int64_t channelId);
        OpResult ListParticipants(int64_t channelId, const std::string& requester, std::vector<VoiceParticipant>& out);

        // Owner/admin maintenance of member roles and the room's voice gate.
        OpResult SetMemberRole(const std::string& actor, int64_t channelId, const std::string& target, const std::string& role);
        OpResult SetVoiceMinRole(const std::string& actor, int64_t channelId, const std::string& role);

    private:
        bool MeetsMinRole(const std::string& login, int64_t channelId, bool voice);

        Database& m_Db;
        SessionManager& m_Sessions;
        const Clock& m_Clock;
        VoicePresenceSettings m_Settings;
    };

} // namespace Parley
