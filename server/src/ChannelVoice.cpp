#include "ChannelVoice.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>

namespace Parley {

    namespace {

        std::string Lower(std::string s) {
            const size_t first = s.find_first_not_of(" \t");
            if (first == std::string::npos) return {};
            s = s.substr(first, s.find_last_not_of(" \t") - first + 1);
            std::transform(s.begin(), s.end(), s.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    } // namespace

    ChannelRole ParseChannelRole(const std::string& role) {
        const std::string r = Lower(role);
        if (r == "owner") return ChannelRole::Owner;
        if (r == "admin") return ChannelRole::Admin;
        if (r == "moderator") return ChannelRole::Moderator;
        return ChannelRole::Member;
    }

    const char* ChannelRoleName(ChannelRole role) {
        switch (role) {
        case ChannelRole::Owner:     return "owner";
        case ChannelRole::Admin:     return "admin";
        case ChannelRole::Moderator: return "moderator";
        case ChannelRole::Member:    break;
        }
        return "member";
    }

    int RoleRank(ChannelRole role) {
        return static_cast<int>(role);
    }

    ChannelVoice::ChannelVoice(Database& db, SessionManager& sessions, const Clock& clock, VoicePresenceSettings settings)
        : m_Db(db), m_Sessions(sessions), m_Clock(clock), m_Settings(settings) {
    }

    std::optional<ChannelRole> ChannelVoice::RoleOf(const std::string& login, int64_t channelId) {
        auto channel = m_Db.GetChannel(channelId);
        if (!channel) return std::nullopt;
        auto stored = m_Db.GetMemberRole(channelId, login);
        if (!stored) return std::nullopt;
        if (channel->ownerLogin == login) return ChannelRole::Owner;
        return ParseChannelRole(*stored);
    }

    bool ChannelVoice::MeetsMinRole(const std::string& login, int64_t channelId, bool voice) {
        auto channel = m_Db.GetChannel(channelId);
        if (!channel) return false;
        auto role = RoleOf(login, channelId);
        if (!role) return false;
        if (*role == ChannelRole::Owner) return true;
        // owner is not a valid minimum and normalizes to member.
        ChannelRole need = ParseChannelRole(voice ? channel->voiceMinRole : channel->textMinRole);
        if (need == ChannelRole::Owner) need = ChannelRole::Member;
        return RoleRank(*role) >= RoleRank(need);
    }

    bool ChannelVoice::CanJoinVoice(const std::string& login, int64_t channelId) {
        return MeetsMinRole(login, channelId, true);
    }

    bool ChannelVoice::CanSendText(const std::string& login, int64_t channelId) {
        return MeetsMinRole(login, channelId, false);
    }

    OpResult ChannelVoice::SetPresence(const std::string& login, int64_t channelId, bool speaking, bool joined) {
        if (channelId <= 0) return OpResult::Fail(ErrorKind::Malformed, "no channel given");
        if (!RoleOf(login, channelId)) return OpResult::Fail(ErrorKind::Forbidden, "no access to channel");
        if (joined && !CanJoinVoice(login, channelId))
            return OpResult::Fail(ErrorKind::Forbidden, "your role cannot join this voice room");

        const int64_t nowMs = m_Clock.NowMs();
        m_Db.PruneVoicePresence(channelId, nowMs - m_Settings.presenceTtlMs);
        const bool ok = joined
            ? m_Db.UpsertVoicePresence(channelId, login, speaking, nowMs)
            : m_Db.DeleteVoicePresence(channelId, login);
        if (!ok) return OpResult::Fail(ErrorKind::Transient, "presence update failed");
        return OpResult::Success();
    }

    OpResult ChannelVoice::Leave(const std::string& login, int64_t channelId) {
        if (channelId <= 0) return OpResult::Fail(ErrorKind::Malformed, "no channel given");
        if (!m_Db.DeleteVoicePresence(channelId, login))
            return OpResult::Fail(ErrorKind::Transient, "presence update failed");
        return OpResult::Success();
    }

    OpResult ChannelVoice::ListParticipants(int64_t channelId, const std::string& requester,
        std::vector<VoiceParticipant>& out)
    {
        out.clear();
        if (channelId <= 0) return OpResult::Fail(ErrorKind::Malformed, "no channel given");
        auto channel = m_Db.GetChannel(channelId);
        if (!channel) return OpResult::Fail(ErrorKind::NotFound, "channel not found");
        if (!m_Db.GetMemberRole(channelId, requester)) return OpResult::Fail(ErrorKind::Forbidden, "no access to channel");

        const int64_t cutoff = m_Clock.NowMs() - m_Settings.presenceTtlMs;
        m_Db.PruneVoicePresence(channelId, cutoff);
        // Filtered again on read in case a stale row survived a concurrent prune.
        for (auto& row : m_Db.ListVoicePresence(channelId, cutoff)) {
            VoiceParticipant p;
            p.role = (row.login == channel->ownerLogin) ? ChannelRole::Owner : ParseChannelRole(row.role);
            p.login = std::move(row.login);
            p.nickname = row.nickname.empty() ? p.login : std::move(row.nickname);
            p.speaking = row.speaking;
            p.online = m_Sessions.IsOnline(p.login);
            out.push_back(std::move(p));
        }
        return OpResult::Success();
    }

    OpResult ChannelVoice::SetMemberRole(const std::string& actor, int64_t channelId,
        const std::string& target, const std::string& role)
    {
        if (channelId <= 0 || target.empty()) return OpResult::Fail(ErrorKind::Malformed, "invalid request");
        auto channel = m_Db.GetChannel(channelId);
        if (!channel) return OpResult::Fail(ErrorKind::NotFound, "channel not found");

        auto actorRole = RoleOf(actor, channelId);
        if (!actorRole || RoleRank(*actorRole) < RoleRank(ChannelRole::Admin))
            return OpResult::Fail(ErrorKind::Forbidden, "insufficient rights");
        auto targetRole = RoleOf(target, channelId);
        if (!targetRole) return OpResult::Fail(ErrorKind::NotFound, "member not found");
        if (*targetRole == ChannelRole::Owner) return OpResult::Fail(ErrorKind::Forbidden, "cannot change the owner's role");

        const ChannelRole wanted = ParseChannelRole(role);
        if (wanted == ChannelRole::Owner) return OpResult::Fail(ErrorKind::Forbidden, "ownership cannot be assigned");
        if (*actorRole == ChannelRole::Admin
            && (*targetRole == ChannelRole::Admin || wanted == ChannelRole::Admin))
            return OpResult::Fail(ErrorKind::Forbidden, "admins cannot manage admins");

        if (!m_Db.SetMemberRole(channelId, target, ChannelRoleName(wanted)))
            return OpResult::Fail(ErrorKind::Transient, "role update failed");
        VoiceTrace::log("step=channel_role cid=" + std::to_string(channelId) + " target=" + target
            + " role=" + ChannelRoleName(wanted));
        return OpResult::Success();
    }

    OpResult ChannelVoice::SetVoiceMinRole(const std::string& actor, int64_t channelId, const std::string& role) {
        if (channelId <= 0) return OpResult::Fail(ErrorKind::Malformed, "no channel given");
        auto actorRole = RoleOf(actor, channelId);
        if (!actorRole) return OpResult::Fail(ErrorKind::Forbidden, "no access to channel");
        if (RoleRank(*actorRole) < RoleRank(ChannelRole::Admin))
            return OpResult::Fail(ErrorKind::Forbidden, "insufficient rights");

        ChannelRole wanted = ParseChannelRole(role);
        if (wanted == ChannelRole::Owner) wanted = ChannelRole::Member;
        if (!m_Db.SetVoiceMinRole(channelId, ChannelRoleName(wanted)))
            return OpResult::Fail(ErrorKind::Transient, "settings update failed");
        return OpResult::Success();
    }

} // namespace Parley
