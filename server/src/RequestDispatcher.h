#pragma once
#include "CallSignaling.h"
#include "ChannelVoice.h"
#include "Database.h"
#include "EventOutbox.h"
#include "SessionManager.h"
#include "../../src/shared/Clock.h"
#include "../../src/shared/Errors.h"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace Parley {

    // Maps one control request object to one response object. Authentication is
    // gated from the shared action table; handlers see an already resolved login.
    class RequestDispatcher {
    public:
        RequestDispatcher(Database& db, SessionManager& sessions, EventOutbox& events,
            CallSignaling& calls, ChannelVoice& voice, const Clock& clock);

        // Never throws; every failure becomes {"status":"error", ...}.
        nlohmann::json Dispatch(const nlohmann::json& request);

        static nlohmann::json ErrorResponse(const OpResult& r);
        static nlohmann::json ErrorResponse(ErrorKind kind, const std::string& message);

    private:
        using Handler = nlohmann::json(RequestDispatcher::*)(const nlohmann::json&, const AuthContext&);

        nlohmann::json HandleRegister(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleLogin(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleResumeSession(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleFindUser(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleHeartbeat(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleStatus(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleLogout(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleReleaseCallState(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandlePresenceOffline(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleCallUser(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleAcceptCall(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleDeclineCall(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleEndCall(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandlePollEvents(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleSetVoicePresence(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleLeaveVoice(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleVoiceParticipants(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleSendFriendRequest(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleAcceptFriendRequest(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleCreateChannel(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleJoinChannel(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleSetMemberRole(const nlohmann::json& req, const AuthContext& auth);
        nlohmann::json HandleUpdateVoiceRole(const nlohmann::json& req, const AuthContext& auth);

        std::string NewChannelCode();

        Database& m_Db;
        SessionManager& m_Sessions;
        EventOutbox& m_Events;
        CallSignaling& m_Calls;
        ChannelVoice& m_Voice;
        const Clock& m_Clock;

        std::unordered_map<std::string, Handler> m_Handlers;
    };

} // namespace Parley
