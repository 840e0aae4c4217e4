#include "RequestDispatcher.h"
#include "Crypto.h"
#include "Logger.h"
#include "../../src/shared/Actions.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace {

    std::string Trim(const std::string& s) {
        size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    // Trimmed string field; non-strings read as empty.
    std::string Str(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return {};
        return Trim(it->get<std::string>());
    }

    std::string RawStr(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }

    // Accepts integers, integral floats and numeric strings that fit int64;
    // anything else reads as 0.
    int64_t Int(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end()) return 0;
        if (it->is_number_unsigned()) {
            const uint64_t v = it->get<uint64_t>();
            return v > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ? 0 : static_cast<int64_t>(v);
        }
        if (it->is_number_integer()) return it->get<int64_t>();
        if (it->is_number_float()) {
            // 2^63 is exact in a double; anything at or past it overflows the cast.
            const double v = it->get<double>();
            if (!std::isfinite(v) || v != std::trunc(v) || v >= 9223372036854775808.0 || v < -9223372036854775808.0)
                return 0;
            return static_cast<int64_t>(v);
        }
        if (it->is_string()) {
            try { return std::stoll(it->get<std::string>()); }
            catch (const std::exception&) { return 0; }
        }
        return 0;
    }

    bool Bool(const json& j, const char* key, bool def) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return def;
        if (it->is_boolean()) return it->get<bool>();
        if (it->is_number()) return it->get<double>() != 0.0;
        return def;
    }

    json Ok() { return json{ { "status", "ok" } }; }

    json ChannelJson(const Parley::ChannelRecord& c) {
        return json{
            { "id", c.id },
            { "code", c.code },
            { "name", c.name },
            { "owner_login", c.ownerLogin },
            { "text_min_role", c.textMinRole },
            { "voice_min_role", c.voiceMinRole },
        };
    }

    constexpr size_t kMaxChannelName = 64;
    constexpr size_t kChannelCodeLength = 8;

} // namespace

namespace Parley {

    RequestDispatcher::RequestDispatcher(Database& db, SessionManager& sessions, EventOutbox& events,
        CallSignaling& calls, ChannelVoice& voice, const Clock& clock)
        : m_Db(db), m_Sessions(sessions), m_Events(events), m_Calls(calls), m_Voice(voice), m_Clock(clock)
    {
        m_Handlers = {
            { "register",                       &RequestDispatcher::HandleRegister },
            { "login",                          &RequestDispatcher::HandleLogin },
            { "resume_session",                 &RequestDispatcher::HandleResumeSession },
            { "find_user",                      &RequestDispatcher::HandleFindUser },
            { "heartbeat",                      &RequestDispatcher::HandleHeartbeat },
            { "status",                         &RequestDispatcher::HandleStatus },
            { "logout",                         &RequestDispatcher::HandleLogout },
            { "release_call_state",             &RequestDispatcher::HandleReleaseCallState },
            { "presence_offline",               &RequestDispatcher::HandlePresenceOffline },
            { "call_user",                      &RequestDispatcher::HandleCallUser },
            { "accept_call",                    &RequestDispatcher::HandleAcceptCall },
            { "decline_call",                   &RequestDispatcher::HandleDeclineCall },
            { "end_call",                       &RequestDispatcher::HandleEndCall },
            { "poll_events",                    &RequestDispatcher::HandlePollEvents },
            { "set_channel_voice_presence",     &RequestDispatcher::HandleSetVoicePresence },
            { "leave_channel_voice",            &RequestDispatcher::HandleLeaveVoice },
            { "get_channel_voice_participants", &RequestDispatcher::HandleVoiceParticipants },
            { "send_friend_request",            &RequestDispatcher::HandleSendFriendRequest },
            { "accept_friend_request",          &RequestDispatcher::HandleAcceptFriendRequest },
            { "create_channel",                 &RequestDispatcher::HandleCreateChannel },
            { "join_channel",                   &RequestDispatcher::HandleJoinChannel },
            { "set_channel_member_role",        &RequestDispatcher::HandleSetMemberRole },
            { "update_channel_voice_role",      &RequestDispatcher::HandleUpdateVoiceRole },
        };
    }

    json RequestDispatcher::ErrorResponse(ErrorKind kind, const std::string& message) {
        json res{ { "status", "error" }, { "message", message } };
        if (const char* code = ErrorCode(kind)) res["code"] = code;
        return res;
    }

    json RequestDispatcher::ErrorResponse(const OpResult& r) {
        return ErrorResponse(r.kind, r.message);
    }

    json RequestDispatcher::Dispatch(const json& request) {
        if (!request.is_object()) return ErrorResponse(ErrorKind::Malformed, "empty request");

        const std::string action = Str(request, "action");
        try {
            m_Calls.PruneStale();

            if (action.empty()) return ErrorResponse(ErrorKind::Malformed, "no action");
            const ActionInfo* info = FindAction(action);
            auto handler = m_Handlers.find(action);
            if (!info || handler == m_Handlers.end())
                return ErrorResponse(ErrorKind::Malformed, "unknown action");

            std::string token = RawStr(request, "token");
            if (token.empty()) token = RawStr(request, "session_token");

            AuthContext auth;
            if (info->requiresAuth) {
                OpResult r = m_Sessions.RequireAuth(token, auth);
                if (!r) return ErrorResponse(r);
            }
            else if (!token.empty() && action == "find_user") {
                // Optional here, but a token that is sent must still be valid.
                OpResult r = m_Sessions.RequireAuth(token, auth);
                if (!r) return ErrorResponse(r);
            }
            else {
                auth.token = token;
            }

            return (this->*(handler->second))(request, auth);
        }
        catch (const json::exception& e) {
            std::fprintf(stderr, "[Parley Server] action=%s bad field: %s\n", action.c_str(), e.what());
            return ErrorResponse(ErrorKind::Malformed, "invalid request");
        }
        catch (const std::exception& e) {
            std::fprintf(stderr, "[Parley Server] action=%s failed: %s\n", action.c_str(), e.what());
            return ErrorResponse(ErrorKind::Transient, std::string("server error: ") + e.what());
        }
    }

    // ---------------------------------------------------------------------------
    // Accounts and sessions
    // ---------------------------------------------------------------------------

    json RequestDispatcher::HandleRegister(const json& req, const AuthContext&) {
        const std::string login = Str(req, "login");
        const std::string password = RawStr(req, "password");
        const std::string nickname = Str(req, "nickname");
        if (login.empty() || password.empty() || nickname.empty())
            return ErrorResponse(ErrorKind::Malformed, "fill in all fields");
        if (login.find('|') != std::string::npos)
            return ErrorResponse(ErrorKind::Malformed, "login must not contain '|'");

        const std::string hash = HashPassword(password, m_Sessions.Settings().pbkdf2Iterations);
        if (!m_Db.CreateUser(login, hash, nickname))
            return ErrorResponse(ErrorKind::Conflict, "login already exists");
        std::fprintf(stderr, "[Parley Server] registered %s\n", login.c_str());
        return Ok();
    }

    json RequestDispatcher::HandleLogin(const json& req, const AuthContext&) {
        const std::string login = Str(req, "login");
        const std::string password = RawStr(req, "password");

        auto user = m_Db.GetUser(login);
        bool needsUpgrade = false;
        if (!user || !VerifyPassword(password, user->passwordHash, &needsUpgrade))
            return ErrorResponse(ErrorKind::Forbidden, "invalid login or password");

        if (needsUpgrade) {
            const std::string hash = HashPassword(password, m_Sessions.Settings().pbkdf2Iterations);
            if (m_Db.UpdatePassword(login, hash))
                VoiceTrace::log("step=password_upgrade user=" + login);
        }

        auto session = m_Sessions.CreateSession(login);
        if (!session) return ErrorResponse(ErrorKind::Transient, "could not create session");

        json res = Ok();
        res["login"] = user->login;
        res["nickname"] = user->nickname;
        res["token"] = session->token;
        res["expires_at"] = session->expiresAt;
        return res;
    }

    json RequestDispatcher::HandleResumeSession(const json&, const AuthContext& auth) {
        if (auth.token.empty()) return ErrorResponse(ErrorKind::AuthRequired, "session token required");
        auto session = m_Sessions.Lookup(auth.token);
        if (!session) return ErrorResponse(ErrorKind::AuthInvalid, "session invalid");
        m_Sessions.Touch(auth.token);

        auto user = m_Db.GetUser(session->login);
        json res = Ok();
        res["login"] = session->login;
        res["nickname"] = user ? user->nickname : session->login;
        res["token"] = auth.token;
        res["expires_at"] = session->expiresAt;
        return res;
    }

    json RequestDispatcher::HandleFindUser(const json& req, const AuthContext&) {
        std::string target = Str(req, "target_login");
        if (target.empty()) target = Str(req, "login");
        if (target.empty()) return ErrorResponse(ErrorKind::Malformed, "no login given");

        auto user = m_Db.GetUser(target);
        if (!user) return ErrorResponse(ErrorKind::NotFound, "user not found");

        json res = Ok();
        res["login"] = user->login;
        res["nickname"] = user->nickname;
        res["online"] = m_Sessions.IsOnline(user->login);
        return res;
    }

    json RequestDispatcher::HandleHeartbeat(const json&, const AuthContext& auth) {
        m_Calls.MarkActivity(auth.login);
        return Ok();
    }

    json RequestDispatcher::HandleStatus(const json&, const AuthContext& auth) {
        json res = Ok();
        res["login"] = auth.login;
        res["online"] = m_Sessions.IsOnline(auth.login);
        return res;
    }

    json RequestDispatcher::HandleLogout(const json&, const AuthContext& auth) {
        m_Calls.CleanupForUser(auth.login);
        m_Sessions.Invalidate(auth.token);
        return Ok();
    }

    json RequestDispatcher::HandleReleaseCallState(const json&, const AuthContext& auth) {
        m_Calls.CleanupForUser(auth.login);
        return Ok();
    }

    json RequestDispatcher::HandlePresenceOffline(const json&, const AuthContext& auth) {
        m_Sessions.SoftOffline(auth.token);
        return Ok();
    }

    // ---------------------------------------------------------------------------
    // Calls
    // ---------------------------------------------------------------------------

    json RequestDispatcher::HandleCallUser(const json& req, const AuthContext& auth) {
        OpResult r = m_Calls.StartCall(auth.login, Str(req, "to_user"));
        return r ? Ok() : ErrorResponse(r);
    }

    json RequestDispatcher::HandleAcceptCall(const json& req, const AuthContext& auth) {
        OpResult r = m_Calls.AcceptCall(auth.login, Str(req, "from_user"));
        return r ? Ok() : ErrorResponse(r);
    }

    json RequestDispatcher::HandleDeclineCall(const json& req, const AuthContext& auth) {
        OpResult r = m_Calls.DeclineCall(auth.login, Str(req, "from_user"));
        return r ? Ok() : ErrorResponse(r);
    }

    json RequestDispatcher::HandleEndCall(const json& req, const AuthContext& auth) {
        OpResult r = m_Calls.EndCall(auth.login, Str(req, "with_user"));
        return r ? Ok() : ErrorResponse(r);
    }

    json RequestDispatcher::HandlePollEvents(const json&, const AuthContext& auth) {
        m_Calls.MarkActivity(auth.login);
        json events = json::array();
        for (const auto& ev : m_Events.Drain(auth.login))
            events.push_back(ev.ToJson());
        json res = Ok();
        res["events"] = std::move(events);
        return res;
    }

    // ---------------------------------------------------------------------------
    // Channel voice
    // ---------------------------------------------------------------------------

    json RequestDispatcher::HandleSetVoicePresence(const json& req, const AuthContext& auth) {
        OpResult r = m_Voice.SetPresence(auth.login, Int(req, "channel_id"),
            Bool(req, "speaking", false), Bool(req, "joined", true));
        return r ? Ok() : ErrorResponse(r);
    }

    json RequestDispatcher::HandleLeaveVoice(const json& req, const AuthContext& auth) {
        OpResult r = m_Voice.Leave(auth.login, Int(req, "channel_id"));
        return r ? Ok() : ErrorResponse(r);
    }

    json RequestDispatcher::HandleVoiceParticipants(const json& req, const AuthContext& auth) {
        std::vector<VoiceParticipant> list;
        OpResult r = m_Voice.ListParticipants(Int(req, "channel_id"), auth.login, list);
        if (!r) return ErrorResponse(r);

        json participants = json::array();
        for (const auto& p : list) {
            participants.push_back({
                { "login", p.login },
                { "nickname", p.nickname },
                { "role", ChannelRoleName(p.role) },
                { "speaking", p.speaking },
                { "online", p.online },
            });
        }
        json res = Ok();
        res["participants"] = std::move(participants);
        return res;
    }

    // ---------------------------------------------------------------------------
    // Friends and channels
    // ---------------------------------------------------------------------------

    json RequestDispatcher::HandleSendFriendRequest(const json& req, const AuthContext& auth) {
        const std::string to = Str(req, "to_user");
        if (to.empty() || to == auth.login) return ErrorResponse(ErrorKind::Malformed, "invalid recipient");
        if (!m_Db.UserExists(to)) return ErrorResponse(ErrorKind::NotFound, "user not found");
        if (m_Db.AreFriends(auth.login, to)) return ErrorResponse(ErrorKind::Conflict, "already friends");
        if (!m_Db.AddFriendRequest(auth.login, to))
            return ErrorResponse(ErrorKind::Conflict, "request already sent");
        m_Events.Push(to, "friend_request", json{ { "from_user", auth.login } });
        return Ok();
    }

    json RequestDispatcher::HandleAcceptFriendRequest(const json& req, const AuthContext& auth) {
        const std::string from = Str(req, "from_user");
        if (from.empty()) return ErrorResponse(ErrorKind::Malformed, "no sender given");
        if (!m_Db.AcceptFriendRequest(from, auth.login))
            return ErrorResponse(ErrorKind::NotFound, "request not found or already handled");
        m_Events.Push(from, "friend_request_accepted", json{ { "by_user", auth.login } });
        return Ok();
    }

    std::string RequestDispatcher::NewChannelCode() {
        static const char kAlphabet[] = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
        constexpr size_t kAlphabetSize = sizeof(kAlphabet) - 1;
        for (int attempt = 0; attempt < 8; ++attempt) {
            const auto bytes = RandomBytes(kChannelCodeLength);
            std::string code;
            code.reserve(kChannelCodeLength);
            for (uint8_t b : bytes) code.push_back(kAlphabet[b % kAlphabetSize]);
            if (!m_Db.FindChannelByCode(code)) return code;
        }
        throw std::runtime_error("no free channel code");
    }

    json RequestDispatcher::HandleCreateChannel(const json& req, const AuthContext& auth) {
        std::string name = Str(req, "name");
        if (name.empty()) return ErrorResponse(ErrorKind::Malformed, "channel name must not be empty");
        if (name.size() > kMaxChannelName) name.resize(kMaxChannelName);

        auto channel = m_Db.CreateChannel(auth.login, name, NewChannelCode(), m_Clock.NowMs());
        if (!channel) return ErrorResponse(ErrorKind::Transient, "could not create channel");
        std::fprintf(stderr, "[Parley Server] channel %lld created by %s\n",
            static_cast<long long>(channel->id), auth.login.c_str());

        json res = Ok();
        res["channel"] = ChannelJson(*channel);
        return res;
    }

    json RequestDispatcher::HandleJoinChannel(const json& req, const AuthContext& auth) {
        const std::string code = Str(req, "code");
        if (code.empty()) return ErrorResponse(ErrorKind::Malformed, "no channel code given");
        auto channel = m_Db.FindChannelByCode(code);
        if (!channel) return ErrorResponse(ErrorKind::NotFound, "channel not found");
        if (!m_Db.GetMemberRole(channel->id, auth.login)
            && !m_Db.AddChannelMember(channel->id, auth.login, "member", m_Clock.NowMs()))
            return ErrorResponse(ErrorKind::Transient, "could not join channel");

        json res = Ok();
        res["channel"] = ChannelJson(*channel);
        return res;
    }

    json RequestDispatcher::HandleSetMemberRole(const json& req, const AuthContext& auth) {
        OpResult r = m_Voice.SetMemberRole(auth.login, Int(req, "channel_id"),
            Str(req, "target_login"), Str(req, "role"));
        return r ? Ok() : ErrorResponse(r);
    }

    json RequestDispatcher::HandleUpdateVoiceRole(const json& req, const AuthContext& auth) {
        std::string role = Str(req, "voice_min_role");
        if (role.empty()) role = Str(req, "role");
        OpResult r = m_Voice.SetVoiceMinRole(auth.login, Int(req, "channel_id"), role);
        return r ? Ok() : ErrorResponse(r);
    }

} // namespace Parley
