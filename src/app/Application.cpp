#include "Application.h"
#include "../core/Logger.h"
#include "../shared/Clock.h"
#include <chrono>
#include <cstdio>
#include <thread>

namespace Parley {

    namespace {
        constexpr int64_t kTickMs = 50;
        constexpr int64_t kActivityPrintMs = 5'000;
    }

    const char* AppStateName(AppState state) {
        switch (state) {
        case AppState::LoggedOut: return "logged_out";
        case AppState::Idle:      return "idle";
        case AppState::Calling:   return "calling";
        case AppState::Ringing:   return "ringing";
        case AppState::InCall:    return "in_call";
        case AppState::InRoom:    return "in_room";
        }
        return "unknown";
    }

    Application::Application(const ClientConfig& config)
        : m_Config(config)
        , m_Control(config)
        , m_Audio(config)
    {
        m_Audio.SetMicEnabled(config.audio.micEnabled);
        m_Audio.SetSoundEnabled(config.audio.soundEnabled);
    }

    Application::~Application() {
        m_Audio.Stop();
    }

    AppState Application::State() const {
        std::lock_guard lock(m_Mutex);
        return m_State;
    }

    std::string Application::CurrentLogin() const {
        std::lock_guard lock(m_Mutex);
        return m_Login;
    }

    std::string Application::Peer() const {
        std::lock_guard lock(m_Mutex);
        return m_Peer;
    }

    bool Application::Check(const ControlResponse& r, const char* what) {
        if (r.Ok()) return true;
        m_LastError = r.result.message;
        LOG_ERROR(std::string(what) + " failed: " + r.result.message);
        std::fprintf(stderr, "%s failed: %s (%s)\n", what, r.result.message.c_str(), ErrorKindName(r.result.kind));
        return false;
    }

    // ---------------------------------------------------------------------------
    // Account
    // ---------------------------------------------------------------------------

    bool Application::Register(const std::string& login, const std::string& password, const std::string& nickname) {
        auto r = m_Control.Call("register", json{ { "login", login }, { "password", password }, { "nickname", nickname } });
        if (!Check(r, "register")) return false;
        LOG_APP("registered " + login);
        return true;
    }

    bool Application::Login(const std::string& login, const std::string& password) {
        auto r = m_Control.Call("login", json{ { "login", login }, { "password", password } });
        if (!Check(r, "login")) return false;

        StoredSession session;
        session.login = r.body.value("login", login);
        session.token = r.body.value("token", "");
        session.expiresAt = r.body.value("expires_at", int64_t{ 0 });
        if (!session.Valid()) {
            m_LastError = "login response without token";
            LOG_ERROR(m_LastError);
            return false;
        }
        if (!ConfigManager::Get().SaveSession(session))
            LOG_ERROR("could not persist session token");

        std::lock_guard lock(m_Mutex);
        m_Login = session.login;
        m_Token = session.token;
        m_State = AppState::Idle;
        LOG_APP("logged in as " + m_Login);
        return true;
    }

    bool Application::ResumeSession() {
        StoredSession stored = ConfigManager::Get().LoadSession();
        if (!stored.Valid()) {
            m_LastError = "no stored session";
            return false;
        }
        auto r = m_Control.Call("resume_session", json::object(), stored.token);
        if (!Check(r, "resume_session")) {
            if (r.result.kind == ErrorKind::AuthInvalid || r.result.kind == ErrorKind::AuthRequired)
                ConfigManager::Get().ClearSession();
            return false;
        }

        std::lock_guard lock(m_Mutex);
        m_Login = r.body.value("login", stored.login);
        m_Token = stored.token;
        m_State = AppState::Idle;
        LOG_APP("session resumed for " + m_Login);
        return true;
    }

    void Application::Logout() {
        m_Audio.Stop();
        std::string token;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
        }
        if (!token.empty()) {
            auto r = m_Control.Call("logout", json::object(), token);
            Check(r, "logout");
        }
        ConfigManager::Get().ClearSession();

        std::lock_guard lock(m_Mutex);
        m_Token.clear();
        m_Peer.clear();
        m_RoomId = 0;
        m_State = AppState::LoggedOut;
    }

    // ---------------------------------------------------------------------------
    // Calls
    // ---------------------------------------------------------------------------

    bool Application::CallUser(const std::string& peer) {
        std::string token;
        {
            std::lock_guard lock(m_Mutex);
            if (m_State != AppState::Idle) {
                m_LastError = std::string("cannot call while ") + AppStateName(m_State);
                return false;
            }
            token = m_Token;
        }
        auto r = m_Control.Call("call_user", json{ { "to_user", peer } }, token);
        if (!Check(r, "call_user")) return false;

        std::lock_guard lock(m_Mutex);
        m_Peer = peer;
        m_State = AppState::Calling;
        LOG_APP("calling " + peer);
        return true;
    }

    bool Application::AcceptCall(const std::string& caller) {
        std::string token;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
        }
        auto r = m_Control.Call("accept_call", json{ { "from_user", caller } }, token);
        if (!Check(r, "accept_call")) return false;
        StartCallAudio(caller);
        return true;
    }

    bool Application::DeclineCall(const std::string& caller) {
        std::string token;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
        }
        auto r = m_Control.Call("decline_call", json{ { "from_user", caller } }, token);
        ResetCall();
        return Check(r, "decline_call");
    }

    bool Application::EndCall() {
        std::string token, peer;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
            peer = m_Peer;
        }
        if (peer.empty()) return false;
        m_Audio.Stop();
        auto r = m_Control.Call("end_call", json{ { "with_user", peer } }, token);
        ResetCall();
        return Check(r, "end_call");
    }

    void Application::HangUp() {
        AppState state;
        std::string peer;
        {
            std::lock_guard lock(m_Mutex);
            state = m_State;
            peer = m_Peer;
        }
        if (state == AppState::Ringing)
            DeclineCall(peer);
        else if (state == AppState::Calling || state == AppState::InCall)
            EndCall();
    }

    // The caller is left ringing until a pair goes stale unless it hears back.
    void Application::DeclineBusy(const std::string& caller) {
        std::string token;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
        }
        LOG_APP("busy, declining call from " + caller);
        auto r = m_Control.Call("decline_call", json{ { "from_user", caller } }, token);
        Check(r, "decline_call");
    }

    void Application::StartCallAudio(const std::string& peer) {
        std::string login, token;
        {
            std::lock_guard lock(m_Mutex);
            m_Peer = peer;
            m_State = AppState::InCall;
            login = m_Login;
            token = m_Token;
        }
        if (!m_Audio.StartCall(login, token, peer))
            LOG_ERROR("call audio could not start with " + peer);
        else if (!m_Audio.HasDevice())
            std::printf("no audio device (%s), relaying without audio I/O\n", m_Audio.DeviceError().c_str());
        std::printf("in call with %s\n", peer.c_str());
    }

    void Application::ResetCall() {
        m_Audio.Stop();
        std::lock_guard lock(m_Mutex);
        m_Peer.clear();
        if (m_State != AppState::LoggedOut && m_State != AppState::InRoom)
            m_State = AppState::Idle;
    }

    // ---------------------------------------------------------------------------
    // Channel voice
    // ---------------------------------------------------------------------------

    bool Application::JoinRoom(int64_t channelId) {
        std::string login, token;
        {
            std::lock_guard lock(m_Mutex);
            if (m_State != AppState::Idle) {
                m_LastError = std::string("cannot join voice while ") + AppStateName(m_State);
                return false;
            }
            login = m_Login;
            token = m_Token;
        }
        auto r = m_Control.Call("set_channel_voice_presence",
            json{ { "channel_id", channelId }, { "speaking", false }, { "joined", true } }, token);
        if (!Check(r, "set_channel_voice_presence")) return false;

        {
            std::lock_guard lock(m_Mutex);
            m_RoomId = channelId;
            m_State = AppState::InRoom;
        }
        if (!m_Audio.StartRoom(login, token, channelId))
            LOG_ERROR("room audio could not start for channel " + std::to_string(channelId));
        std::printf("joined voice in channel %lld\n", static_cast<long long>(channelId));
        return true;
    }

    void Application::LeaveRoom() {
        std::string token;
        int64_t roomId = 0;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
            roomId = m_RoomId;
        }
        if (roomId <= 0) return;
        m_Audio.Stop();
        auto r = m_Control.Call("leave_channel_voice", json{ { "channel_id", roomId } }, token);
        Check(r, "leave_channel_voice");

        std::lock_guard lock(m_Mutex);
        m_RoomId = 0;
        if (m_State == AppState::InRoom) m_State = AppState::Idle;
    }

    void Application::PushPresence() {
        std::string token;
        int64_t roomId = 0;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
            roomId = m_RoomId;
        }
        if (roomId <= 0) return;
        const bool speaking = m_Audio.GetActivity().meSpeaking;
        auto r = m_Control.Call("set_channel_voice_presence",
            json{ { "channel_id", roomId }, { "speaking", speaking }, { "joined", true } }, token);
        Check(r, "presence push");
    }

    // ---------------------------------------------------------------------------
    // Events
    // ---------------------------------------------------------------------------

    void Application::HandleEvent(const json& ev) {
        if (!ev.is_object()) return;
        const std::string type = ev.value("type", "");
        LOG_NETWORK("event " + type);

        if (type == "incoming_call") {
            const std::string from = ev.value("from_user", "");
            if (from.empty()) return;
            bool accept = false;
            bool busy = false;
            {
                std::lock_guard lock(m_Mutex);
                if (m_State == AppState::Ringing && from == m_Peer) return;
                busy = m_State != AppState::Idle;
                if (!busy) {
                    m_Peer = from;
                    m_State = AppState::Ringing;
                    accept = m_AutoAccept;
                }
            }
            if (busy) {
                DeclineBusy(from);
                return;
            }
            std::printf("incoming call from %s\n", from.c_str());
            if (accept) AcceptCall(from);
        }
        else if (type == "call_accepted") {
            const std::string by = ev.value("by_user", "");
            bool start = false;
            {
                std::lock_guard lock(m_Mutex);
                start = m_State == AppState::Calling && by == m_Peer;
            }
            if (start) StartCallAudio(by);
        }
        else if (type == "call_declined") {
            const std::string by = ev.value("by_user", "");
            if (by != Peer()) return;
            std::printf("%s declined the call\n", by.c_str());
            ResetCall();
        }
        else if (type == "call_ended") {
            const std::string with = ev.value("with_user", "");
            if (with != Peer()) return;
            std::printf("call with %s ended (%s)\n", with.c_str(), ev.value("by_user", "").c_str());
            ResetCall();
        }
        else if (type == "friend_request") {
            std::printf("friend request from %s\n", ev.value("from_user", "").c_str());
        }
        else if (type == "friend_request_accepted") {
            std::printf("%s accepted your friend request\n", ev.value("by_user", "").c_str());
        }
    }

    bool Application::PollOnce() {
        std::string token;
        {
            std::lock_guard lock(m_Mutex);
            token = m_Token;
        }
        auto r = m_Control.Call("poll_events", json::object(), token);
        if (!r.Ok()) {
            Check(r, "poll_events");
            if (r.result.kind == ErrorKind::AuthInvalid || r.result.kind == ErrorKind::AuthRequired) {
                ConfigManager::Get().ClearSession();
                m_Audio.Stop();
                std::lock_guard lock(m_Mutex);
                m_State = AppState::LoggedOut;
                return false;
            }
            return true;
        }
        if (r.body.contains("events") && r.body["events"].is_array()) {
            for (const auto& ev : r.body["events"])
                HandleEvent(ev);
        }
        return true;
    }

    void Application::PrintActivity() {
        if (!m_Audio.IsRunning()) return;
        const ActivitySnapshot a = m_Audio.GetActivity();
        std::printf("[%s] mic %.3f%s peer %.3f%s latency %.0f ms jitter %.1f ms quality %s (%.0f)\n",
            AppStateName(State()),
            a.micLevel, a.meSpeaking ? "*" : "",
            a.peerLevel, a.peerSpeaking ? "*" : "",
            a.latencyMs, a.jitterMs, a.quality, a.qualityScore);
        std::fflush(stdout);
    }

    void Application::Run(const std::atomic<bool>& stop, int64_t durationMs) {
        const Clock& clock = SteadyClock::Instance();
        const int64_t start = clock.NowMs();
        int64_t nextPoll = start;
        int64_t nextHeartbeat = start + m_Config.heartbeatIntervalMs;
        int64_t nextPresence = start + m_Config.presencePushIntervalMs;
        int64_t nextPrint = start + kActivityPrintMs;

        while (!stop.load()) {
            const int64_t now = clock.NowMs();
            if (durationMs > 0 && now - start >= durationMs) break;
            if (State() == AppState::LoggedOut) break;

            // Poll is synchronous, so a new one only starts after the last returned.
            if (now >= nextPoll) {
                if (!PollOnce()) break;
                nextPoll = clock.NowMs() + m_Config.pollIntervalMs;
            }
            if (now >= nextHeartbeat) {
                std::string token;
                {
                    std::lock_guard lock(m_Mutex);
                    token = m_Token;
                }
                Check(m_Control.Call("heartbeat", json::object(), token), "heartbeat");
                nextHeartbeat = now + m_Config.heartbeatIntervalMs;
            }
            if (State() == AppState::InRoom && now >= nextPresence) {
                PushPresence();
                nextPresence = now + m_Config.presencePushIntervalMs;
            }
            if (now >= nextPrint) {
                PrintActivity();
                nextPrint = now + kActivityPrintMs;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(kTickMs));
        }
    }

} // namespace Parley
