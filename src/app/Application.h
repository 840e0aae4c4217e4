#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include "../audio/AudioEngine.h"
#include "../core/ConfigManager.h"
#include "../network/ControlClient.h"

namespace Parley {

    enum class AppState { LoggedOut, Idle, Calling, Ringing, InCall, InRoom };

    const char* AppStateName(AppState state);

    // ---------------------------------------------------------------------------
    // Headless client. Owns the control client and the audio engine, keeps the
    // session, and reacts to polled events. Run() drives the periodic work on
    // the calling thread: one poll at a time, heartbeats, and the channel voice
    // presence push while in a room.
    // ---------------------------------------------------------------------------
    class Application {
    public:
        explicit Application(const ClientConfig& config);
        ~Application();

        Application(const Application&) = delete;
        Application& operator=(const Application&) = delete;

        bool Register(const std::string& login, const std::string& password, const std::string& nickname);
        bool Login(const std::string& login, const std::string& password);
        // Uses the token persisted by the last successful Login().
        bool ResumeSession();
        void Logout();

        bool CallUser(const std::string& peer);
        bool AcceptCall(const std::string& caller);
        bool DeclineCall(const std::string& caller);
        bool EndCall();
        // Leaves whatever call is pending or live: declines while ringing,
        // ends while calling or in a call. No-op otherwise.
        void HangUp();

        bool JoinRoom(int64_t channelId);
        void LeaveRoom();

        void SetAutoAccept(bool enabled) { m_AutoAccept = enabled; }

        // Returns when stop is set, the duration (0 = unlimited) elapses, or the
        // session becomes invalid.
        void Run(const std::atomic<bool>& stop, int64_t durationMs);

        // One element of a poll_events response.
        void HandleEvent(const json& ev);

        AppState State() const;
        std::string CurrentLogin() const;
        std::string Peer() const;
        const std::string& LastError() const { return m_LastError; }

        ControlClient& Control() { return m_Control; }
        AudioEngine& Audio() { return m_Audio; }

    private:
        bool PollOnce();
        void PushPresence();
        void PrintActivity();
        void StartCallAudio(const std::string& peer);
        void ResetCall();
        void DeclineBusy(const std::string& caller);
        bool Check(const ControlResponse& r, const char* what);

        ClientConfig m_Config;
        ControlClient m_Control;
        AudioEngine m_Audio;

        mutable std::mutex m_Mutex;
        AppState    m_State = AppState::LoggedOut;
        std::string m_Login;
        std::string m_Token;
        std::string m_Peer;
        int64_t     m_RoomId = 0;

        bool m_AutoAccept = false;
        std::string m_LastError;
    };

} // namespace Parley
