#include "Application.h"
#include "../core/ConfigManager.h"
#include "../core/Logger.h"
#include "../../Version.h"
#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <vector>

namespace {
    std::atomic<bool> g_Stop{ false };
    std::terminate_handler g_prevTerminate = nullptr;

    void OnSignal(int) {
        g_Stop.store(true);
    }

    // Leaves a trace that std::terminate() ran before handing over to the default.
    void ParleyTerminateHandler() {
        std::fputs("parley-client: std::terminate() called\n", stderr);
        Parley::Logger::Instance().Log("ERROR", "std::terminate() called");
        if (g_prevTerminate) g_prevTerminate();
        else std::abort();
    }

    void PrintUsage() {
        std::fputs(
            "usage: parley-client [options] <command> [args]\n"
            "\n"
            "commands:\n"
            "  register <login> <password> <nickname>\n"
            "  login <login> <password>       store a session token\n"
            "  logout\n"
            "  status\n"
            "  call <login>                   call a friend and stay in the call\n"
            "  listen                         wait for events (use --auto-accept for calls)\n"
            "  room <channel_id>              join channel voice\n"
            "  participants <channel_id>\n"
            "\n"
            "options:\n"
            "  --config <path>    client config file\n"
            "  --duration <sec>   leave after this many seconds\n"
            "  --auto-accept      accept incoming calls\n"
            "  --no-mic           do not transmit captured audio\n"
            "  --no-sound         do not play received audio\n"
            "  --version\n", stdout);
    }

    bool ParseInt64(const std::string& s, int64_t& out) {
        if (s.empty()) return false;
        char* end = nullptr;
        const long long v = std::strtoll(s.c_str(), &end, 10);
        if (!end || *end != '\0') return false;
        out = v;
        return true;
    }
}

int main(int argc, char* argv[]) {
    g_prevTerminate = std::set_terminate(ParleyTerminateHandler);

    std::string configPath;
    int64_t durationSec = 0;
    bool autoAccept = false, noMic = false, noSound = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--version") {
            std::printf("Parley Client %s\n", PARLEY_VERSION_STRING);
            return 0;
        }
        else if (a == "--help" || a == "-h") {
            PrintUsage();
            return 0;
        }
        else if (a == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (a == "--duration" && i + 1 < argc) {
            if (!ParseInt64(argv[++i], durationSec) || durationSec < 0) {
                std::fprintf(stderr, "invalid --duration\n");
                return 2;
            }
        }
        else if (a == "--auto-accept") autoAccept = true;
        else if (a == "--no-mic") noMic = true;
        else if (a == "--no-sound") noSound = true;
        else args.push_back(a);
    }
    if (args.empty()) {
        PrintUsage();
        return 2;
    }

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    try {
        Parley::ClientConfig config = Parley::ConfigManager::Get().Load(configPath);
        if (noMic) config.audio.micEnabled = false;
        if (noSound) config.audio.soundEnabled = false;

        auto& logger = Parley::Logger::Instance();
        logger.Initialize(config.logPath);
        logger.InitializeVoiceTrace(config.voiceTracePath, config.voiceTrace);
        if (!config.statsLogPath.empty()) logger.InitializeStatsLog(config.statsLogPath);
        LOG_INFO(std::string("Parley Client ") + PARLEY_VERSION_STRING + " starting");

        Parley::Application app(config);
        app.SetAutoAccept(autoAccept);

        const std::string& cmd = args[0];
        const int64_t durationMs = durationSec * 1000;
        int rc = 0;

        if (cmd == "register" && args.size() == 4) {
            rc = app.Register(args[1], args[2], args[3]) ? 0 : 1;
        }
        else if (cmd == "login" && args.size() == 3) {
            rc = app.Login(args[1], args[2]) ? 0 : 1;
            if (rc == 0) std::printf("logged in as %s\n", app.CurrentLogin().c_str());
        }
        else if (cmd == "logout" && args.size() == 1) {
            if (app.ResumeSession()) app.Logout();
            else Parley::ConfigManager::Get().ClearSession();
        }
        else if (cmd == "status" && args.size() == 1) {
            rc = app.ResumeSession() ? 0 : 1;
            std::printf("%s\n", rc == 0 ? ("online as " + app.CurrentLogin()).c_str() : "not logged in");
        }
        else if (cmd == "call" && args.size() == 2) {
            if (!app.ResumeSession() || !app.CallUser(args[1])) rc = 1;
            else {
                app.Run(g_Stop, durationMs);
                app.HangUp();
            }
        }
        else if (cmd == "listen" && args.size() == 1) {
            if (!app.ResumeSession()) rc = 1;
            else {
                app.Run(g_Stop, durationMs);
                app.HangUp();
            }
        }
        else if (cmd == "room" && args.size() == 2) {
            int64_t channelId = 0;
            if (!ParseInt64(args[1], channelId) || channelId <= 0) {
                std::fprintf(stderr, "invalid channel id\n");
                rc = 2;
            }
            else if (!app.ResumeSession() || !app.JoinRoom(channelId)) rc = 1;
            else {
                app.Run(g_Stop, durationMs);
                app.LeaveRoom();
            }
        }
        else if (cmd == "participants" && args.size() == 2) {
            int64_t channelId = 0;
            if (!ParseInt64(args[1], channelId) || !app.ResumeSession()) rc = 1;
            else {
                const Parley::StoredSession s = Parley::ConfigManager::Get().LoadSession();
                auto r = app.Control().Call("get_channel_voice_participants",
                    Parley::json{ { "channel_id", channelId } }, s.token);
                if (!r.Ok()) {
                    std::fprintf(stderr, "%s\n", r.result.message.c_str());
                    rc = 1;
                }
                else {
                    std::printf("%s\n", r.body.value("participants", Parley::json::array()).dump(2).c_str());
                }
            }
        }
        else {
            PrintUsage();
            rc = 2;
        }

        if (rc == 1 && !app.LastError().empty())
            std::fprintf(stderr, "error: %s\n", app.LastError().c_str());
        LOG_APP("exiting with " + std::to_string(rc));
        logger.Shutdown();
        return rc;
    }
    catch (const std::exception& e) {
        std::fprintf(stderr, "parley-client: %s\n", e.what());
        return 1;
    }
}
