#pragma once
#include <string>
#include <fstream>
#include <mutex>

namespace Parley {

    // key=value trace of relay and signaling decisions ("step=... reason=...").
    // Off unless PARLEY_VOICE_TRACE=1 or the config enables it.
    struct VoiceTrace {
        static void init(const std::string& path = "voice_trace.log", bool forceEnable = false);
        static void log(const std::string& msg);
        static bool enabled() { return s_enabled; }

    private:
        static std::ofstream s_file;
        static std::mutex s_mutex;
        static bool s_enabled;
    };

} // namespace Parley
