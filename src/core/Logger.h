#pragma once
#include <fstream>
#include <sstream>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <iomanip>
#include <string>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <cstdio>
#include <thread>
#include <atomic>
#include <array>
#include <cstdint>

namespace Parley {

    static constexpr size_t kVoiceTraceBufSize = 256;
    static constexpr size_t kVoiceTraceQueueSize = 2048;

    class Logger {
    public:
        static Logger& Instance() {
            static Logger instance;
            return instance;
        }

        bool Initialize(const std::string& filePath) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            m_File.open(filePath, std::ios::app);
            return m_File.is_open();
        }

        void Log(const std::string& prefix, const std::string& message) {
            Log(prefix, message.c_str());
        }

        /// Overload for hot paths: no heap. Caller passes a pre-formatted buffer.
        void Log(const std::string& prefix, const char* message) {
            std::lock_guard<std::mutex> lock(m_Mutex);
            if (!m_File.is_open() || !message) return;
            char timeBuf[48];
            FormatNow(timeBuf, sizeof(timeBuf));
            m_File << timeBuf << " [" << prefix << "] " << message << "\n";
            m_File.flush();
        }

        /// Starts the async trace writer. Enabled by the override or PARLEY_VOICE_TRACE=1.
        bool InitializeVoiceTrace(const std::string& filePath, bool enableOverride = false) {
            bool enable = enableOverride;
            if (!enable) {
                const char* env = std::getenv("PARLEY_VOICE_TRACE");
                enable = (env && (env[0] == '1' || env[0] == 'y' || env[0] == 'Y'));
            }
            if (!enable) return false;
            if (m_VoiceTraceThread.joinable()) return true;
            {
                std::lock_guard<std::mutex> lock(m_VoiceTraceMutex);
                m_VoiceTraceFile.open(filePath, std::ios::out | std::ios::trunc);
                if (!m_VoiceTraceFile.is_open()) return false;
            }
            m_VoiceTraceStop.store(false);
            m_VoiceTraceThread = std::thread(&Logger::VoiceTraceWorker, this);
            return true;
        }

        /// Async: copies into a fixed slot. Safe from any thread; oldest line is lost when full.
        void LogVoiceTraceBuf(const char* buf) {
            if (!buf) return;
            std::lock_guard<std::mutex> lock(m_VoiceTraceQueueMutex);
            EnqueueLocked(buf);
        }

        /// Audio callback variant: enqueues only if the queue lock is free.
        /// Returns false when the line was dropped.
        bool LogVoiceTraceBufNonBlocking(const char* buf) {
            if (!buf) return false;
            std::unique_lock<std::mutex> lock(m_VoiceTraceQueueMutex, std::try_to_lock);
            if (!lock.owns_lock()) return false;
            EnqueueLocked(buf);
            return true;
        }

        /// One line per quality snapshot, appended to the stats log if it was opened.
        bool InitializeStatsLog(const std::string& filePath) {
            std::lock_guard<std::mutex> lock(m_StatsMutex);
            m_StatsFile.open(filePath, std::ios::app);
            return m_StatsFile.is_open();
        }

        void LogQualityStats(const std::string& target, int score, const char* label,
            double jitterMs, double lossPct, double latencyMs, uint64_t underflows, uint64_t overflows) {
            std::lock_guard<std::mutex> lock(m_StatsMutex);
            if (!m_StatsFile.is_open()) return;
            char timeBuf[48];
            FormatNow(timeBuf, sizeof(timeBuf));
            std::stringstream ss;
            ss << timeBuf << " | target=" << target << " | score=" << score << " (" << label << ")"
               << std::fixed << std::setprecision(1)
               << " | jitter_ms=" << jitterMs << " loss%=" << lossPct << " latency_ms=" << latencyMs
               << " | underflow=" << underflows << " overflow=" << overflows << "\n";
            m_StatsFile << ss.str();
            m_StatsFile.flush();
        }

        void Shutdown() {
            if (m_ShutdownDone) return;
            m_ShutdownDone = true;
            {
                std::lock_guard<std::mutex> lock(m_Mutex);
                if (m_File.is_open()) m_File.close();
            }
            {
                std::lock_guard<std::mutex> lock(m_StatsMutex);
                if (m_StatsFile.is_open()) m_StatsFile.close();
            }
            m_VoiceTraceStop.store(true);
            m_VoiceTraceCond.notify_all();
            if (m_VoiceTraceThread.joinable()) m_VoiceTraceThread.join();
            {
                std::lock_guard<std::mutex> l2(m_VoiceTraceMutex);
                if (m_VoiceTraceFile.is_open()) m_VoiceTraceFile.close();
            }
        }

    private:
        Logger() = default;
        ~Logger() { Shutdown(); }

        static void FormatNow(char* out, size_t size) {
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            struct tm localTime;
            localtime_r(&t, &localTime);
            char timeBuf[32];
            std::strftime(timeBuf, sizeof(timeBuf), "%H:%M:%S", &localTime);
            std::snprintf(out, size, "%s.%03d", timeBuf, static_cast<int>(ms.count()));
        }

        // Caller holds m_VoiceTraceQueueMutex.
        void EnqueueLocked(const char* buf) {
            size_t w = m_VoiceTraceWriteIdx.load(std::memory_order_relaxed);
            std::snprintf(m_VoiceTraceQueue[w].data(), kVoiceTraceBufSize, "%.255s", buf);
            m_VoiceTraceWriteIdx.store((w + 1) % kVoiceTraceQueueSize, std::memory_order_release);
            if ((w + 1) % kVoiceTraceQueueSize == m_VoiceTraceReadIdx) {
                m_VoiceTraceReadIdx = (m_VoiceTraceReadIdx + 1) % kVoiceTraceQueueSize;
            }
            m_VoiceTraceCond.notify_one();
        }

        void VoiceTraceWorker() {
            std::unique_lock<std::mutex> lock(m_VoiceTraceQueueMutex);
            while (!m_VoiceTraceStop.load(std::memory_order_acquire)) {
                m_VoiceTraceCond.wait_for(lock, std::chrono::milliseconds(100), [this] {
                    return m_VoiceTraceStop.load(std::memory_order_acquire) ||
                           m_VoiceTraceReadIdx != m_VoiceTraceWriteIdx.load(std::memory_order_acquire);
                });
                while (m_VoiceTraceReadIdx != m_VoiceTraceWriteIdx.load(std::memory_order_acquire)) {
                    char timeBuf[48];
                    FormatNow(timeBuf, sizeof(timeBuf));
                    char line[kVoiceTraceBufSize + 64];
                    std::snprintf(line, sizeof(line), "%s [TRACE] %s\n", timeBuf, m_VoiceTraceQueue[m_VoiceTraceReadIdx].data());
                    m_VoiceTraceReadIdx = (m_VoiceTraceReadIdx + 1) % kVoiceTraceQueueSize;
                    lock.unlock();
                    {
                        std::lock_guard<std::mutex> fl(m_VoiceTraceMutex);
                        if (m_VoiceTraceFile.is_open()) m_VoiceTraceFile << line;
                    }
                    lock.lock();
                }
            }
            std::lock_guard<std::mutex> fl(m_VoiceTraceMutex);
            if (m_VoiceTraceFile.is_open()) m_VoiceTraceFile.flush();
        }

        std::mutex m_Mutex;
        std::ofstream m_File;
        std::mutex m_StatsMutex;
        std::ofstream m_StatsFile;
        std::mutex m_VoiceTraceMutex;
        std::ofstream m_VoiceTraceFile;

        std::array<std::array<char, kVoiceTraceBufSize>, kVoiceTraceQueueSize> m_VoiceTraceQueue{};
        size_t m_VoiceTraceReadIdx = 0;
        std::atomic<size_t> m_VoiceTraceWriteIdx{0};
        std::mutex m_VoiceTraceQueueMutex;
        std::condition_variable m_VoiceTraceCond;
        std::atomic<bool> m_VoiceTraceStop{false};
        std::thread m_VoiceTraceThread;
        bool m_ShutdownDone = false;  // ~Logger() at exit must not close twice
    };

    #define LOG_INFO(msg)       Parley::Logger::Instance().Log("INFO", msg)
    #define LOG_ERROR(msg)      Parley::Logger::Instance().Log("ERROR", msg)
    #define LOG_AUDIO(msg)      Parley::Logger::Instance().Log("AudioEngine", msg)
    #define LOG_NETWORK(msg)    Parley::Logger::Instance().Log("Network", msg)
    #define LOG_APP(msg)        Parley::Logger::Instance().Log("App", msg)
}
