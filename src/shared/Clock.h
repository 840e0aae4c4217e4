#pragma once
#include <chrono>
#include <cstdint>

namespace Parley {

    // Millisecond time source shared by the server state services and the
    // client estimators. Tests drive a manual implementation.
    class Clock {
    public:
        virtual ~Clock() = default;
        virtual int64_t NowMs() const = 0;
    };

    // Wall clock, epoch milliseconds. Used where timestamps are persisted.
    class SystemClock final : public Clock {
    public:
        static SystemClock& Instance() {
            static SystemClock clock;
            return clock;
        }

        int64_t NowMs() const override {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    };

    // Monotonic clock for in-memory timeouts.
    class SteadyClock final : public Clock {
    public:
        static SteadyClock& Instance() {
            static SteadyClock clock;
            return clock;
        }

        int64_t NowMs() const override {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now().time_since_epoch()).count();
        }
    };

} // namespace Parley
