#pragma once
#include "ServerConfig.h"
#include "../../src/shared/Clock.h"
#include <nlohmann/json.hpp>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace Parley {

    struct Event {
        std::string    type;
        nlohmann::json payload;
        int64_t        ts = 0;

        // Flat wire form: {"type": ..., "ts": ..., <payload fields>}
        nlohmann::json ToJson() const;
    };

    // Per-login bounded queue, delivered once by Drain(). No acknowledgement.
    class EventOutbox {
    public:
        EventOutbox(const Clock& clock, EventSettings settings);

        void Push(const std::string& login, std::string type, nlohmann::json payload);
        std::vector<Event> Drain(const std::string& login);
        size_t Pending(const std::string& login);

    private:
        const Clock& m_Clock;
        EventSettings m_Settings;

        std::mutex m_Mutex;
        std::unordered_map<std::string, std::deque<Event>> m_Queues;
    };

} // namespace Parley
