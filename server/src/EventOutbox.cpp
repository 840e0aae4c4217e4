#include "EventOutbox.h"

namespace Parley {

    nlohmann::json Event::ToJson() const {
        nlohmann::json j = payload.is_object() ? payload : nlohmann::json::object();
        j["type"] = type;
        j["ts"] = ts;
        return j;
    }

    EventOutbox::EventOutbox(const Clock& clock, EventSettings settings)
        : m_Clock(clock), m_Settings(settings) {
    }

    void EventOutbox::Push(const std::string& login, std::string type, nlohmann::json payload) {
        if (login.empty()) return;
        Event ev{ std::move(type), std::move(payload), m_Clock.NowMs() };
        std::lock_guard lock(m_Mutex);
        auto& q = m_Queues[login];
        q.push_back(std::move(ev));
        while (q.size() > m_Settings.maxPerUser) q.pop_front();
    }

    std::vector<Event> EventOutbox::Drain(const std::string& login) {
        std::vector<Event> out;
        if (login.empty()) return out;
        const int64_t nowMs = m_Clock.NowMs();
        std::lock_guard lock(m_Mutex);
        auto it = m_Queues.find(login);
        if (it == m_Queues.end()) return out;
        out.reserve(it->second.size());
        for (auto& ev : it->second)
            if (nowMs - ev.ts <= m_Settings.ttlMs) out.push_back(std::move(ev));
        m_Queues.erase(it);
        return out;
    }

    size_t EventOutbox::Pending(const std::string& login) {
        std::lock_guard lock(m_Mutex);
        auto it = m_Queues.find(login);
        return it == m_Queues.end() ? 0 : it->second.size();
    }

} // namespace Parley
