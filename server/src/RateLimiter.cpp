#include "RateLimiter.h"

namespace Parley {

    RateLimiter::RateLimiter(int limit, int64_t windowMs)
        : m_Limit(limit), m_WindowMs(windowMs) {
    }

    bool RateLimiter::Allow(const std::string& key, int64_t nowMs) {
        auto& hits = m_Hits[key];
        while (!hits.empty() && nowMs - hits.front() >= m_WindowMs) hits.pop_front();
        if (static_cast<int>(hits.size()) >= m_Limit) return false;
        hits.push_back(nowMs);
        return true;
    }

    size_t RateLimiter::Sweep(int64_t nowMs) {
        size_t dropped = 0;
        for (auto it = m_Hits.begin(); it != m_Hits.end(); ) {
            if (it->second.empty() || nowMs - it->second.back() >= m_WindowMs) {
                it = m_Hits.erase(it);
                ++dropped;
            }
            else {
                ++it;
            }
        }
        return dropped;
    }

} // namespace Parley
