#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>

namespace Parley {

    // Sliding-window counter per key. Not synchronized: the relay calls it under
    // its own lock.
    class RateLimiter {
    public:
        RateLimiter(int limit, int64_t windowMs);

        bool Allow(const std::string& key, int64_t nowMs);

        // Drops keys with no hit inside the window. Returns how many were dropped.
        size_t Sweep(int64_t nowMs);
        size_t Size() const { return m_Hits.size(); }

    private:
        int m_Limit;
        int64_t m_WindowMs;
        std::unordered_map<std::string, std::deque<int64_t>> m_Hits;
    };

} // namespace Parley
