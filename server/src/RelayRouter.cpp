#include "RelayRouter.h"
#include "Logger.h"
#include "../../src/shared/Protocol.h"

using asio::ip::udp;

namespace Parley {

    std::string EndpointKey(const udp::endpoint& ep) {
        return ep.address().to_string() + ':' + std::to_string(ep.port());
    }

    RelayRouter::RelayRouter(RelayAuthority& authority, RelaySettings settings)
        : m_Authority(authority)
        , m_Settings(settings)
        , m_RateLimiter(settings.controlRateLimit, settings.controlRateWindowMs) {
    }

    void RelayRouter::Drop(const char* reason, const std::string& detail) {
        const uint64_t n = m_Dropped.fetch_add(1, std::memory_order_relaxed) + 1;
        if (n <= 10 || n % 50 == 0)
            VoiceTrace::log(std::string("step=relay_drop reason=") + reason + " " + detail
                + " total=" + std::to_string(n));
    }

    std::vector<OutboundDatagram> RelayRouter::Handle(const uint8_t* data, size_t len,
        const udp::endpoint& from, int64_t nowMs)
    {
        std::vector<OutboundDatagram> out;
        m_Received.fetch_add(1, std::memory_order_relaxed);

        auto parsed = ParseVoiceDatagram(data, len);
        if (!parsed) {
            m_Malformed.fetch_add(1, std::memory_order_relaxed);
            Drop("malformed", "from=" + EndpointKey(from) + " size=" + std::to_string(len));
            return out;
        }
        const VoiceDatagram& d = *parsed;

        if (d.type == DatagramType::Pong || d.type == DatagramType::Relayed) {
            Drop("unexpected_type", "from=" + EndpointKey(from));
            return out;
        }

        if (d.type != DatagramType::Audio) {
            std::lock_guard lock(m_Mutex);
            const std::string key = EndpointKey(from) + ':' + static_cast<char>(data[0]);
            if (!m_RateLimiter.Allow(key, nowMs)) {
                m_RateLimited.fetch_add(1, std::memory_order_relaxed);
                Drop("rate_limited", "key=" + key);
                return out;
            }
        }

        switch (d.type) {
        case DatagramType::Join:      HandleJoin(d, from, nowMs); break;
        case DatagramType::RoomJoin:  HandleRoomJoin(d, from, nowMs); break;
        case DatagramType::RoomLeave: HandleRoomLeave(d, from); break;
        case DatagramType::Pair:      HandlePair(d, from, nowMs); break;
        case DatagramType::Ping:
            out.push_back({ from, std::make_shared<std::vector<uint8_t>>(BuildPong(d.echo)) });
            break;
        case DatagramType::Audio:     HandleAudio(d, from, nowMs, out); break;
        case DatagramType::Pong:
        case DatagramType::Relayed:
            break;
        }
        return out;
    }

    // ---------------------------------------------------------------------------
    // Endpoint binding
    // ---------------------------------------------------------------------------

    void RelayRouter::HandleJoin(const VoiceDatagram& d, const udp::endpoint& from, int64_t nowMs) {
        if (d.legacy) {
            if (!m_Settings.allowLegacyJoin) {
                Drop("legacy_join_disabled", "user=" + d.login);
                return;
            }
        }
        else {
            auto login = m_Authority.ValidateToken(d.token);
            if (!login || *login != d.login) {
                Drop("join_token_invalid", "user=" + d.login);
                return;
            }
        }

        std::lock_guard lock(m_Mutex);
        BindLocked(d.login, from, nowMs);
        // J| is the call-mode binding; a login still listed in a room would
        // have its private audio fanned out to that room.
        if (m_RoomOf.count(d.login)) {
            VoiceTrace::log("step=relay_room_leave user=" + d.login
                + " room=" + std::to_string(m_RoomOf[d.login]) + " reason=join");
            LeaveRoomLocked(d.login);
        }
        VoiceTrace::log("step=relay_join user=" + d.login + " ep=" + EndpointKey(from)
            + " bindings=" + std::to_string(m_Bindings.size()));
    }

    void RelayRouter::BindLocked(const std::string& login, const udp::endpoint& from, int64_t nowMs) {
        const std::string key = EndpointKey(from);

        auto prevOwner = m_LoginByEndpoint.find(key);
        if (prevOwner != m_LoginByEndpoint.end() && prevOwner->second != login) {
            const std::string evicted = prevOwner->second;
            UnbindLocked(evicted);
        }

        auto it = m_Bindings.find(login);
        if (it != m_Bindings.end()) {
            const std::string oldKey = EndpointKey(it->second.endpoint);
            if (oldKey != key) m_LoginByEndpoint.erase(oldKey);
        }

        m_Bindings[login] = Binding{ from, nowMs };
        m_LoginByEndpoint[key] = login;
    }

    bool RelayRouter::IsBoundLocked(const std::string& login, const udp::endpoint& from) const {
        auto it = m_LoginByEndpoint.find(EndpointKey(from));
        return it != m_LoginByEndpoint.end() && it->second == login && m_Bindings.count(login) > 0;
    }

    void RelayRouter::UnbindLocked(const std::string& login) {
        auto it = m_Bindings.find(login);
        if (it != m_Bindings.end()) {
            auto rit = m_LoginByEndpoint.find(EndpointKey(it->second.endpoint));
            if (rit != m_LoginByEndpoint.end() && rit->second == login) m_LoginByEndpoint.erase(rit);
            m_Bindings.erase(it);
        }
        LeaveRoomLocked(login);
        ClearPairLocked(login);
    }

    // ---------------------------------------------------------------------------
    // Rooms
    // ---------------------------------------------------------------------------

    void RelayRouter::HandleRoomJoin(const VoiceDatagram& d, const udp::endpoint& from, int64_t nowMs) {
        const char* reason = nullptr;
        auto login = m_Authority.ValidateToken(d.token);
        if (!login || *login != d.login)
            reason = "room_token_invalid";
        else if (!m_Authority.CanJoinVoice(d.login, d.roomId))
            reason = "room_acl";

        std::lock_guard lock(m_Mutex);
        if (reason) {
            Drop(reason, "user=" + d.login + " room=" + std::to_string(d.roomId));
            // A logged-out or demoted member renewing from its own endpoint
            // loses the room at once instead of waiting for the lease.
            if (IsBoundLocked(d.login, from) && m_RoomOf.count(d.login)) {
                LeaveRoomLocked(d.login);
                VoiceTrace::log("step=relay_room_leave user=" + d.login
                    + " room=" + std::to_string(d.roomId) + " reason=" + reason);
            }
            return;
        }

        BindLocked(d.login, from, nowMs);
        m_RoomRenewMs[d.login] = nowMs;
        auto cur = m_RoomOf.find(d.login);
        if (cur != m_RoomOf.end() && cur->second == d.roomId) return;
        LeaveRoomLocked(d.login);
        m_Rooms[d.roomId].insert(d.login);
        m_RoomOf[d.login] = d.roomId;
        m_RoomRenewMs[d.login] = nowMs;
        VoiceTrace::log("step=relay_room_join user=" + d.login + " room=" + std::to_string(d.roomId)
            + " members=" + std::to_string(m_Rooms[d.roomId].size()));
    }

    void RelayRouter::HandleRoomLeave(const VoiceDatagram& d, const udp::endpoint& from) {
        std::lock_guard lock(m_Mutex);
        if (!IsBoundLocked(d.login, from)) {
            Drop("room_leave_unbound", "user=" + d.login);
            return;
        }
        auto cur = m_RoomOf.find(d.login);
        if (cur == m_RoomOf.end() || cur->second != d.roomId) return;
        LeaveRoomLocked(d.login);
        VoiceTrace::log("step=relay_room_leave user=" + d.login + " room=" + std::to_string(d.roomId));
    }

    bool RelayRouter::RoomLeaseLapsedLocked(const std::string& login, int64_t nowMs) const {
        auto it = m_RoomRenewMs.find(login);
        return it == m_RoomRenewMs.end() || nowMs - it->second > m_Settings.roomTtlMs;
    }

    void RelayRouter::LeaveRoomLocked(const std::string& login) {
        m_RoomRenewMs.erase(login);
        auto cur = m_RoomOf.find(login);
        if (cur == m_RoomOf.end()) return;
        auto rit = m_Rooms.find(cur->second);
        if (rit != m_Rooms.end()) {
            rit->second.erase(login);
            if (rit->second.empty()) m_Rooms.erase(rit);
        }
        m_RoomOf.erase(cur);
    }

    // ---------------------------------------------------------------------------
    // Private pairing
    // ---------------------------------------------------------------------------

    void RelayRouter::HandlePair(const VoiceDatagram& d, const udp::endpoint& from, int64_t nowMs) {
        std::string sender;
        if (d.legacy) {
            if (!m_Settings.allowLegacyPairing) {
                Drop("legacy_pair_disabled", "a=" + d.userA + " b=" + d.userB);
                return;
            }
            std::lock_guard lock(m_Mutex);
            auto it = m_LoginByEndpoint.find(EndpointKey(from));
            if (it == m_LoginByEndpoint.end()) {
                Drop("pair_unbound", "ep=" + EndpointKey(from));
                return;
            }
            sender = it->second;
        }
        else {
            auto login = m_Authority.ValidateToken(d.token);
            if (!login || *login != d.login) {
                Drop("pair_token_invalid", "user=" + d.login);
                std::lock_guard lock(m_Mutex);
                if ((d.login == d.userA || d.login == d.userB) && IsBoundLocked(d.login, from))
                    ClearPairOfLocked(d.userA, d.userB);
                return;
            }
            sender = d.login;
        }

        if (sender != d.userA && sender != d.userB) {
            Drop("pair_not_party", "sender=" + sender);
            return;
        }

        const char* reason = nullptr;
        if (d.pairOn) {
            // Re-checked on every S| datagram; see DESIGN.md on caching.
            if (!m_Authority.AreFriends(d.userA, d.userB))
                reason = "pair_not_friends";
            else if (!m_Authority.HasActiveCall(d.userA, d.userB))
                reason = "pair_no_call";
        }

        std::lock_guard lock(m_Mutex);
        if (!IsBoundLocked(sender, from)) {
            Drop("pair_unbound", "sender=" + sender);
            return;
        }
        if (reason) {
            Drop(reason, "a=" + d.userA + " b=" + d.userB);
            ClearPairOfLocked(d.userA, d.userB);
            return;
        }
        m_Bindings[sender].lastSeenMs = nowMs;
        if (d.pairOn) {
            ClearPairLocked(d.userA);
            ClearPairLocked(d.userB);
            LeaveRoomLocked(d.userA);
            LeaveRoomLocked(d.userB);
            m_Pairs[d.userA] = d.userB;
            m_Pairs[d.userB] = d.userA;
            VoiceTrace::log("step=relay_pair_set a=" + d.userA + " b=" + d.userB);
        }
        else {
            ClearPairOfLocked(d.userA, d.userB);
        }
    }

    void RelayRouter::ClearPairOfLocked(const std::string& a, const std::string& b) {
        auto it = m_Pairs.find(a);
        if (it == m_Pairs.end() || it->second != b) return;
        ClearPairLocked(a);
        VoiceTrace::log("step=relay_pair_clear a=" + a + " b=" + b);
    }

    void RelayRouter::ClearPairLocked(const std::string& login) {
        auto it = m_Pairs.find(login);
        if (it == m_Pairs.end()) return;
        const std::string peer = it->second;
        m_Pairs.erase(it);
        auto pit = m_Pairs.find(peer);
        if (pit != m_Pairs.end() && pit->second == login) m_Pairs.erase(pit);
    }

    // ---------------------------------------------------------------------------
    // Audio forwarding
    // ---------------------------------------------------------------------------

    void RelayRouter::HandleAudio(const VoiceDatagram& d, const udp::endpoint& from, int64_t nowMs,
        std::vector<OutboundDatagram>& out)
    {
        std::lock_guard lock(m_Mutex);
        if (!IsBoundLocked(d.login, from)) {
            Drop("endpoint_mismatch", "user=" + d.login + " ep=" + EndpointKey(from));
            return;
        }
        m_Bindings[d.login].lastSeenMs = nowMs;

        auto relayed = std::make_shared<std::vector<uint8_t>>(
            BuildRelayed(d.login, d.pcm.data(), d.pcm.size()));

        if (m_RoomOf.count(d.login) && RoomLeaseLapsedLocked(d.login, nowMs)) {
            VoiceTrace::log("step=relay_room_leave user=" + d.login
                + " room=" + std::to_string(m_RoomOf[d.login]) + " reason=lease");
            LeaveRoomLocked(d.login);
        }

        auto room = m_RoomOf.find(d.login);
        if (room != m_RoomOf.end()) {
            auto rit = m_Rooms.find(room->second);
            if (rit == m_Rooms.end()) return;
            for (const auto& member : rit->second) {
                if (member == d.login || RoomLeaseLapsedLocked(member, nowMs)) continue;
                auto bit = m_Bindings.find(member);
                if (bit == m_Bindings.end()) continue;
                out.push_back({ bit->second.endpoint, relayed });
            }
        }
        else {
            auto pit = m_Pairs.find(d.login);
            if (pit == m_Pairs.end()) {
                Drop("no_route", "user=" + d.login);
                return;
            }
            auto bit = m_Bindings.find(pit->second);
            if (bit == m_Bindings.end()) {
                Drop("peer_unbound", "user=" + d.login + " peer=" + pit->second);
                return;
            }
            out.push_back({ bit->second.endpoint, relayed });
        }
        m_Forwarded.fetch_add(out.size(), std::memory_order_relaxed);
    }

    // ---------------------------------------------------------------------------
    // Sweep
    // ---------------------------------------------------------------------------

    size_t RelayRouter::Sweep(int64_t nowMs) {
        std::vector<std::string> dead;
        std::vector<std::string> lapsed;
        {
            std::lock_guard lock(m_Mutex);
            const int64_t cutoff = nowMs - m_Settings.endpointTtlMs;
            for (const auto& [login, binding] : m_Bindings)
                if (binding.lastSeenMs < cutoff) dead.push_back(login);
            for (const auto& login : dead) UnbindLocked(login);
            for (const auto& member : m_RoomOf)
                if (RoomLeaseLapsedLocked(member.first, nowMs)) lapsed.push_back(member.first);
            for (const auto& login : lapsed) LeaveRoomLocked(login);
            m_RateLimiter.Sweep(nowMs);
        }
        for (const auto& login : dead)
            VoiceTrace::log("step=relay_evict user=" + login + " reason=silent");
        for (const auto& login : lapsed)
            VoiceTrace::log("step=relay_room_leave user=" + login + " reason=lease");
        return dead.size() + lapsed.size();
    }

    // ---------------------------------------------------------------------------
    // Introspection
    // ---------------------------------------------------------------------------

    std::optional<udp::endpoint> RelayRouter::EndpointOf(const std::string& login) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_Bindings.find(login);
        if (it == m_Bindings.end()) return std::nullopt;
        return it->second.endpoint;
    }

    std::optional<std::string> RelayRouter::PeerOf(const std::string& login) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_Pairs.find(login);
        if (it == m_Pairs.end()) return std::nullopt;
        return it->second;
    }

    std::optional<int64_t> RelayRouter::RoomOf(const std::string& login) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_RoomOf.find(login);
        if (it == m_RoomOf.end()) return std::nullopt;
        return it->second;
    }

    size_t RelayRouter::RoomSize(int64_t roomId) const {
        std::lock_guard lock(m_Mutex);
        auto it = m_Rooms.find(roomId);
        return it == m_Rooms.end() ? 0 : it->second.size();
    }

    size_t RelayRouter::BindingCount() const {
        std::lock_guard lock(m_Mutex);
        return m_Bindings.size();
    }

    RelayStats RelayRouter::Stats() const {
        RelayStats s;
        s.received = m_Received.load(std::memory_order_relaxed);
        s.forwarded = m_Forwarded.load(std::memory_order_relaxed);
        s.dropped = m_Dropped.load(std::memory_order_relaxed);
        s.malformed = m_Malformed.load(std::memory_order_relaxed);
        s.rateLimited = m_RateLimited.load(std::memory_order_relaxed);
        return s;
    }

} // namespace Parley
