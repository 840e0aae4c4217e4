#pragma once
#include "RateLimiter.h"
#include "ServerConfig.h"
#include "../../src/shared/VoiceDatagram.h"
#include <asio.hpp>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace Parley {

    // Authoritative answers the relay needs from the control plane.
    class RelayAuthority {
    public:
        virtual ~RelayAuthority() = default;

        // Login of a live session, nullopt otherwise.
        virtual std::optional<std::string> ValidateToken(const std::string& token) = 0;
        virtual bool AreFriends(const std::string& a, const std::string& b) = 0;
        virtual bool HasActiveCall(const std::string& a, const std::string& b) = 0;
        virtual bool CanJoinVoice(const std::string& login, int64_t roomId) = 0;
    };

    struct OutboundDatagram {
        asio::ip::udp::endpoint               to;
        std::shared_ptr<std::vector<uint8_t>> data;
    };

    struct RelayStats {
        uint64_t received = 0;
        uint64_t forwarded = 0;
        uint64_t dropped = 0;
        uint64_t malformed = 0;
        uint64_t rateLimited = 0;
    };

    // ---------------------------------------------------------------------------
    // Routing core of the UDP relay. Owns the endpoint, pair and room tables and
    // turns one inbound datagram into zero or more outbound ones; the socket side
    // lives in ParleyServer. All tables are guarded by m_Mutex, and authority
    // queries run with the lock released.
    // ---------------------------------------------------------------------------
    class RelayRouter {
    public:
        RelayRouter(RelayAuthority& authority, RelaySettings settings);

        std::vector<OutboundDatagram> Handle(const uint8_t* data, size_t len,
            const asio::ip::udp::endpoint& from, int64_t nowMs);

        // Evicts endpoints silent for longer than endpointTtlMs together with their
        // room and pair entries, and room members whose C| lease lapsed. Returns
        // the number of evicted logins.
        size_t Sweep(int64_t nowMs);

        std::optional<asio::ip::udp::endpoint> EndpointOf(const std::string& login) const;
        std::optional<std::string> PeerOf(const std::string& login) const;
        std::optional<int64_t> RoomOf(const std::string& login) const;
        size_t RoomSize(int64_t roomId) const;
        size_t BindingCount() const;
        RelayStats Stats() const;

    private:
        struct Binding {
            asio::ip::udp::endpoint endpoint;
            int64_t                 lastSeenMs = 0;
        };

        void HandleJoin(const VoiceDatagram& d, const asio::ip::udp::endpoint& from, int64_t nowMs);
        void HandleRoomJoin(const VoiceDatagram& d, const asio::ip::udp::endpoint& from, int64_t nowMs);
        void HandleRoomLeave(const VoiceDatagram& d, const asio::ip::udp::endpoint& from);
        void HandlePair(const VoiceDatagram& d, const asio::ip::udp::endpoint& from, int64_t nowMs);
        void HandleAudio(const VoiceDatagram& d, const asio::ip::udp::endpoint& from, int64_t nowMs,
            std::vector<OutboundDatagram>& out);

        // Caller holds m_Mutex.
        void BindLocked(const std::string& login, const asio::ip::udp::endpoint& from, int64_t nowMs);
        bool IsBoundLocked(const std::string& login, const asio::ip::udp::endpoint& from) const;
        bool RoomLeaseLapsedLocked(const std::string& login, int64_t nowMs) const;
        void LeaveRoomLocked(const std::string& login);
        void ClearPairLocked(const std::string& login);
        void ClearPairOfLocked(const std::string& a, const std::string& b);
        void UnbindLocked(const std::string& login);

        void Drop(const char* reason, const std::string& detail);

        RelayAuthority& m_Authority;
        RelaySettings m_Settings;

        mutable std::mutex m_Mutex;
        std::unordered_map<std::string, Binding> m_Bindings;              // login -> endpoint
        std::unordered_map<std::string, std::string> m_LoginByEndpoint;    // "ip:port" -> login
        std::unordered_map<std::string, std::string> m_Pairs;              // symmetric
        std::unordered_map<int64_t, std::set<std::string>> m_Rooms;
        std::unordered_map<std::string, int64_t> m_RoomOf;
        std::unordered_map<std::string, int64_t> m_RoomRenewMs;            // last accepted C|
        RateLimiter m_RateLimiter;

        std::atomic<uint64_t> m_Received{ 0 };
        std::atomic<uint64_t> m_Forwarded{ 0 };
        std::atomic<uint64_t> m_Dropped{ 0 };
        std::atomic<uint64_t> m_Malformed{ 0 };
        std::atomic<uint64_t> m_RateLimited{ 0 };
    };

    std::string EndpointKey(const asio::ip::udp::endpoint& ep);

} // namespace Parley
