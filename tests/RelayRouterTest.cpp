#include <gtest/gtest.h>
#include "../server/src/RelayRouter.h"
#include <map>
#include <set>
#include <string>

using namespace Parley;
using asio::ip::udp;

namespace {

    class FakeAuthority : public RelayAuthority {
    public:
        std::optional<std::string> ValidateToken(const std::string& token) override {
            ++validations;
            auto it = tokens.find(token);
            if (it == tokens.end()) return std::nullopt;
            return it->second;
        }
        bool AreFriends(const std::string& a, const std::string& b) override {
            return friends.count(Key(a, b)) > 0;
        }
        bool HasActiveCall(const std::string& a, const std::string& b) override {
            return calls.count(Key(a, b)) > 0;
        }
        bool CanJoinVoice(const std::string& login, int64_t roomId) override {
            return roomAcl.count({ login, roomId }) > 0;
        }

        static std::pair<std::string, std::string> Key(const std::string& a, const std::string& b) {
            return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
        }

        std::map<std::string, std::string> tokens;
        std::set<std::pair<std::string, std::string>> friends;
        std::set<std::pair<std::string, std::string>> calls;
        std::set<std::pair<std::string, int64_t>> roomAcl;
        int validations = 0;
    };

    udp::endpoint Ep(uint16_t port) {
        return udp::endpoint(asio::ip::make_address("10.0.0.1"), port);
    }

} // namespace

class RelayRouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auth.tokens = { { "ta", "alice" }, { "tb", "bob" }, { "tc", "carol" } };
        auth.friends.insert(FakeAuthority::Key("alice", "bob"));
        auth.calls.insert(FakeAuthority::Key("alice", "bob"));
        auth.roomAcl = { { "alice", 7 }, { "bob", 7 }, { "carol", 7 } };
        settings.controlRateLimit = 1000;
        router = std::make_unique<RelayRouter>(auth, settings);
    }

    std::vector<OutboundDatagram> Send(const std::vector<uint8_t>& d, const udp::endpoint& from) {
        return router->Handle(d.data(), d.size(), from, now);
    }

    std::vector<OutboundDatagram> Send(const std::string& s, const udp::endpoint& from) {
        return router->Handle(reinterpret_cast<const uint8_t*>(s.data()), s.size(), from, now);
    }

    std::vector<OutboundDatagram> Audio(const std::string& login, const udp::endpoint& from) {
        const uint8_t pcm[4] = { 1, 2, 3, 4 };
        return Send(BuildAudio(login, pcm, sizeof(pcm)), from);
    }

    void PairAliceBob() {
        Send(BuildJoin("alice", "ta"), Ep(1000));
        Send(BuildJoin("bob", "tb"), Ep(2000));
        Send(BuildPair("alice", "ta", "alice", "bob", true), Ep(1000));
    }

    FakeAuthority auth;
    RelaySettings settings;
    std::unique_ptr<RelayRouter> router;
    int64_t now = 100'000;
};

TEST_F(RelayRouterTest, JoinBindsEndpointWithValidToken) {
    Send(BuildJoin("alice", "ta"), Ep(1000));
    ASSERT_TRUE(router->EndpointOf("alice"));
    EXPECT_EQ(router->EndpointOf("alice")->port(), 1000);

    // Token of another login does not bind.
    Send(BuildJoin("carol", "ta"), Ep(3000));
    EXPECT_FALSE(router->EndpointOf("carol"));
    EXPECT_EQ(router->BindingCount(), 1u);
}

TEST_F(RelayRouterTest, LegacyJoinNeedsOptIn) {
    Send("J|alice", Ep(1000));
    EXPECT_FALSE(router->EndpointOf("alice"));

    settings.allowLegacyJoin = true;
    router = std::make_unique<RelayRouter>(auth, settings);
    Send("J|alice", Ep(1000));
    EXPECT_TRUE(router->EndpointOf("alice"));
}

TEST_F(RelayRouterTest, RejoinFromNewPortMovesBinding) {
    Send(BuildJoin("alice", "ta"), Ep(1000));
    Send(BuildJoin("alice", "ta"), Ep(1001));
    EXPECT_EQ(router->EndpointOf("alice")->port(), 1001);
    EXPECT_EQ(router->BindingCount(), 1u);
    // The old endpoint no longer speaks for alice.
    EXPECT_TRUE(Audio("alice", Ep(1000)).empty());
}

TEST_F(RelayRouterTest, PingIsEchoedToSender) {
    auto out = Send(BuildPing(5, 777), Ep(4000));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, Ep(4000));
    EXPECT_EQ(std::string(out[0].data->begin(), out[0].data->end()), "Q|5|777");
}

TEST_F(RelayRouterTest, PairForwardsBothWays) {
    PairAliceBob();
    EXPECT_EQ(router->PeerOf("alice").value_or(""), "bob");
    EXPECT_EQ(router->PeerOf("bob").value_or(""), "alice");

    auto out = Audio("alice", Ep(1000));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, Ep(2000));
    const std::string relayed(out[0].data->begin(), out[0].data->end());
    EXPECT_EQ(relayed.substr(0, 8), "R|alice|");
    EXPECT_EQ(relayed.size(), 8u + 4u);

    out = Audio("bob", Ep(2000));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, Ep(1000));
}

TEST_F(RelayRouterTest, PairRequiresFriendshipAndActiveCall) {
    Send(BuildJoin("alice", "ta"), Ep(1000));
    Send(BuildJoin("carol", "tc"), Ep(3000));
    Send(BuildPair("alice", "ta", "alice", "carol", true), Ep(1000));
    EXPECT_FALSE(router->PeerOf("alice"));

    auth.calls.clear();
    Send(BuildJoin("bob", "tb"), Ep(2000));
    Send(BuildPair("alice", "ta", "alice", "bob", true), Ep(1000));
    EXPECT_FALSE(router->PeerOf("alice"));
}

TEST_F(RelayRouterTest, PairSenderMustBeAPartyAndBound) {
    Send(BuildJoin("bob", "tb"), Ep(2000));
    Send(BuildJoin("carol", "tc"), Ep(3000));
    Send(BuildPair("carol", "tc", "alice", "bob", true), Ep(3000));
    EXPECT_FALSE(router->PeerOf("bob"));

    // alice has a valid token but never joined.
    Send(BuildPair("alice", "ta", "alice", "bob", true), Ep(1000));
    EXPECT_FALSE(router->PeerOf("bob"));
}

TEST_F(RelayRouterTest, LegacyPairUsesEndpointIdentity) {
    Send(BuildJoin("alice", "ta"), Ep(1000));
    Send(BuildJoin("bob", "tb"), Ep(2000));
    Send("S|alice|bob|1", Ep(1000));
    EXPECT_FALSE(router->PeerOf("alice"));

    settings.allowLegacyPairing = true;
    router = std::make_unique<RelayRouter>(auth, settings);
    Send(BuildJoin("alice", "ta"), Ep(1000));
    Send(BuildJoin("bob", "tb"), Ep(2000));
    Send("S|alice|bob|1", Ep(5000));
    EXPECT_FALSE(router->PeerOf("alice"));
    Send("S|alice|bob|1", Ep(1000));
    EXPECT_EQ(router->PeerOf("alice").value_or(""), "bob");
}

TEST_F(RelayRouterTest, PairOffClearsBothSides) {
    PairAliceBob();
    Send(BuildPair("bob", "tb", "alice", "bob", false), Ep(2000));
    EXPECT_FALSE(router->PeerOf("alice"));
    EXPECT_FALSE(router->PeerOf("bob"));
    EXPECT_TRUE(Audio("alice", Ep(1000)).empty());
}

TEST_F(RelayRouterTest, AudioFromWrongEndpointIsDropped) {
    PairAliceBob();
    const auto before = router->Stats().dropped;
    EXPECT_TRUE(Audio("alice", Ep(9999)).empty());
    EXPECT_TRUE(Audio("mallory", Ep(1000)).empty());
    EXPECT_EQ(router->Stats().dropped, before + 2);
}

TEST_F(RelayRouterTest, UnpairedAudioHasNoRoute) {
    Send(BuildJoin("alice", "ta"), Ep(1000));
    EXPECT_TRUE(Audio("alice", Ep(1000)).empty());
}

TEST_F(RelayRouterTest, RoomFansOutToOtherMembers) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("bob", "tb", 7), Ep(2000));
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));
    EXPECT_EQ(router->RoomSize(7), 3u);

    auto out = Audio("alice", Ep(1000));
    ASSERT_EQ(out.size(), 2u);
    std::set<uint16_t> ports{ out[0].to.port(), out[1].to.port() };
    EXPECT_EQ(ports, (std::set<uint16_t>{ 2000, 3000 }));
    // One buffer shared by every recipient.
    EXPECT_EQ(out[0].data, out[1].data);
}

TEST_F(RelayRouterTest, RoomTakesPrecedenceOverPair) {
    PairAliceBob();
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));
    auto out = Audio("alice", Ep(1000));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, Ep(3000));
}

TEST_F(RelayRouterTest, RoomJoinIsGated) {
    Send(BuildRoomJoin("alice", "ta", 8), Ep(1000));
    EXPECT_FALSE(router->RoomOf("alice"));
    EXPECT_FALSE(router->EndpointOf("alice"));

    Send(BuildRoomJoin("alice", "tb", 7), Ep(1000));
    EXPECT_FALSE(router->RoomOf("alice"));
}

TEST_F(RelayRouterTest, SwitchingRoomsLeavesTheOldOne) {
    auth.roomAcl.insert({ "alice", 9 });
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("alice", "ta", 9), Ep(1000));
    EXPECT_EQ(router->RoomOf("alice").value_or(0), 9);
    EXPECT_EQ(router->RoomSize(7), 0u);
    EXPECT_EQ(router->RoomSize(9), 1u);
}

TEST_F(RelayRouterTest, RoomLeaveRequiresBoundEndpoint) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomLeave("alice", 7), Ep(5555));
    EXPECT_EQ(router->RoomSize(7), 1u);
    Send(BuildRoomLeave("alice", 7), Ep(1000));
    EXPECT_EQ(router->RoomSize(7), 0u);
    EXPECT_FALSE(router->RoomOf("alice"));
    EXPECT_TRUE(router->EndpointOf("alice"));
}

TEST_F(RelayRouterTest, EndpointTakeoverEvictsPreviousOwner) {
    PairAliceBob();
    Send(BuildRoomJoin("carol", "tc", 7), Ep(1000));
    EXPECT_FALSE(router->EndpointOf("alice"));
    EXPECT_FALSE(router->PeerOf("bob"));
    EXPECT_EQ(router->EndpointOf("carol")->port(), 1000);
}

TEST_F(RelayRouterTest, SweepEvictsSilentEndpoints) {
    PairAliceBob();
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));

    now += settings.endpointTtlMs / 2;
    Audio("alice", Ep(1000));
    Send(BuildJoin("bob", "tb"), Ep(2000));

    now += settings.endpointTtlMs / 2 + 1;
    EXPECT_EQ(router->Sweep(now), 1u);
    EXPECT_FALSE(router->EndpointOf("carol"));
    EXPECT_EQ(router->RoomSize(7), 0u);
    EXPECT_TRUE(router->EndpointOf("alice"));
    EXPECT_TRUE(router->EndpointOf("bob"));
    EXPECT_EQ(router->PeerOf("alice").value_or(""), "bob");

    now += settings.endpointTtlMs + 1;
    EXPECT_EQ(router->Sweep(now), 2u);
    EXPECT_FALSE(router->PeerOf("alice"));
    EXPECT_EQ(router->BindingCount(), 0u);
}

TEST_F(RelayRouterTest, CallRebindFromNewPortLeavesRoom) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));
    Send(BuildJoin("bob", "tb"), Ep(2000));

    // alice's L| was lost; she comes back in call mode from a new port.
    Send(BuildJoin("alice", "ta"), Ep(1500));
    EXPECT_FALSE(router->RoomOf("alice"));
    EXPECT_EQ(router->RoomSize(7), 1u);
    Send(BuildPair("alice", "ta", "alice", "bob", true), Ep(1500));

    auto out = Audio("alice", Ep(1500));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, Ep(2000));
}

TEST_F(RelayRouterTest, PairSetLeavesRoomsOfBothParties) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("bob", "tb", 7), Ep(2000));
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));
    Send(BuildPair("alice", "ta", "alice", "bob", true), Ep(1000));

    EXPECT_FALSE(router->RoomOf("alice"));
    EXPECT_FALSE(router->RoomOf("bob"));
    EXPECT_EQ(router->RoomSize(7), 1u);
    auto out = Audio("bob", Ep(2000));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, Ep(1000));
}

TEST_F(RelayRouterTest, RoomMembershipLapsesWithoutRenewal) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));

    now += settings.roomTtlMs / 2;
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));
    // Audio keeps the endpoint alive but does not renew the room.
    EXPECT_EQ(Audio("alice", Ep(1000)).size(), 1u);

    now += settings.roomTtlMs / 2 + 1;
    EXPECT_TRUE(Audio("carol", Ep(3000)).empty());
    EXPECT_TRUE(Audio("alice", Ep(1000)).empty());
    EXPECT_FALSE(router->RoomOf("alice"));
    EXPECT_EQ(router->RoomOf("carol").value_or(0), 7);
    EXPECT_TRUE(router->EndpointOf("alice"));
}

TEST_F(RelayRouterTest, SweepDropsLapsedRoomMembers) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));

    now += settings.roomTtlMs / 2;
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));
    now += settings.roomTtlMs / 2 + 1;
    EXPECT_EQ(router->Sweep(now), 1u);
    EXPECT_EQ(router->RoomSize(7), 1u);
    EXPECT_FALSE(router->RoomOf("alice"));
    EXPECT_EQ(router->BindingCount(), 2u);
}

TEST_F(RelayRouterTest, RejectedRoomRenewalLeavesRoom) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    Send(BuildRoomJoin("carol", "tc", 7), Ep(3000));

    // A forged C| from elsewhere does not kick alice.
    Send(BuildRoomJoin("alice", "bad", 7), Ep(9999));
    EXPECT_EQ(router->RoomSize(7), 2u);

    auth.roomAcl.erase({ "alice", 7 });
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    EXPECT_FALSE(router->RoomOf("alice"));
    EXPECT_EQ(router->RoomSize(7), 1u);
    EXPECT_TRUE(Audio("alice", Ep(1000)).empty());
    EXPECT_TRUE(Audio("carol", Ep(3000)).empty());
}

TEST_F(RelayRouterTest, RejectedControlDoesNotKeepBindingAlive) {
    Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
    auth.tokens.erase("ta");

    for (int i = 0; i < 30; ++i) {
        now += 2'000;
        Send(BuildRoomJoin("alice", "ta", 7), Ep(1000));
        Send(BuildPing(i, now), Ep(1000));
        router->Sweep(now);
    }
    EXPECT_FALSE(router->EndpointOf("alice"));
    EXPECT_EQ(router->RoomSize(7), 0u);
}

TEST_F(RelayRouterTest, LoggedOutCallerLosesPair) {
    PairAliceBob();
    auth.tokens.erase("ta");

    Send(BuildPair("mallory", "ta", "alice", "bob", true), Ep(9999));
    EXPECT_EQ(router->PeerOf("alice").value_or(""), "bob");

    Send(BuildJoin("alice", "ta"), Ep(1000));
    Send(BuildPair("alice", "ta", "alice", "bob", true), Ep(1000));
    EXPECT_FALSE(router->PeerOf("alice"));
    EXPECT_FALSE(router->PeerOf("bob"));
    EXPECT_TRUE(Audio("alice", Ep(1000)).empty());
}

TEST_F(RelayRouterTest, FailedPairRecheckClearsPair) {
    PairAliceBob();
    auth.calls.clear();
    Send(BuildPair("alice", "ta", "alice", "bob", true), Ep(1000));
    EXPECT_FALSE(router->PeerOf("alice"));
    EXPECT_FALSE(router->PeerOf("bob"));
}

TEST_F(RelayRouterTest, ControlDatagramsAreRateLimited) {
    settings.controlRateLimit = 3;
    router = std::make_unique<RelayRouter>(auth, settings);
    for (int i = 0; i < 5; ++i) Send(BuildPing(i, now), Ep(1000));
    EXPECT_EQ(router->Stats().rateLimited, 2u);
    // Limits are per endpoint and tag.
    EXPECT_EQ(Send(BuildPing(9, now), Ep(1001)).size(), 1u);
    now += settings.controlRateWindowMs;
    EXPECT_EQ(Send(BuildPing(10, now), Ep(1000)).size(), 1u);
}

TEST_F(RelayRouterTest, MalformedAndUnexpectedAreCounted) {
    Send("garbage", Ep(1000));
    Send("Q|1|2", Ep(1000));
    Send("R|alice|xx", Ep(1000));
    const RelayStats s = router->Stats();
    EXPECT_EQ(s.received, 3u);
    EXPECT_EQ(s.malformed, 1u);
    EXPECT_EQ(s.dropped, 3u);
}
