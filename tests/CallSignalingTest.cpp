#include "ServerFixture.h"

using namespace Parley;

class CallSignalingTest : public ServerFixture {
protected:
    void SetUp() override {
        ServerFixture::SetUp();
        AddUser("alice");
        AddUser("bob");
        AddUser("carol");
        MakeFriends("alice", "bob");
        MakeFriends("alice", "carol");
        SignIn("alice");
        SignIn("bob");
        SignIn("carol");
    }

    std::vector<Event> Drain(const std::string& login) { return events->Drain(login); }
};

TEST_F(CallSignalingTest, StartCallRingsCallee) {
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    auto pair = calls->PairOf("bob");
    ASSERT_TRUE(pair);
    EXPECT_EQ(pair->status, CallStatus::Ringing);
    EXPECT_EQ(pair->caller, "alice");
    EXPECT_EQ(pair->userA, "alice");
    EXPECT_EQ(pair->userB, "bob");
    EXPECT_FALSE(calls->HasActivePair("alice", "bob"));

    auto ev = Drain("bob");
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, "incoming_call");
    EXPECT_EQ(ev[0].payload["from_user"], "alice");
}

TEST_F(CallSignalingTest, StartCallValidation) {
    AddUser("dave");
    EXPECT_EQ(calls->StartCall("alice", "").kind, ErrorKind::Malformed);
    EXPECT_EQ(calls->StartCall("alice", "alice").kind, ErrorKind::Malformed);
    EXPECT_EQ(calls->StartCall("alice", "nobody").kind, ErrorKind::NotFound);
    EXPECT_EQ(calls->StartCall("alice", "dave").kind, ErrorKind::Forbidden);

    clock.Advance(config.sessions.onlineWindowMs + 1);
    auto r = calls->StartCall("alice", "bob");
    EXPECT_EQ(r.kind, ErrorKind::Conflict);
    EXPECT_EQ(r.message, "user offline");
    EXPECT_EQ(calls->PairCount(), 0u);
}

TEST_F(CallSignalingTest, BusyPartiesAreRejected) {
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    EXPECT_EQ(calls->StartCall("carol", "alice").kind, ErrorKind::Conflict);
    MakeFriends("bob", "carol");
    EXPECT_EQ(calls->StartCall("carol", "bob").kind, ErrorKind::Conflict);
    EXPECT_EQ(calls->StartCall("alice", "carol").kind, ErrorKind::Conflict);
    EXPECT_EQ(calls->PairCount(), 1u);
}

TEST_F(CallSignalingTest, AcceptPromotesAndNotifiesBoth) {
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    Drain("bob");
    ASSERT_TRUE(calls->AcceptCall("bob", "alice").Ok());
    EXPECT_TRUE(calls->HasActivePair("alice", "bob"));
    EXPECT_TRUE(calls->HasActivePair("bob", "alice"));

    auto toCaller = Drain("alice");
    ASSERT_EQ(toCaller.size(), 1u);
    EXPECT_EQ(toCaller[0].type, "call_accepted");
    EXPECT_EQ(toCaller[0].payload["by_user"], "bob");
    EXPECT_EQ(toCaller[0].payload["with_user"], "bob");

    auto toAcceptor = Drain("bob");
    ASSERT_EQ(toAcceptor.size(), 1u);
    EXPECT_EQ(toAcceptor[0].type, "call_started");
    EXPECT_EQ(toAcceptor[0].payload["with_user"], "alice");
}

TEST_F(CallSignalingTest, AcceptWithoutMatchingPairIsNoOp) {
    EXPECT_EQ(calls->AcceptCall("bob", "alice").kind, ErrorKind::Conflict);
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    // The caller cannot accept their own call.
    EXPECT_EQ(calls->AcceptCall("alice", "bob").kind, ErrorKind::Conflict);
    EXPECT_EQ(calls->AcceptCall("carol", "alice").kind, ErrorKind::Conflict);
    EXPECT_FALSE(calls->HasActivePair("alice", "bob"));
    ASSERT_TRUE(calls->AcceptCall("bob", "alice").Ok());
    EXPECT_EQ(calls->AcceptCall("bob", "alice").kind, ErrorKind::Conflict);
}

TEST_F(CallSignalingTest, DeclineRemovesPair) {
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    EXPECT_EQ(calls->DeclineCall("carol", "alice").kind, ErrorKind::Conflict);
    ASSERT_TRUE(calls->DeclineCall("bob", "alice").Ok());
    EXPECT_EQ(calls->PairCount(), 0u);
    EXPECT_FALSE(calls->PeerOf("alice"));

    auto ev = Drain("alice");
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, "call_declined");
    EXPECT_EQ(ev[0].payload["by_user"], "bob");
}

TEST_F(CallSignalingTest, EitherSideCanEnd) {
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    ASSERT_TRUE(calls->AcceptCall("bob", "alice").Ok());
    Drain("alice");
    Drain("bob");

    EXPECT_EQ(calls->EndCall("bob", "carol").kind, ErrorKind::Conflict);
    ASSERT_TRUE(calls->EndCall("bob", "alice").Ok());
    EXPECT_EQ(calls->PairCount(), 0u);

    auto ev = Drain("alice");
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, "call_ended");
    EXPECT_EQ(ev[0].payload["with_user"], "bob");
    EXPECT_EQ(ev[0].payload["by_user"], "bob");
    EXPECT_TRUE(Drain("bob").empty());
}

TEST_F(CallSignalingTest, StalePairsArePruned) {
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    ASSERT_TRUE(calls->AcceptCall("bob", "alice").Ok());
    Drain("alice");
    Drain("bob");

    clock.Advance(config.calls.staleMs - 1);
    calls->MarkActivity("alice");
    EXPECT_EQ(calls->PruneStale(), 0u);

    // Only alice kept polling; bob went silent.
    clock.Advance(2);
    calls->MarkActivity("alice");
    EXPECT_EQ(calls->PruneStale(), 1u);
    EXPECT_EQ(calls->PairCount(), 0u);
    EXPECT_EQ(calls->PruneStale(), 0u);

    auto a = Drain("alice");
    auto b = Drain("bob");
    ASSERT_EQ(a.size(), 1u);
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(a[0].type, "call_ended");
    EXPECT_EQ(a[0].payload["with_user"], "bob");
    EXPECT_EQ(a[0].payload["by_user"], "system");
    EXPECT_EQ(b[0].payload["with_user"], "alice");
}

TEST_F(CallSignalingTest, MarkActivityIgnoresIdleLogins) {
    calls->MarkActivity("carol");
    EXPECT_EQ(calls->PairCount(), 0u);
    EXPECT_FALSE(calls->PeerOf("carol"));
}

TEST_F(CallSignalingTest, CleanupNotifiesPeer) {
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    Drain("bob");
    calls->CleanupForUser("alice");
    EXPECT_EQ(calls->PairCount(), 0u);
    auto ev = Drain("bob");
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].type, "call_ended");
    EXPECT_EQ(ev[0].payload["with_user"], "alice");
    EXPECT_EQ(ev[0].payload["by_user"], "alice");

    calls->CleanupForUser("alice");
    EXPECT_TRUE(Drain("bob").empty());
}

TEST_F(CallSignalingTest, LoginIsInAtMostOnePair) {
    MakeFriends("bob", "carol");
    ASSERT_TRUE(calls->StartCall("alice", "bob").Ok());
    ASSERT_TRUE(calls->DeclineCall("bob", "alice").Ok());
    ASSERT_TRUE(calls->StartCall("carol", "bob").Ok());
    EXPECT_EQ(calls->PeerOf("bob").value_or(""), "carol");
    EXPECT_FALSE(calls->PeerOf("alice"));
    EXPECT_EQ(calls->PairCount(), 1u);
}
