#include "ServerFixture.h"

using namespace Parley;

class SessionManagerTest : public ServerFixture {};

TEST_F(SessionManagerTest, CreatedSessionValidates) {
    AddUser("alice");
    const std::string token = SignIn("alice");
    ASSERT_FALSE(token.empty());
    auto login = sessions->Validate(token);
    ASSERT_TRUE(login);
    EXPECT_EQ(*login, "alice");
    EXPECT_FALSE(sessions->Validate(""));
    EXPECT_FALSE(sessions->Validate("nope"));
}

TEST_F(SessionManagerTest, ExpiredSessionIsRejected) {
    AddUser("alice");
    const std::string token = SignIn("alice");
    clock.Advance(config.sessions.ttlMs + 1);
    EXPECT_FALSE(sessions->Validate(token));
}

TEST_F(SessionManagerTest, InvalidateRemovesToken) {
    AddUser("alice");
    const std::string token = SignIn("alice");
    sessions->Invalidate(token);
    EXPECT_FALSE(sessions->Validate(token));
    EXPECT_FALSE(sessions->IsOnline("alice"));
}

TEST_F(SessionManagerTest, OnlineFollowsLastSeen) {
    AddUser("alice");
    const std::string token = SignIn("alice");
    EXPECT_TRUE(sessions->IsOnline("alice"));

    clock.Advance(config.sessions.onlineWindowMs + 1);
    EXPECT_FALSE(sessions->IsOnline("alice"));

    sessions->Touch(token);
    EXPECT_TRUE(sessions->IsOnline("alice"));
    EXPECT_FALSE(sessions->IsOnline("bob"));
}

TEST_F(SessionManagerTest, TouchIsThrottled) {
    AddUser("alice");
    const std::string token = SignIn("alice");
    sessions->Touch(token);
    const int64_t firstTouch = clock.NowMs();

    clock.Advance(config.sessions.touchMinIntervalMs - 1);
    sessions->Touch(token);
    auto s = sessions->Lookup(token);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->lastSeen, firstTouch);

    clock.Advance(1);
    sessions->Touch(token);
    s = sessions->Lookup(token);
    ASSERT_TRUE(s);
    EXPECT_EQ(s->lastSeen, clock.NowMs());
}

TEST_F(SessionManagerTest, SoftOfflineKeepsTokenValid) {
    AddUser("alice");
    const std::string token = SignIn("alice");
    sessions->SoftOffline(token);
    EXPECT_FALSE(sessions->IsOnline("alice"));
    EXPECT_TRUE(sessions->Validate(token));

    // The next authenticated request brings the user back.
    AuthContext auth;
    EXPECT_TRUE(sessions->RequireAuth(token, auth).Ok());
    EXPECT_TRUE(sessions->IsOnline("alice"));
}

TEST_F(SessionManagerTest, RequireAuthClassifiesFailures) {
    AuthContext auth;
    EXPECT_EQ(sessions->RequireAuth("", auth).kind, ErrorKind::AuthRequired);
    EXPECT_EQ(sessions->RequireAuth("garbage", auth).kind, ErrorKind::AuthInvalid);

    AddUser("alice");
    const std::string token = SignIn("alice");
    ASSERT_TRUE(sessions->RequireAuth(token, auth).Ok());
    EXPECT_EQ(auth.login, "alice");
    EXPECT_EQ(auth.token, token);
}

TEST_F(SessionManagerTest, OneLoginMayHoldSeveralSessions) {
    AddUser("alice");
    const std::string a = SignIn("alice");
    const std::string b = SignIn("alice");
    EXPECT_NE(a, b);
    sessions->Invalidate(a);
    EXPECT_TRUE(sessions->Validate(b));
    EXPECT_TRUE(sessions->IsOnline("alice"));
}

TEST_F(SessionManagerTest, ExpiredTokenLeavesTouchThrottle) {
    AddUser("alice");
    const std::string token = SignIn("alice");
    AuthContext auth;
    ASSERT_TRUE(sessions->RequireAuth(token, auth).Ok());
    EXPECT_EQ(sessions->TrackedTouches(), 1u);

    clock.Advance(config.sessions.ttlMs + 1);
    EXPECT_FALSE(sessions->Validate(token));
    EXPECT_EQ(sessions->TrackedTouches(), 0u);
}

TEST_F(SessionManagerTest, StaleTouchEntriesArePruned) {
    AuthContext auth;
    for (const char* login : { "alice", "bob", "carol" }) {
        AddUser(login);
        ASSERT_TRUE(sessions->RequireAuth(SignIn(login), auth).Ok());
    }
    EXPECT_EQ(sessions->TrackedTouches(), 3u);

    // Tokens abandoned without a logout disappear on a later touch.
    clock.Advance(config.sessions.touchMinIntervalMs);
    AddUser("dave");
    ASSERT_TRUE(sessions->RequireAuth(SignIn("dave"), auth).Ok());
    EXPECT_EQ(sessions->TrackedTouches(), 1u);
}
