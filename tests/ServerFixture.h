#pragma once
#include <gtest/gtest.h>
#include "TestClock.h"
#include "../server/src/CallSignaling.h"
#include "../server/src/ChannelVoice.h"
#include "../server/src/Crypto.h"
#include "../server/src/Database.h"
#include "../server/src/EventOutbox.h"
#include "../server/src/ServerConfig.h"
#include "../server/src/SessionManager.h"
#include <memory>
#include <string>

namespace Parley {

    // In-memory database plus the control-plane services on a manual clock.
    class ServerFixture : public ::testing::Test {
    protected:
        void SetUp() override {
            config.sessions.pbkdf2Iterations = 1000;
            db = std::make_unique<Database>(":memory:");
            ASSERT_TRUE(db->IsOpen());
            events = std::make_unique<EventOutbox>(clock, config.events);
            sessions = std::make_unique<SessionManager>(*db, clock, config.sessions);
            calls = std::make_unique<CallSignaling>(*db, *sessions, *events, clock, config.calls);
            voice = std::make_unique<ChannelVoice>(*db, *sessions, clock, config.voice);
        }

        void AddUser(const std::string& login, const std::string& nickname = {}) {
            ASSERT_TRUE(db->CreateUser(login, HashPassword("pw-" + login, 1000),
                nickname.empty() ? login : nickname));
        }

        void MakeFriends(const std::string& a, const std::string& b) {
            ASSERT_TRUE(db->AddFriendRequest(a, b));
            ASSERT_TRUE(db->AcceptFriendRequest(a, b));
        }

        std::string SignIn(const std::string& login) {
            auto s = sessions->CreateSession(login);
            EXPECT_TRUE(s.has_value());
            return s ? s->token : std::string();
        }

        ManualClock clock;
        ServerConfig config;
        std::unique_ptr<Database> db;
        std::unique_ptr<EventOutbox> events;
        std::unique_ptr<SessionManager> sessions;
        std::unique_ptr<CallSignaling> calls;
        std::unique_ptr<ChannelVoice> voice;
    };

} // namespace Parley
