#include <gtest/gtest.h>
#include "../src/app/Application.h"
#include <filesystem>
#include <memory>
#include <vector>

using namespace Parley;

namespace {

    // Answers every action with success; login hands out a token.
    struct ScriptedServer {
        std::vector<json> requests;

        ControlResponse operator()(const json& req) {
            requests.push_back(req);
            ControlResponse r;
            r.result = OpResult::Success();
            r.body = json{ { "status", "ok" } };
            if (req.value("action", "") == "login") {
                r.body["login"] = req.value("login", "");
                r.body["token"] = "tok-alice";
                r.body["expires_at"] = 4'000'000'000'000LL;
            }
            return r;
        }

        size_t Count(const std::string& action) const {
            size_t n = 0;
            for (const auto& r : requests)
                if (r.value("action", "") == action) ++n;
            return n;
        }
    };

    json Incoming(const std::string& from) {
        return json{ { "type", "incoming_call" }, { "from_user", from } };
    }

} // namespace

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
            ("parley-app-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "-" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir);
        ConfigManager::Get().SetConfigDir(dir);

        app = std::make_unique<Application>(config);
        app->Control().SetSleeper([](int64_t) {});
        app->Control().SetTransport([this](const json& req) { return server(req); });
        ASSERT_TRUE(app->Login("alice", "pw"));
        server.requests.clear();
    }

    void TearDown() override {
        app.reset();
        ConfigManager::Get().SetConfigDir({});
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    ClientConfig config;
    ScriptedServer server;
    std::unique_ptr<Application> app;
    std::filesystem::path dir;
};

TEST_F(ApplicationTest, IncomingCallRingsWhenIdle) {
    app->HandleEvent(Incoming("bob"));
    EXPECT_EQ(app->State(), AppState::Ringing);
    EXPECT_EQ(app->Peer(), "bob");
    EXPECT_TRUE(server.requests.empty());
}

TEST_F(ApplicationTest, IncomingCallWhileCallingIsDeclined) {
    ASSERT_TRUE(app->CallUser("bob"));
    server.requests.clear();

    app->HandleEvent(Incoming("carol"));
    ASSERT_EQ(server.requests.size(), 1u);
    const json& req = server.requests[0];
    EXPECT_EQ(req.value("action", ""), "decline_call");
    EXPECT_EQ(req.value("from_user", ""), "carol");
    EXPECT_EQ(req.value("token", ""), "tok-alice");

    // The pending outgoing call is untouched.
    EXPECT_EQ(app->State(), AppState::Calling);
    EXPECT_EQ(app->Peer(), "bob");
}

TEST_F(ApplicationTest, SecondCallerWhileRingingIsDeclined) {
    app->HandleEvent(Incoming("bob"));
    app->HandleEvent(Incoming("carol"));
    ASSERT_EQ(server.Count("decline_call"), 1u);
    EXPECT_EQ(server.requests.back().value("from_user", ""), "carol");
    EXPECT_EQ(app->State(), AppState::Ringing);
    EXPECT_EQ(app->Peer(), "bob");

    // A repeated notification from the ringing caller is not a second call.
    app->HandleEvent(Incoming("bob"));
    EXPECT_EQ(server.Count("decline_call"), 1u);
    EXPECT_EQ(app->State(), AppState::Ringing);
}

TEST_F(ApplicationTest, HangUpDeclinesWhileRinging) {
    app->HandleEvent(Incoming("bob"));
    app->HangUp();
    ASSERT_EQ(server.Count("decline_call"), 1u);
    EXPECT_EQ(server.requests.back().value("from_user", ""), "bob");
    EXPECT_EQ(app->State(), AppState::Idle);
    EXPECT_TRUE(app->Peer().empty());
}

TEST_F(ApplicationTest, HangUpEndsOutgoingCall) {
    ASSERT_TRUE(app->CallUser("bob"));
    app->HangUp();
    ASSERT_EQ(server.Count("end_call"), 1u);
    EXPECT_EQ(server.requests.back().value("with_user", ""), "bob");
    EXPECT_EQ(app->State(), AppState::Idle);
}

TEST_F(ApplicationTest, HangUpWhenIdleSendsNothing) {
    app->HangUp();
    EXPECT_TRUE(server.requests.empty());
    EXPECT_EQ(app->State(), AppState::Idle);
}
