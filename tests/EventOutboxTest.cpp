#include <gtest/gtest.h>
#include "TestClock.h"
#include "../server/src/EventOutbox.h"

using namespace Parley;
using json = nlohmann::json;

TEST(EventOutbox, DrainReturnsInOrderOnce) {
    ManualClock clock;
    EventOutbox outbox(clock, EventSettings{});
    outbox.Push("bob", "incoming_call", json{ { "from_user", "alice" } });
    clock.Advance(5);
    outbox.Push("bob", "call_ended", json{ { "with_user", "alice" } });

    auto events = outbox.Drain("bob");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, "incoming_call");
    EXPECT_EQ(events[1].type, "call_ended");
    EXPECT_TRUE(outbox.Drain("bob").empty());
    EXPECT_EQ(outbox.Pending("bob"), 0u);
}

TEST(EventOutbox, QueuesArePerLogin) {
    ManualClock clock;
    EventOutbox outbox(clock, EventSettings{});
    outbox.Push("bob", "a", json::object());
    outbox.Push("carol", "b", json::object());
    outbox.Push("", "ignored", json::object());
    EXPECT_EQ(outbox.Drain("bob").size(), 1u);
    EXPECT_EQ(outbox.Pending("carol"), 1u);
}

TEST(EventOutbox, BoundedQueueDropsOldest) {
    ManualClock clock;
    EventSettings settings;
    settings.maxPerUser = 3;
    EventOutbox outbox(clock, settings);
    for (int i = 0; i < 5; ++i) outbox.Push("bob", "e" + std::to_string(i), json::object());

    auto events = outbox.Drain("bob");
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events.front().type, "e2");
    EXPECT_EQ(events.back().type, "e4");
}

TEST(EventOutbox, ExpiredEventsAreNotDelivered) {
    ManualClock clock;
    EventOutbox outbox(clock, EventSettings{});
    outbox.Push("bob", "old", json::object());
    clock.Advance(EventSettings{}.ttlMs + 1);
    outbox.Push("bob", "fresh", json::object());

    auto events = outbox.Drain("bob");
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, "fresh");
}

TEST(EventOutbox, WireFormIsFlat) {
    ManualClock clock(1234);
    EventOutbox outbox(clock, EventSettings{});
    outbox.Push("bob", "call_accepted", json{ { "by_user", "alice" }, { "with_user", "alice" } });
    const json j = outbox.Drain("bob").at(0).ToJson();
    EXPECT_EQ(j["type"], "call_accepted");
    EXPECT_EQ(j["ts"], 1234);
    EXPECT_EQ(j["by_user"], "alice");
    EXPECT_EQ(j["with_user"], "alice");
}
