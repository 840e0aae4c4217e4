#include <gtest/gtest.h>
#include "../src/app/VoiceSendPacer.h"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace Parley;

namespace {

    // Collects sent frames and lets the test wait for a count.
    struct Sink {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<int16_t> firstSamples;

        void operator()(const int16_t* pcm, size_t) {
            std::lock_guard<std::mutex> lk(mutex);
            firstSamples.push_back(pcm[0]);
            cv.notify_all();
        }

        bool WaitFor(size_t n) {
            std::unique_lock<std::mutex> lk(mutex);
            return cv.wait_for(lk, std::chrono::seconds(2), [&] { return firstSamples.size() >= n; });
        }
    };

} // namespace

TEST(VoiceSendPacer, SendsFramesInOrder) {
    Sink sink;
    VoiceSendPacer pacer(8);
    pacer.Start([&](const int16_t* pcm, size_t n) { sink(pcm, n); });

    for (int16_t v = 1; v <= 5; ++v) {
        std::vector<int16_t> frame(kFrameSamples, v);
        // try_lock may lose against the sender thread; retry until queued.
        while (!pacer.TryEnqueue(frame.data(), frame.size()))
            std::this_thread::yield();
    }
    ASSERT_TRUE(sink.WaitFor(5));
    pacer.Stop();

    std::lock_guard<std::mutex> lk(sink.mutex);
    EXPECT_EQ(sink.firstSamples, (std::vector<int16_t>{ 1, 2, 3, 4, 5 }));
    EXPECT_EQ(pacer.Sent(), 5u);
}

TEST(VoiceSendPacer, RejectsWhenStopped) {
    VoiceSendPacer pacer(4);
    std::vector<int16_t> frame(kFrameSamples, 1);
    EXPECT_FALSE(pacer.TryEnqueue(frame.data(), frame.size()));
    EXPECT_FALSE(pacer.IsRunning());
    EXPECT_EQ(pacer.Dropped(), 0u);
}

TEST(VoiceSendPacer, FullRingDropsFrames) {
    std::mutex gate;
    std::unique_lock<std::mutex> hold(gate);
    VoiceSendPacer pacer(2);
    pacer.Start([&](const int16_t*, size_t) { std::lock_guard<std::mutex> lk(gate); });

    std::vector<int16_t> frame(kFrameSamples, 1);
    int accepted = 0;
    for (int i = 0; i < 20; ++i)
        if (pacer.TryEnqueue(frame.data(), frame.size())) ++accepted;

    // One frame may be in flight in the blocked sender, two more queued.
    EXPECT_LE(accepted, 3);
    EXPECT_GE(pacer.Dropped(), 17u);

    hold.unlock();
    pacer.Stop();
    EXPECT_FALSE(pacer.IsRunning());
}

TEST(VoiceSendPacer, ThrowingSendKeepsThreadAlive) {
    Sink sink;
    VoiceSendPacer pacer(4);
    int calls = 0;
    pacer.Start([&](const int16_t* pcm, size_t n) {
        if (++calls == 1) throw std::runtime_error("socket gone");
        sink(pcm, n);
    });

    std::vector<int16_t> a(kFrameSamples, 1), b(kFrameSamples, 2);
    while (!pacer.TryEnqueue(a.data(), a.size())) std::this_thread::yield();
    while (!pacer.TryEnqueue(b.data(), b.size())) std::this_thread::yield();
    ASSERT_TRUE(sink.WaitFor(1));
    pacer.Stop();

    EXPECT_EQ(pacer.Sent(), 1u);
}

TEST(VoiceSendPacer, StopIsIdempotent) {
    VoiceSendPacer pacer(4);
    pacer.Start([](const int16_t*, size_t) {});
    pacer.Stop();
    pacer.Stop();
    EXPECT_FALSE(pacer.IsRunning());
}
