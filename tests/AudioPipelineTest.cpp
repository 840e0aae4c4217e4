#include <gtest/gtest.h>
#include "../src/audio/AudioPipeline.h"
#include <vector>

using namespace Parley;

namespace {

    AudioSettings TestSettings() {
        AudioSettings s;
        s.jitterCapacity = 4;
        s.jitterPrefill = 1;
        s.plcWindowMs = 100;
        s.maxPlcFrames = 1;
        return s;
    }

    std::vector<uint8_t> PcmBytes(int16_t value) {
        std::vector<int16_t> pcm(kFrameSamples, value);
        const auto* p = reinterpret_cast<const uint8_t*>(pcm.data());
        return std::vector<uint8_t>(p, p + kFrameBytes);
    }

} // namespace

TEST(AudioPipeline, CaptureRestagesDevicePeriodsIntoFrames) {
    AudioPipeline pipe(TestSettings());
    std::vector<std::vector<int16_t>> frames;
    pipe.SetCaptureSink([&](const int16_t* pcm, size_t n) {
        frames.emplace_back(pcm, pcm + n);
        return true;
    });

    // 480-sample periods: two periods make three frames.
    std::vector<int16_t> period(480);
    for (size_t i = 0; i < period.size(); ++i) period[i] = static_cast<int16_t>(i);
    pipe.ProcessCapture(period.data(), period.size(), 0);
    ASSERT_EQ(frames.size(), 1u);
    pipe.ProcessCapture(period.data(), period.size(), 30);
    ASSERT_EQ(frames.size(), 3u);

    for (const auto& f : frames) EXPECT_EQ(f.size(), static_cast<size_t>(kFrameSamples));
    EXPECT_EQ(frames[0][0], 0);
    EXPECT_EQ(frames[1][0], 320);
    EXPECT_EQ(frames[1][160], 0);
}

TEST(AudioPipeline, MutedMicSendsNothingButMetersLevel) {
    AudioPipeline pipe(TestSettings());
    int sent = 0;
    pipe.SetCaptureSink([&](const int16_t*, size_t) { ++sent; return true; });
    pipe.SetMicEnabled(false);

    std::vector<int16_t> loud(kFrameSamples, 8000);
    pipe.ProcessCapture(loud.data(), loud.size(), 0);
    EXPECT_EQ(sent, 0);

    const ActivitySnapshot a = pipe.Activity(0);
    EXPECT_GT(a.micLevel, 0.0f);
    EXPECT_FALSE(a.meSpeaking);

    pipe.SetMicEnabled(true);
    pipe.ProcessCapture(loud.data(), loud.size(), 10);
    EXPECT_EQ(sent, 1);
    EXPECT_TRUE(pipe.Activity(10).meSpeaking);
}

TEST(AudioPipeline, RelayedAudioPlaysOut) {
    AudioPipeline pipe(TestSettings());
    const auto bytes = PcmBytes(1234);
    pipe.OnRelayedAudio("bob", bytes.data(), bytes.size(), 0);

    std::vector<int16_t> out(kFrameSamples, -1);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    EXPECT_EQ(out.front(), 1234);
    EXPECT_EQ(out.back(), 1234);
    EXPECT_TRUE(pipe.Activity(0).peerSpeaking);
}

TEST(AudioPipeline, PlaybackSpansFramesAcrossPeriods) {
    AudioPipeline pipe(TestSettings());
    const auto a = PcmBytes(1);
    const auto b = PcmBytes(2);
    pipe.OnRelayedAudio("bob", a.data(), a.size(), 0);
    pipe.OnRelayedAudio("bob", b.data(), b.size(), 0);

    std::vector<int16_t> out(480);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    EXPECT_EQ(out[0], 1);
    EXPECT_EQ(out[319], 1);
    EXPECT_EQ(out[320], 2);
    EXPECT_EQ(out[479], 2);
}

TEST(AudioPipeline, MutedSoundStillDrains) {
    AudioPipeline pipe(TestSettings());
    pipe.SetSoundEnabled(false);
    const auto bytes = PcmBytes(500);
    pipe.OnRelayedAudio("bob", bytes.data(), bytes.size(), 0);

    std::vector<int16_t> out(kFrameSamples, -1);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    EXPECT_EQ(out[0], 0);
    EXPECT_EQ(pipe.QueuedFrames(), 0u);
    EXPECT_FALSE(pipe.Activity(0).peerSpeaking);
}

TEST(AudioPipeline, StallCountsUnderflowAndDegradesQuality) {
    AudioPipeline pipe(TestSettings());
    const auto bytes = PcmBytes(100);
    pipe.OnRelayedAudio("bob", bytes.data(), bytes.size(), 0);

    std::vector<int16_t> out(kFrameSamples);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    pipe.ProcessPlayback(out.data(), out.size(), 20);   // concealed
    EXPECT_EQ(out[0], 100);
    pipe.ProcessPlayback(out.data(), out.size(), 40);   // underflow
    EXPECT_EQ(out[0], 0);

    const ActivitySnapshot a = pipe.Activity(40);
    EXPECT_EQ(a.jitter.underflows, 2u);
    EXPECT_EQ(a.jitter.concealed, 1u);
    EXPECT_LT(a.qualityScore, 100.0);
}

TEST(AudioPipeline, OverflowDegradesQuality) {
    AudioPipeline pipe(TestSettings());
    const auto bytes = PcmBytes(1);
    for (int i = 0; i < 6; ++i) pipe.OnRelayedAudio("bob", bytes.data(), bytes.size(), i * 20);
    const ActivitySnapshot a = pipe.Activity(120);
    EXPECT_EQ(a.jitter.overflows, 2u);
    EXPECT_EQ(a.jitter.depth, 4u);
    EXPECT_LT(a.qualityScore, 100.0);
}

TEST(AudioPipeline, ShortDatagramIsPadded) {
    AudioPipeline pipe(TestSettings());
    const int16_t few[3] = { 9, 9, 9 };
    pipe.OnRelayedAudio("bob", reinterpret_cast<const uint8_t*>(few), sizeof(few), 0);

    std::vector<int16_t> out(kFrameSamples, -1);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    EXPECT_EQ(out[2], 9);
    EXPECT_EQ(out[3], 0);
}

TEST(AudioPipeline, ResetClearsState) {
    AudioPipeline pipe(TestSettings());
    const auto bytes = PcmBytes(7);
    pipe.OnRelayedAudio("bob", bytes.data(), bytes.size(), 0);
    pipe.OnLatency(250.0);
    pipe.Reset();

    const ActivitySnapshot a = pipe.Activity(0);
    EXPECT_EQ(a.jitter.depth, 0u);
    EXPECT_DOUBLE_EQ(a.latencyMs, 0.0);
    EXPECT_FLOAT_EQ(a.peerLevel, 0.0f);
    EXPECT_STREQ(a.quality, "excellent");
}

TEST(AudioPipeline, RoomSpeakersAreMixedNotQueued) {
    AudioPipeline pipe(TestSettings());
    const auto a = PcmBytes(1000);
    const auto c = PcmBytes(-300);
    pipe.OnRelayedAudio("alice", a.data(), a.size(), 0);
    pipe.OnRelayedAudio("carol", c.data(), c.size(), 0);
    EXPECT_EQ(pipe.SpeakerCount(), 2u);

    std::vector<int16_t> out(kFrameSamples);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    EXPECT_EQ(out.front(), 700);
    EXPECT_EQ(out.back(), 700);
    EXPECT_EQ(pipe.QueuedFrames(), 0u);
    EXPECT_EQ(pipe.Jitter().played, 2u);
}

TEST(AudioPipeline, MixClampsToSampleRange) {
    AudioPipeline pipe(TestSettings());
    const auto loud = PcmBytes(30000);
    pipe.OnRelayedAudio("alice", loud.data(), loud.size(), 0);
    pipe.OnRelayedAudio("carol", loud.data(), loud.size(), 0);
    std::vector<int16_t> out(kFrameSamples);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    EXPECT_EQ(out[0], 32767);

    const auto low = PcmBytes(-30000);
    pipe.OnRelayedAudio("alice", low.data(), low.size(), 20);
    pipe.OnRelayedAudio("carol", low.data(), low.size(), 20);
    pipe.ProcessPlayback(out.data(), out.size(), 20);
    EXPECT_EQ(out[0], -32768);
}

TEST(AudioPipeline, SilentSpeakerDoesNotHoldBackOthers) {
    AudioPipeline pipe(TestSettings());
    const auto a = PcmBytes(10);
    const auto c = PcmBytes(20);
    pipe.OnRelayedAudio("alice", a.data(), a.size(), 0);
    pipe.OnRelayedAudio("alice", a.data(), a.size(), 0);
    pipe.OnRelayedAudio("carol", c.data(), c.size(), 0);

    std::vector<int16_t> out(kFrameSamples);
    pipe.ProcessPlayback(out.data(), out.size(), 0);
    EXPECT_EQ(out[0], 30);
    // carol's buffer ran dry well after her last frame: alice plays alone.
    pipe.ProcessPlayback(out.data(), out.size(), 500);
    EXPECT_EQ(out[0], 10);
}

TEST(AudioPipeline, IdleSpeakersAreRetiredWithTheirCounters) {
    AudioPipeline pipe(TestSettings());
    const auto a = PcmBytes(1);
    pipe.OnRelayedAudio("alice", a.data(), a.size(), 0);
    pipe.OnRelayedAudio("carol", a.data(), a.size(), AudioPipeline::kSpeakerIdleMs + 2'000);
    EXPECT_EQ(pipe.SpeakerCount(), 1u);
    EXPECT_EQ(pipe.Jitter().pushed, 2u);
    EXPECT_EQ(pipe.QueuedFrames(), 1u);
}

