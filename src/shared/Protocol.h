#pragma once
#include <cstdint>
#include <cstddef>

namespace Parley {

    // --- Ports ------------------------------------------------------------------
    constexpr uint16_t CONTROL_PORT = 5555;
    constexpr uint16_t VOICE_PORT = 5556;

    // --- Control channel --------------------------------------------------------
    constexpr uint32_t kMaxControlFrame = 10'000'000;
    constexpr size_t   kFramePrefixSize = 4;

    // --- Audio ------------------------------------------------------------------
    // Raw PCM, no codec: 16 kHz mono signed 16-bit, 20 ms blocks.
    constexpr int    kSampleRate = 16000;
    constexpr int    kChannels = 1;
    constexpr int    kFrameSamples = 320;
    constexpr size_t kFrameBytes = kFrameSamples * sizeof(int16_t);
    constexpr int    kFrameMs = 1000 * kFrameSamples / kSampleRate;

    // --- UDP datagram tags (first byte, followed by '|') --------------------------
    constexpr char kUdpJoin = 'J';
    constexpr char kUdpRoomJoin = 'C';
    constexpr char kUdpRoomLeave = 'L';
    constexpr char kUdpPair = 'S';
    constexpr char kUdpPing = 'P';
    constexpr char kUdpPong = 'Q';
    constexpr char kUdpAudio = 'A';
    constexpr char kUdpRelayed = 'R';
    constexpr char kUdpSeparator = '|';

    // --- Byte order helpers -----------------------------------------------------
    inline uint32_t ReadU32BE(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16)
            | (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    inline void WriteU32BE(uint8_t* p, uint32_t v) {
        p[0] = static_cast<uint8_t>(v >> 24);
        p[1] = static_cast<uint8_t>(v >> 16);
        p[2] = static_cast<uint8_t>(v >> 8);
        p[3] = static_cast<uint8_t>(v);
    }

} // namespace Parley
