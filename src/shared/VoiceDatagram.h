#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Parley {

    enum class DatagramType : uint8_t {
        Join,       // J|login[|token]
        RoomJoin,   // C|login|token|room_id
        RoomLeave,  // L|login|room_id
        Pair,       // S|[sender|token|]user_a|user_b|flag
        Ping,       // P|seq|send_time
        Pong,       // Q|seq|send_time
        Audio,      // A|from|<pcm>
        Relayed     // R|from|<pcm>
    };

    struct VoiceDatagram {
        DatagramType type = DatagramType::Ping;
        std::string  login;     // J C L A R: subject login; S: sender (full form only)
        std::string  token;
        int64_t      roomId = 0;
        std::string  userA;
        std::string  userB;
        bool         pairOn = false;
        bool         legacy = false; // token-less J or 3-field S

        std::string  echo;           // P/Q: bytes after the tag, echoed verbatim
        uint64_t     pingSeq = 0;
        int64_t      pingSentMs = 0;

        std::vector<uint8_t> pcm;
    };

    // Returns nullopt for anything short, untagged or structurally invalid.
    std::optional<VoiceDatagram> ParseVoiceDatagram(const uint8_t* data, size_t len);

    std::vector<uint8_t> BuildJoin(const std::string& login, const std::string& token);
    std::vector<uint8_t> BuildRoomJoin(const std::string& login, const std::string& token, int64_t roomId);
    std::vector<uint8_t> BuildRoomLeave(const std::string& login, int64_t roomId);
    std::vector<uint8_t> BuildPair(const std::string& sender, const std::string& token,
        const std::string& userA, const std::string& userB, bool on);
    std::vector<uint8_t> BuildPing(uint64_t seq, int64_t sentMs);
    std::vector<uint8_t> BuildPong(const std::string& echo);
    std::vector<uint8_t> BuildAudio(const std::string& from, const uint8_t* pcm, size_t len);
    std::vector<uint8_t> BuildRelayed(const std::string& from, const uint8_t* pcm, size_t len);

} // namespace Parley
