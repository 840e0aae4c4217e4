#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace Parley {

    // Control channel framing: 4-byte big-endian length followed by a UTF-8 JSON
    // body. A connection that opens with '{' or '[' is a legacy unprefixed client.
    enum class FramePrefix { Length, LegacyJson, Invalid };

    struct FramePrefixInfo {
        FramePrefix kind = FramePrefix::Invalid;
        uint32_t    length = 0;
    };

    // head must point at kFramePrefixSize bytes.
    FramePrefixInfo ClassifyFramePrefix(const uint8_t* head);

    bool IsLegacyJsonStart(uint8_t first);

    std::vector<uint8_t> EncodeControlFrame(const std::string& body);

} // namespace Parley
