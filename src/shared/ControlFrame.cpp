#include "ControlFrame.h"
#include "Protocol.h"
#include <cstring>

namespace Parley {

    bool IsLegacyJsonStart(uint8_t first) {
        return first == '{' || first == '[';
    }

    FramePrefixInfo ClassifyFramePrefix(const uint8_t* head) {
        FramePrefixInfo info;
        if (IsLegacyJsonStart(head[0])) {
            info.kind = FramePrefix::LegacyJson;
            return info;
        }
        const uint32_t len = ReadU32BE(head);
        if (len == 0 || len > kMaxControlFrame) return info;
        info.kind = FramePrefix::Length;
        info.length = len;
        return info;
    }

    std::vector<uint8_t> EncodeControlFrame(const std::string& body) {
        std::vector<uint8_t> out(kFramePrefixSize + body.size());
        WriteU32BE(out.data(), static_cast<uint32_t>(body.size()));
        if (!body.empty()) std::memcpy(out.data() + kFramePrefixSize, body.data(), body.size());
        return out;
    }

} // namespace Parley
