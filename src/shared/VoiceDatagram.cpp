#include "VoiceDatagram.h"
#include "Protocol.h"
#include <cerrno>
#include <cstdlib>

namespace Parley {

    namespace {

        std::vector<std::string> SplitFields(const char* begin, const char* end) {
            std::vector<std::string> out;
            const char* start = begin;
            for (const char* p = begin; p != end; ++p) {
                if (*p == kUdpSeparator) {
                    out.emplace_back(start, p);
                    start = p + 1;
                }
            }
            out.emplace_back(start, end);
            return out;
        }

        bool ParseInt64(const std::string& s, int64_t& out) {
            if (s.empty()) return false;
            char* endp = nullptr;
            errno = 0;
            const long long v = std::strtoll(s.c_str(), &endp, 10);
            if (errno != 0 || endp != s.c_str() + s.size()) return false;
            out = static_cast<int64_t>(v);
            return true;
        }

        bool ParseFlag(const std::string& s, bool& out) {
            if (s == "1") { out = true; return true; }
            if (s == "0") { out = false; return true; }
            return false;
        }

        // "seq|send_time"; both numeric.
        bool ParsePingBody(const std::string& echo, VoiceDatagram& d) {
            const auto fields = SplitFields(echo.data(), echo.data() + echo.size());
            if (fields.size() != 2) return false;
            int64_t seq = 0;
            if (!ParseInt64(fields[0], seq) || seq < 0) return false;
            if (!ParseInt64(fields[1], d.pingSentMs)) return false;
            d.pingSeq = static_cast<uint64_t>(seq);
            return true;
        }

        std::vector<uint8_t> BuildText(char tag, const std::string& body) {
            std::vector<uint8_t> out;
            out.reserve(2 + body.size());
            out.push_back(static_cast<uint8_t>(tag));
            out.push_back(static_cast<uint8_t>(kUdpSeparator));
            out.insert(out.end(), body.begin(), body.end());
            return out;
        }

        std::vector<uint8_t> BuildMedia(char tag, const std::string& from, const uint8_t* pcm, size_t len) {
            std::vector<uint8_t> out;
            out.reserve(3 + from.size() + len);
            out.push_back(static_cast<uint8_t>(tag));
            out.push_back(static_cast<uint8_t>(kUdpSeparator));
            out.insert(out.end(), from.begin(), from.end());
            out.push_back(static_cast<uint8_t>(kUdpSeparator));
            if (len > 0) out.insert(out.end(), pcm, pcm + len);
            return out;
        }

    } // namespace

    std::optional<VoiceDatagram> ParseVoiceDatagram(const uint8_t* data, size_t len) {
        if (!data || len < 3 || data[1] != static_cast<uint8_t>(kUdpSeparator))
            return std::nullopt;

        const char tag = static_cast<char>(data[0]);
        const char* body = reinterpret_cast<const char*>(data + 2);
        const char* end = reinterpret_cast<const char*>(data + len);
        VoiceDatagram d;

        // Media frames: only the sender field is text, the rest is raw PCM.
        if (tag == kUdpAudio || tag == kUdpRelayed) {
            const char* sep = body;
            while (sep != end && *sep != kUdpSeparator) ++sep;
            if (sep == end || sep == body) return std::nullopt;
            d.type = (tag == kUdpAudio) ? DatagramType::Audio : DatagramType::Relayed;
            d.login.assign(body, sep);
            d.pcm.assign(reinterpret_cast<const uint8_t*>(sep + 1), data + len);
            if (d.pcm.empty()) return std::nullopt;
            return d;
        }

        if (tag == kUdpPing || tag == kUdpPong) {
            d.type = (tag == kUdpPing) ? DatagramType::Ping : DatagramType::Pong;
            d.echo.assign(body, end);
            // The relay echoes pings verbatim; only the client needs the numbers.
            if (!ParsePingBody(d.echo, d) && d.type == DatagramType::Pong) return std::nullopt;
            return d;
        }

        const auto f = SplitFields(body, end);
        switch (tag) {
        case kUdpJoin:
            if (f.size() > 2 || f[0].empty()) return std::nullopt;
            d.type = DatagramType::Join;
            d.login = f[0];
            if (f.size() == 2) d.token = f[1];
            d.legacy = d.token.empty();
            return d;

        case kUdpRoomJoin:
            if (f.size() != 3 || f[0].empty() || f[1].empty()) return std::nullopt;
            d.type = DatagramType::RoomJoin;
            d.login = f[0];
            d.token = f[1];
            if (!ParseInt64(f[2], d.roomId) || d.roomId <= 0) return std::nullopt;
            return d;

        case kUdpRoomLeave:
            if (f.size() != 2 || f[0].empty()) return std::nullopt;
            d.type = DatagramType::RoomLeave;
            d.login = f[0];
            if (!ParseInt64(f[1], d.roomId) || d.roomId <= 0) return std::nullopt;
            return d;

        case kUdpPair:
            d.type = DatagramType::Pair;
            if (f.size() == 5) {
                if (f[0].empty() || f[1].empty()) return std::nullopt;
                d.login = f[0];
                d.token = f[1];
                d.userA = f[2];
                d.userB = f[3];
                if (!ParseFlag(f[4], d.pairOn)) return std::nullopt;
            }
            else if (f.size() == 3) {
                d.legacy = true;
                d.userA = f[0];
                d.userB = f[1];
                if (!ParseFlag(f[2], d.pairOn)) return std::nullopt;
            }
            else {
                return std::nullopt;
            }
            if (d.userA.empty() || d.userB.empty() || d.userA == d.userB) return std::nullopt;
            return d;

        default:
            return std::nullopt;
        }
    }

    std::vector<uint8_t> BuildJoin(const std::string& login, const std::string& token) {
        return BuildText(kUdpJoin, token.empty() ? login : login + kUdpSeparator + token);
    }

    std::vector<uint8_t> BuildRoomJoin(const std::string& login, const std::string& token, int64_t roomId) {
        return BuildText(kUdpRoomJoin, login + kUdpSeparator + token + kUdpSeparator + std::to_string(roomId));
    }

    std::vector<uint8_t> BuildRoomLeave(const std::string& login, int64_t roomId) {
        return BuildText(kUdpRoomLeave, login + kUdpSeparator + std::to_string(roomId));
    }

    std::vector<uint8_t> BuildPair(const std::string& sender, const std::string& token,
        const std::string& userA, const std::string& userB, bool on)
    {
        std::string body;
        if (!sender.empty()) body = sender + kUdpSeparator + token + kUdpSeparator;
        body += userA + kUdpSeparator + userB + kUdpSeparator + (on ? '1' : '0');
        return BuildText(kUdpPair, body);
    }

    std::vector<uint8_t> BuildPing(uint64_t seq, int64_t sentMs) {
        return BuildText(kUdpPing, std::to_string(seq) + kUdpSeparator + std::to_string(sentMs));
    }

    std::vector<uint8_t> BuildPong(const std::string& echo) {
        return BuildText(kUdpPong, echo);
    }

    std::vector<uint8_t> BuildAudio(const std::string& from, const uint8_t* pcm, size_t len) {
        return BuildMedia(kUdpAudio, from, pcm, len);
    }

    std::vector<uint8_t> BuildRelayed(const std::string& from, const uint8_t* pcm, size_t len) {
        return BuildMedia(kUdpRelayed, from, pcm, len);
    }

} // namespace Parley
