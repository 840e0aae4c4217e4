#include "Crypto.h"
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <random>
#include <stdexcept>

namespace Parley {

    namespace {

        constexpr char kPbkdf2Prefix[] = "pbkdf2_sha256";
        constexpr char kBase64Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr size_t kSaltSize = 16;
        constexpr size_t kDerivedKeySize = 32;

        constexpr uint32_t K[64] = {
            0x428a2f98,0x71374491,0xb5c0fbcf,0xe9b5dba5,0x3956c25b,0x59f111f1,0x923f82a4,0xab1c5ed5,
            0xd807aa98,0x12835b01,0x243185be,0x550c7dc3,0x72be5d74,0x80deb1fe,0x9bdc06a7,0xc19bf174,
            0xe49b69c1,0xefbe4786,0x0fc19dc6,0x240ca1cc,0x2de92c6f,0x4a7484aa,0x5cb0a9dc,0x76f988da,
            0x983e5152,0xa831c66d,0xb00327c8,0xbf597fc7,0xc6e00bf3,0xd5a79147,0x06ca6351,0x14292967,
            0x27b70a85,0x2e1b2138,0x4d2c6dfc,0x53380d13,0x650a7354,0x766a0abb,0x81c2c92e,0x92722c85,
            0xa2bfe8a1,0xa81a664b,0xc24b8b70,0xc76c51a3,0xd192e819,0xd6990624,0xf40e3585,0x106aa070,
            0x19a4c116,0x1e376c08,0x2748774c,0x34b0bcb5,0x391c0cb3,0x4ed8aa4a,0x5b9cca4f,0x682e6ff3,
            0x748f82ee,0x78a5636f,0x84c87814,0x8cc70208,0x90befffa,0xa4506ceb,0xbef9a3f7,0xc67178f2,
        };

        int Base64Value(char c) {
            if (c >= 'A' && c <= 'Z') return c - 'A';
            if (c >= 'a' && c <= 'z') return c - 'a' + 26;
            if (c >= '0' && c <= '9') return c - '0' + 52;
            if (c == '+' || c == '-') return 62;
            if (c == '/' || c == '_') return 63;
            return -1;
        }

    } // namespace

    Sha256Digest Sha256(const uint8_t* data, size_t len) {
        uint32_t H[8] = { 0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19 };
        uint8_t block[64];
        size_t i = 0;
        auto rotr = [](uint32_t x, int n) { return (x >> n) | (x << (32 - n)); };
        auto step = [&](const uint8_t* blk) {
            uint32_t W[64];
            for (int t = 0; t < 16; ++t)
                W[t] = (uint32_t)blk[t * 4] << 24 | (uint32_t)blk[t * 4 + 1] << 16 | (uint32_t)blk[t * 4 + 2] << 8 | blk[t * 4 + 3];
            for (int t = 16; t < 64; ++t) {
                uint32_t s0 = rotr(W[t - 15], 7) ^ rotr(W[t - 15], 18) ^ (W[t - 15] >> 3);
                uint32_t s1 = rotr(W[t - 2], 17) ^ rotr(W[t - 2], 19) ^ (W[t - 2] >> 10);
                W[t] = W[t - 16] + s0 + W[t - 7] + s1;
            }
            uint32_t a = H[0], b = H[1], c = H[2], d = H[3], e = H[4], f = H[5], g = H[6], h = H[7];
            for (int t = 0; t < 64; ++t) {
                uint32_t S1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
                uint32_t ch = (e & f) ^ ((~e) & g);
                uint32_t t1 = h + S1 + ch + K[t] + W[t];
                uint32_t S0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
                uint32_t maj = (a & b) ^ (a & c) ^ (b & c);
                uint32_t t2 = S0 + maj;
                h = g; g = f; f = e; e = d + t1; d = c; c = b; b = a; a = t1 + t2;
            }
            H[0] += a; H[1] += b; H[2] += c; H[3] += d; H[4] += e; H[5] += f; H[6] += g; H[7] += h;
            };
        while (i + 64 <= len) { step(data + i); i += 64; }
        std::memset(block, 0, sizeof(block));
        if (len > i) std::memcpy(block, data + i, len - i);
        block[len - i] = 0x80;
        if (len - i >= 56) { step(block); std::memset(block, 0, sizeof(block)); }
        const uint64_t bits = static_cast<uint64_t>(len) * 8;
        for (int j = 0; j < 8; ++j) block[63 - j] = (uint8_t)(bits >> (j * 8));
        step(block);

        Sha256Digest out{};
        for (int j = 0; j < 8; ++j) {
            out[j * 4 + 0] = (uint8_t)(H[j] >> 24);
            out[j * 4 + 1] = (uint8_t)(H[j] >> 16);
            out[j * 4 + 2] = (uint8_t)(H[j] >> 8);
            out[j * 4 + 3] = (uint8_t)(H[j]);
        }
        return out;
    }

    Sha256Digest HmacSha256(const uint8_t* key, size_t keyLen, const uint8_t* msg, size_t msgLen) {
        uint8_t block[64]{};
        if (keyLen > 64) {
            const Sha256Digest kh = Sha256(key, keyLen);
            std::memcpy(block, kh.data(), kh.size());
        }
        else if (keyLen > 0) {
            std::memcpy(block, key, keyLen);
        }

        std::vector<uint8_t> inner(64 + msgLen);
        for (int i = 0; i < 64; ++i) inner[i] = block[i] ^ 0x36;
        if (msgLen > 0) std::memcpy(inner.data() + 64, msg, msgLen);
        const Sha256Digest innerHash = Sha256(inner.data(), inner.size());

        uint8_t outer[64 + 32];
        for (int i = 0; i < 64; ++i) outer[i] = block[i] ^ 0x5c;
        std::memcpy(outer + 64, innerHash.data(), innerHash.size());
        return Sha256(outer, sizeof(outer));
    }

    std::vector<uint8_t> Pbkdf2Sha256(const std::string& password, const uint8_t* salt, size_t saltLen,
        int iterations, size_t dkLen)
    {
        if (iterations < 1) throw std::invalid_argument("pbkdf2 iterations must be positive");
        const auto* pw = reinterpret_cast<const uint8_t*>(password.data());
        std::vector<uint8_t> out;
        out.reserve(dkLen);

        std::vector<uint8_t> saltBlock(salt, salt + saltLen);
        saltBlock.resize(saltLen + 4);
        for (uint32_t blockIndex = 1; out.size() < dkLen; ++blockIndex) {
            saltBlock[saltLen + 0] = (uint8_t)(blockIndex >> 24);
            saltBlock[saltLen + 1] = (uint8_t)(blockIndex >> 16);
            saltBlock[saltLen + 2] = (uint8_t)(blockIndex >> 8);
            saltBlock[saltLen + 3] = (uint8_t)(blockIndex);

            Sha256Digest u = HmacSha256(pw, password.size(), saltBlock.data(), saltBlock.size());
            Sha256Digest t = u;
            for (int it = 1; it < iterations; ++it) {
                u = HmacSha256(pw, password.size(), u.data(), u.size());
                for (size_t k = 0; k < t.size(); ++k) t[k] ^= u[k];
            }
            const size_t take = std::min(t.size(), dkLen - out.size());
            out.insert(out.end(), t.begin(), t.begin() + static_cast<std::ptrdiff_t>(take));
        }
        return out;
    }

    std::string Base64Encode(const uint8_t* data, size_t len) {
        std::string s;
        s.reserve(((len + 2) / 3) * 4);
        size_t i = 0;
        for (; i + 3 <= len; i += 3) {
            const uint32_t v = (uint32_t)data[i] << 16 | (uint32_t)data[i + 1] << 8 | data[i + 2];
            s += kBase64Alphabet[(v >> 18) & 63];
            s += kBase64Alphabet[(v >> 12) & 63];
            s += kBase64Alphabet[(v >> 6) & 63];
            s += kBase64Alphabet[v & 63];
        }
        if (len - i == 1) {
            const uint32_t v = (uint32_t)data[i] << 16;
            s += kBase64Alphabet[(v >> 18) & 63];
            s += kBase64Alphabet[(v >> 12) & 63];
            s += "==";
        }
        else if (len - i == 2) {
            const uint32_t v = (uint32_t)data[i] << 16 | (uint32_t)data[i + 1] << 8;
            s += kBase64Alphabet[(v >> 18) & 63];
            s += kBase64Alphabet[(v >> 12) & 63];
            s += kBase64Alphabet[(v >> 6) & 63];
            s += '=';
        }
        return s;
    }

    bool Base64Decode(const std::string& in, std::vector<uint8_t>& out) {
        out.clear();
        uint32_t buffer = 0;
        int bits = 0;
        for (char c : in) {
            if (c == '=') break;
            const int v = Base64Value(c);
            if (v < 0) return false;
            buffer = (buffer << 6) | static_cast<uint32_t>(v);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.push_back((uint8_t)(buffer >> bits));
                buffer &= (1u << bits) - 1u;
            }
        }
        return true;
    }

    std::string Base64UrlEncode(const uint8_t* data, size_t len) {
        std::string s = Base64Encode(data, len);
        while (!s.empty() && s.back() == '=') s.pop_back();
        for (char& c : s) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        return s;
    }

    std::string BytesToHex(const uint8_t* buf, size_t n) {
        static const char hex[] = "0123456789abcdef";
        std::string s; s.reserve(n * 2);
        for (size_t i = 0; i < n; ++i) { s += hex[buf[i] >> 4]; s += hex[buf[i] & 15]; }
        return s;
    }

    std::vector<uint8_t> RandomBytes(size_t n) {
        // random_device reads the OS entropy source on every call.
        std::random_device rd;
        std::vector<uint8_t> out(n);
        for (size_t i = 0; i < n; i += 4) {
            const uint32_t v = rd();
            for (size_t k = 0; k < 4 && i + k < n; ++k)
                out[i + k] = (uint8_t)(v >> (k * 8));
        }
        return out;
    }

    std::string GenerateSessionToken() {
        const auto bytes = RandomBytes(32);
        return Base64UrlEncode(bytes.data(), bytes.size());
    }

    std::string HashPassword(const std::string& password, int iterations) {
        const auto salt = RandomBytes(kSaltSize);
        const auto dk = Pbkdf2Sha256(password, salt.data(), salt.size(), iterations, kDerivedKeySize);
        return std::string(kPbkdf2Prefix) + "$" + std::to_string(iterations) + "$"
            + Base64Encode(salt.data(), salt.size()) + "$" + Base64Encode(dk.data(), dk.size());
    }

    bool VerifyPassword(const std::string& password, const std::string& stored, bool* needsUpgrade) {
        if (needsUpgrade) *needsUpgrade = false;
        if (stored.empty()) return false;

        const std::string prefix = std::string(kPbkdf2Prefix) + "$";
        if (stored.compare(0, prefix.size(), prefix) != 0) {
            const bool ok = ConstantTimeEquals(password, stored);
            if (ok && needsUpgrade) *needsUpgrade = true;
            return ok;
        }

        const size_t p1 = prefix.size();
        const size_t p2 = stored.find('$', p1);
        if (p2 == std::string::npos) return false;
        const size_t p3 = stored.find('$', p2 + 1);
        if (p3 == std::string::npos) return false;

        int iterations = 0;
        try {
            iterations = std::stoi(stored.substr(p1, p2 - p1));
        }
        catch (const std::exception&) {
            return false;
        }
        if (iterations < 1) return false;

        std::vector<uint8_t> salt, expected;
        if (!Base64Decode(stored.substr(p2 + 1, p3 - p2 - 1), salt)) return false;
        if (!Base64Decode(stored.substr(p3 + 1), expected) || expected.empty()) return false;

        const auto dk = Pbkdf2Sha256(password, salt.data(), salt.size(), iterations, expected.size());
        return ConstantTimeEquals(std::string(dk.begin(), dk.end()),
            std::string(expected.begin(), expected.end()));
    }

    bool ConstantTimeEquals(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        volatile unsigned char diff = 0;
        for (size_t i = 0; i < a.size(); ++i) diff |= (unsigned char)a[i] ^ (unsigned char)b[i];
        return diff == 0;
    }

} // namespace Parley
