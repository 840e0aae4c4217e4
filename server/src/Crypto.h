#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Parley {

    using Sha256Digest = std::array<uint8_t, 32>;

    Sha256Digest Sha256(const uint8_t* data, size_t len);
    Sha256Digest HmacSha256(const uint8_t* key, size_t keyLen, const uint8_t* msg, size_t msgLen);
    std::vector<uint8_t> Pbkdf2Sha256(const std::string& password, const uint8_t* salt, size_t saltLen,
        int iterations, size_t dkLen);

    std::string Base64Encode(const uint8_t* data, size_t len);
    bool Base64Decode(const std::string& in, std::vector<uint8_t>& out);
    std::string Base64UrlEncode(const uint8_t* data, size_t len);   // unpadded
    std::string BytesToHex(const uint8_t* data, size_t len);

    std::vector<uint8_t> RandomBytes(size_t n);

    // 32 random bytes, base64url (43 characters).
    std::string GenerateSessionToken();

    // "pbkdf2_sha256$<iterations>$<salt b64>$<hash b64>"
    std::string HashPassword(const std::string& password, int iterations);

    // Accepts the PBKDF2 format and legacy plaintext rows. needsUpgrade is set
    // when a plaintext row matched and should be rewritten as a hash.
    bool VerifyPassword(const std::string& password, const std::string& stored, bool* needsUpgrade = nullptr);

    bool ConstantTimeEquals(const std::string& a, const std::string& b);

} // namespace Parley
