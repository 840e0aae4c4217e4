#include <gtest/gtest.h>
#include "../server/src/Crypto.h"
#include <string>

using namespace Parley;

namespace {
    const uint8_t* Bytes(const std::string& s) { return reinterpret_cast<const uint8_t*>(s.data()); }
}

TEST(Crypto, Sha256KnownVector) {
    const std::string msg = "abc";
    const auto d = Sha256(Bytes(msg), msg.size());
    EXPECT_EQ(BytesToHex(d.data(), d.size()),
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Crypto, HmacSha256KnownVector) {
    const std::string key = "Jefe";
    const std::string msg = "what do ya want for nothing?";
    const auto d = HmacSha256(Bytes(key), key.size(), Bytes(msg), msg.size());
    EXPECT_EQ(BytesToHex(d.data(), d.size()),
        "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(Crypto, Pbkdf2KnownVector) {
    const std::string salt = "salt";
    const auto dk = Pbkdf2Sha256("password", Bytes(salt), salt.size(), 1, 32);
    EXPECT_EQ(BytesToHex(dk.data(), dk.size()),
        "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
}

TEST(Crypto, Base64) {
    const std::string s = "foobar";
    EXPECT_EQ(Base64Encode(Bytes(s), 6), "Zm9vYmFy");
    EXPECT_EQ(Base64Encode(Bytes(s), 2), "Zm8=");
    std::vector<uint8_t> out;
    ASSERT_TRUE(Base64Decode("Zm8=", out));
    EXPECT_EQ(std::string(out.begin(), out.end()), "fo");
    EXPECT_FALSE(Base64Decode("Zm8*", out));
}

TEST(Crypto, SessionTokensAreUrlSafeAndDistinct) {
    const std::string a = GenerateSessionToken();
    const std::string b = GenerateSessionToken();
    EXPECT_EQ(a.size(), 43u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a.find_first_of("+/="), std::string::npos);
}

TEST(Crypto, HashedPasswordVerifies) {
    const std::string stored = HashPassword("hunter2", 1000);
    EXPECT_EQ(stored.rfind("pbkdf2_sha256$1000$", 0), 0u);
    bool upgrade = true;
    EXPECT_TRUE(VerifyPassword("hunter2", stored, &upgrade));
    EXPECT_FALSE(upgrade);
    EXPECT_FALSE(VerifyPassword("hunter3", stored));
    EXPECT_NE(HashPassword("hunter2", 1000), stored);
}

TEST(Crypto, PlaintextRowsVerifyAndRequestUpgrade) {
    bool upgrade = false;
    EXPECT_TRUE(VerifyPassword("secret", "secret", &upgrade));
    EXPECT_TRUE(upgrade);
    EXPECT_FALSE(VerifyPassword("secret", "Secret", &upgrade));
    EXPECT_FALSE(upgrade);
    EXPECT_FALSE(VerifyPassword("", ""));
}

TEST(Crypto, CorruptHashIsRejected) {
    EXPECT_FALSE(VerifyPassword("x", "pbkdf2_sha256$abc$AAAA$AAAA"));
    EXPECT_FALSE(VerifyPassword("x", "pbkdf2_sha256$1000$AAAA"));
    EXPECT_FALSE(VerifyPassword("x", "pbkdf2_sha256$0$AAAA$AAAA"));
}
