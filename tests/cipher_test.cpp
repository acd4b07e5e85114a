#include "crypto.hpp"
#include "errors.hpp"
#include <gtest/gtest.h>

namespace {

// Test vector from the Fernet specification.
const std::string kVectorKey = "cw_0x689RpI-jtRR7oE8h_eQsKImvJapLeSbXpwF4e4=";
const std::string kVectorToken =
    "gAAAAAAdwJ6wAAECAwQFBgcICQoLDA0ODy021cpGVWKZ_eEwCGM4BLLF_5CV9dOPmrhuVUPgJobwOz7JcbmrR64jVmpU4IwqDA==";

} // namespace

TEST(FernetCipher, DecryptsReferenceVector) {
    FernetCipher c;
    EXPECT_EQ(c.decrypt(kVectorToken, kVectorKey), "hello");
}

TEST(FernetCipher, RoundTrip) {
    FernetCipher c;
    std::string key = FernetCipher::generate_key();
    for (const std::string v: {"x", "bar", "0123456789abcdef", "p@ss w0rd with spaces and ünïcode"}) {
        std::string token = c.encrypt(v, key);
        EXPECT_NE(token, v);
        EXPECT_EQ(c.decrypt(token, key), v);
    }
}

TEST(FernetCipher, TokensAreRandomized) {
    FernetCipher c;
    std::string key = FernetCipher::generate_key();
    EXPECT_NE(c.encrypt("same", key), c.encrypt("same", key));
}

TEST(FernetCipher, GeneratedKeyShape) {
    std::string key = FernetCipher::generate_key();
    EXPECT_EQ(key.size(), 44u);
    EXPECT_EQ(key.back(), '=');
    EXPECT_EQ(key.find_first_of("+/"), std::string::npos);
    EXPECT_EQ(base64url_decode(key).size(), 32u);
}

TEST(FernetCipher, WrongKeyFails) {
    FernetCipher c;
    std::string token = c.encrypt("bar", FernetCipher::generate_key());
    EXPECT_THROW(c.decrypt(token, FernetCipher::generate_key()), CryptoError);
}

TEST(FernetCipher, MalformedKeyFails) {
    FernetCipher c;
    EXPECT_THROW(c.encrypt("bar", "supersecretkey"), CryptoError);
    EXPECT_THROW(c.encrypt("bar", "c2hvcnQ="), CryptoError);
    EXPECT_THROW(c.decrypt(kVectorToken, "not*base64*at*all!!!"), CryptoError);
}

TEST(FernetCipher, CorruptedTokenFails) {
    FernetCipher c;
    std::string token = kVectorToken;
    token[20] = token[20] == 'A' ? 'B' : 'A';
    EXPECT_THROW(c.decrypt(token, kVectorKey), CryptoError);
    EXPECT_THROW(c.decrypt("gAAAAA==", kVectorKey), CryptoError);
    EXPECT_THROW(c.decrypt("", kVectorKey), CryptoError);
}

TEST(FernetCipher, RefusesEmptyPlaintext) {
    FernetCipher c;
    EXPECT_THROW(c.encrypt("", FernetCipher::generate_key()), CryptoError);
}

TEST(Base64, UrlSafeDecodeValidates) {
    EXPECT_EQ(base64url_decode("aGVsbG8="), "hello");
    EXPECT_THROW(base64url_decode("aGVsbG8"), CryptoError);
    EXPECT_THROW(base64url_decode("aGV=bG8="), CryptoError);
    EXPECT_THROW(base64url_decode("aGVs+G8="), CryptoError);
}
