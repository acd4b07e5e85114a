#include "signature.hpp"
#include <gtest/gtest.h>

TEST(Signature, KnownValue) {
    // base64(sha256("abc" "2024-06-18 10:00:00" "APP_KEY")), last 8 characters
    EXPECT_EQ(sign_secret("abc", "2024-06-18 10:00:00", "APP_KEY"), "9PbL8sc=");
}

TEST(Signature, VerifiesOwnOutput) {
    std::string sig = sign_secret("gAAAAtoken", "2024-06-18 10:00:00", "APP_KEY");
    EXPECT_EQ(sig.size(), kSignatureLen);
    EXPECT_TRUE(verify_signature(sig, "gAAAAtoken", "2024-06-18 10:00:00", "APP_KEY"));
}

TEST(Signature, AnyChangedInputFailsVerification) {
    std::string sig = sign_secret("gAAAAtoken", "2024-06-18 10:00:00", "APP_KEY");
    EXPECT_FALSE(verify_signature(sig, "gAAAAtokem", "2024-06-18 10:00:00", "APP_KEY"));
    EXPECT_FALSE(verify_signature(sig, "gAAAAtoken", "2024-06-18 10:00:01", "APP_KEY"));
    EXPECT_FALSE(verify_signature(sig, "gAAAAtoken", "2024-06-18 10:00:00", "OTHER_KEY"));
}

TEST(Signature, DependsOnCiphertextNotOnlyKeyName) {
    EXPECT_NE(sign_secret("token-one", "2024-06-18 10:00:00", "APP_KEY"),
              sign_secret("token-two", "2024-06-18 10:00:00", "APP_KEY"));
}

TEST(Signature, RejectsWrongLength) {
    std::string sig = sign_secret("c", "t", "K");
    EXPECT_FALSE(verify_signature(sig + "x", "c", "t", "K"));
    EXPECT_FALSE(verify_signature("", "c", "t", "K"));
}
