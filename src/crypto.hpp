#pragma once
#include <string>
#include <vector>

// Symmetric cipher used for secret values. Implementations throw CryptoError.
class SecretCipher {
public:
    virtual ~SecretCipher() = default;
    virtual std::string encrypt(const std::string& plaintext, const std::string& key) const = 0;
    virtual std::string decrypt(const std::string& token, const std::string& key) const = 0;
};

// Fernet: key is url-safe base64 of 32 bytes (16 signing + 16 AES-128 key),
// token is url-safe base64 of 0x80 | be64 ts | iv(16) | AES-128-CBC ct | HMAC-SHA256.
class FernetCipher : public SecretCipher {
public:
    std::string encrypt(const std::string& plaintext, const std::string& key) const override;
    std::string decrypt(const std::string& token, const std::string& key) const override;

    static std::string generate_key();
};

std::string base64_encode(const std::string& in);
std::string base64_decode(const std::string& in);
std::string base64url_encode(const std::string& in);
// Throws CryptoError on characters outside the url-safe alphabet.
std::string base64url_decode(const std::string& in);

std::string sha256(const std::string& in);
