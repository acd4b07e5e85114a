#include "signature.hpp"
#include "crypto.hpp"
#include <openssl/crypto.h>

std::string sign_secret(const std::string& ciphertext, const std::string& timestamp, const std::string& key_env_name){
    std::string digest = base64_encode(sha256(ciphertext + timestamp + key_env_name));
    return digest.substr(digest.size() - kSignatureLen);
}

bool verify_signature(const std::string& signature, const std::string& ciphertext,
                      const std::string& timestamp, const std::string& key_env_name){
    if (signature.size() != kSignatureLen) return false;
    std::string expected = sign_secret(ciphertext, timestamp, key_env_name);
    return CRYPTO_memcmp(expected.data(), signature.data(), kSignatureLen) == 0;
}
