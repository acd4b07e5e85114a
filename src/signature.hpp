#pragma once
#include <cstddef>
#include <string>

static const size_t kSignatureLen = 8;

// Last 8 chars of base64(SHA-256(ciphertext + timestamp + key_env_name)).
std::string sign_secret(const std::string& ciphertext, const std::string& timestamp, const std::string& key_env_name);

bool verify_signature(const std::string& signature, const std::string& ciphertext,
                      const std::string& timestamp, const std::string& key_env_name);
