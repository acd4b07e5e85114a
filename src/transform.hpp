#pragma once
#include <string>
#include <vector>
#include <optional>
#include "secrets_file.hpp"
#include "crypto.hpp"

// Pure line-sequence operations. Nothing here touches the filesystem or the
// environment; keys and timestamps come in as arguments. Every operation
// either returns a complete new sequence or throws before producing one.

struct EncryptResult {
    std::vector<FileLine> lines;
    std::vector<std::string> encrypted;  // names newly encrypted
    std::vector<std::string> skipped;    // names holding a value but already backed by _ENCRYPTED
};

struct DecryptResult {
    std::vector<FileLine> lines;
    std::vector<std::string> decrypted;
    std::vector<std::string> unsigned_names;  // decrypted without metadata to verify
};

struct ConvertResult {
    std::vector<FileLine> lines;
    std::vector<std::string> converted;
    std::vector<std::string> unsigned_names;  // re-signed without a prior signature to verify
};

std::vector<std::string> list_secrets(const std::vector<FileLine>& lines);

EncryptResult encrypt_all(const std::vector<FileLine>& lines, const SecretCipher& cipher,
                          const std::string& key, const std::string& key_env_name,
                          const std::string& timestamp);

DecryptResult decrypt_all(const std::vector<FileLine>& lines, const SecretCipher& cipher,
                          const std::string& key);

// name may be X or X_ENCRYPTED; both lines of the pair go.
// Returns the number of removed lines; 0 means name was not declared.
size_t delete_secret(std::vector<FileLine>& lines, const std::string& name);

// Returns false, leaving lines untouched, when there is no key declaration.
bool set_key_declaration(std::vector<FileLine>& lines, const std::string& env_name);

ConvertResult convert_key(const std::vector<FileLine>& lines, const SecretCipher& cipher,
                          const std::string& old_key, const std::string& new_key,
                          const std::string& new_env_name, const std::string& timestamp);

std::optional<std::string> find_key_declaration(const std::vector<FileLine>& lines);

void ensure_disclaimer(std::vector<FileLine>& lines);
