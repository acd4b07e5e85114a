#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include "crypto.hpp"
#include "transform.hpp"

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

// Throws KeyResolutionError when the variable is unset or empty.
std::string resolve_key(const std::string& env_name, const EnvLookup& env);

struct StoreConfig {
    std::string path;
    std::string key_decl_name;
    std::string fallback_key_env;
};

// Read-all / transform / write-all over one secrets file. Nothing is written
// unless the transformation completed.
class SecretsStore {
public:
    SecretsStore(StoreConfig cfg, const SecretCipher& cipher, EnvLookup env);

    std::vector<FileLine> load() const;
    std::vector<std::string> list() const;
    // Declared env name, or the configured fallback. Throws ConfigError when neither exists.
    std::string key_env_name(const std::vector<FileLine>& lines) const;

    EncryptResult encrypt_all() const;
    DecryptResult decrypt_all() const;
    bool remove(const std::string& name) const;
    bool set_key_env(const std::string& env_name) const;
    ConvertResult convert(const std::string& old_env, const std::string& new_env) const;

    // Creates a new file with the header block; refuses to overwrite.
    void init(const std::string& env_name) const;

private:
    void save(const std::vector<FileLine>& lines) const;

    StoreConfig cfg_;
    const SecretCipher& cipher_;
    EnvLookup env_;
};
