#pragma once
#include <string>
#include "secrets_file.hpp"

static const char* const kDefaultConfigPath = "secman.json";
static const char* const kDefaultSecretsFile = "project_secrets.txt";

struct AppCfg {
    std::string secrets_file = kDefaultSecretsFile;
    std::string key_decl_name = kDefaultKeyDeclName;
    std::string key_env_name;  // fallback when the secrets file has no key declaration
};

// Throws ConfigError on unreadable or malformed JSON.
AppCfg load_cfg(const std::string& path);
AppCfg parse_cfg(const std::string& json);
