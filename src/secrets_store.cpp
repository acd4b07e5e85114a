#include "secrets_store.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cstdlib>
#include <utility>

static const char* const kFileHeader =
    "#\n"
    "#  SECRET KEYS file\n"
    "#\n"
    "#  Generated by secman\n"
    "#  Do not edit this file manually, unless you know what you are doing\n"
    "#  Remember to keep copies of your secrets in a safe place\n"
    "#\n"
    "#  Note:\n"
    "#    lines not processed by secman will be those starting with \"#\"\n"
    "#    or empty lines\n"
    "#\n";

EnvLookup process_env(){
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

std::string resolve_key(const std::string& env_name, const EnvLookup& env){
    if (env_name.empty())
        throw KeyResolutionError("name of the environment variable which holds the master key is empty");
    auto v = env(env_name);
    if (!v || v->empty())
        throw KeyResolutionError(env_name + " is empty. Set the key value in the variable first");
    return *v;
}

SecretsStore::SecretsStore(StoreConfig cfg, const SecretCipher& cipher, EnvLookup env)
    : cfg_(std::move(cfg)), cipher_(cipher), env_(std::move(env)) {}

std::vector<FileLine> SecretsStore::load() const {
    return parse_secrets(read_file(cfg_.path), cfg_.key_decl_name);
}

void SecretsStore::save(const std::vector<FileLine>& lines) const {
    write_file(cfg_.path, render_secrets(lines));
}

std::vector<std::string> SecretsStore::list() const {
    return list_secrets(load());
}

std::string SecretsStore::key_env_name(const std::vector<FileLine>& lines) const {
    auto declared = find_key_declaration(lines);
    if (declared && !declared->empty()) return *declared;
    if (!cfg_.fallback_key_env.empty()) return cfg_.fallback_key_env;
    throw ConfigError(cfg_.path + ": no " + cfg_.key_decl_name +
        " declaration. Set name of the environment variable which holds the master key");
}

EncryptResult SecretsStore::encrypt_all() const {
    auto lines = load();
    std::string env_name = key_env_name(lines);
    std::string key = resolve_key(env_name, env_);
    EncryptResult r = ::encrypt_all(lines, cipher_, key, env_name, now_timestamp());
    save(r.lines);
    return r;
}

DecryptResult SecretsStore::decrypt_all() const {
    auto lines = load();
    std::string key = resolve_key(key_env_name(lines), env_);
    DecryptResult r = ::decrypt_all(lines, cipher_, key);
    save(r.lines);
    return r;
}

bool SecretsStore::remove(const std::string& name) const {
    auto lines = load();
    if (!delete_secret(lines, name)) return false;
    save(lines);
    return true;
}

bool SecretsStore::set_key_env(const std::string& env_name) const {
    auto lines = load();
    if (!set_key_declaration(lines, env_name)) return false;
    save(lines);
    return true;
}

ConvertResult SecretsStore::convert(const std::string& old_env, const std::string& new_env) const {
    auto lines = load();
    std::string old_key = resolve_key(old_env, env_);
    std::string new_key = resolve_key(new_env, env_);
    ConvertResult r = convert_key(lines, cipher_, old_key, new_key, new_env, now_timestamp());
    save(r.lines);
    return r;
}

void SecretsStore::init(const std::string& env_name) const {
    if (file_exists(cfg_.path)) throw ConfigError(cfg_.path + " already exists");
    if (!env_name.empty() && !is_identifier(env_name))
        throw ConfigError("invalid key environment variable name: '" + env_name + "'");
    std::string text = std::string(kHeaderDisclaimer) + "\n" + kFileHeader + "\n"
                     + format_plain(cfg_.key_decl_name, env_name) + "\n";
    write_file(cfg_.path, text);
}
