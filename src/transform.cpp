#include "transform.hpp"
#include "errors.hpp"
#include "signature.hpp"
#include "util.hpp"
#include <set>
#include <utility>

static std::set<std::string> encrypted_names(const std::vector<FileLine>& lines){
    // Any X_ENCRYPTED declaration counts, even one whose metadata failed to parse.
    std::set<std::string> out;
    std::string suffix = kEncryptedSuffix;
    for (const auto& l: lines) {
        if (l.kind == LineKind::SecretEncrypted) { out.insert(l.name); continue; }
        if (l.kind != LineKind::Unrecognized) continue;
        std::string n = declared_name(l);
        if (ends_with(n, suffix) && n.size() > suffix.size()) out.insert(n.substr(0, n.size() - suffix.size()));
    }
    return out;
}

// A secret may be declared once as X and once as X_ENCRYPTED.
static void check_unique_names(const std::vector<FileLine>& lines){
    std::set<std::string> seen;
    for (const auto& l: lines) {
        if (l.kind != LineKind::SecretPlain && l.kind != LineKind::SecretEncrypted) continue;
        if (!seen.insert(declared_name(l)).second)
            throw FormatError(declared_name(l) + " is declared more than once; remove the duplicate line first");
    }
}

static void check_signature(const FileLine& l){
    const SecretMetadata& m = *l.meta;
    if (!verify_signature(m.signature, l.value, m.timestamp, m.key_env_name))
        throw SignatureMismatchError("signature mismatch for " + l.name +
            ": the encrypted value or its metadata was modified, refusing to decrypt");
}

static std::string decrypt_record(const FileLine& l, const SecretCipher& cipher, const std::string& key){
    try {
        return cipher.decrypt(l.value, key);
    } catch (const CryptoError& e) {
        throw CryptoError("cannot decrypt " + l.name + ": " + e.what());
    }
}

static std::string encrypt_value(const std::string& name, const std::string& value,
                                 const SecretCipher& cipher, const std::string& key){
    try {
        return cipher.encrypt(value, key);
    } catch (const CryptoError& e) {
        throw CryptoError("cannot encrypt " + name + ": " + e.what() + ". Ensure you are providing a valid Fernet key");
    }
}

static SecretMetadata stamp(const std::string& token, const std::string& key_env_name, const std::string& timestamp){
    return SecretMetadata{key_env_name, sign_secret(token, timestamp, key_env_name), timestamp};
}

std::vector<std::string> list_secrets(const std::vector<FileLine>& lines){
    std::vector<std::string> out;
    for (const auto& l: lines) {
        if (l.kind == LineKind::SecretPlain || l.kind == LineKind::SecretEncrypted || l.kind == LineKind::KeyDeclaration)
            out.push_back(declared_name(l));
    }
    return out;
}

void ensure_disclaimer(std::vector<FileLine>& lines){
    if (!lines.empty() && trim(lines.front().raw) == kHeaderDisclaimer) return;
    lines.insert(lines.begin(), classify_line(kHeaderDisclaimer));
}

std::optional<std::string> find_key_declaration(const std::vector<FileLine>& lines){
    for (const auto& l: lines)
        if (l.kind == LineKind::KeyDeclaration) return l.value;
    return std::nullopt;
}

EncryptResult encrypt_all(const std::vector<FileLine>& lines, const SecretCipher& cipher,
                          const std::string& key, const std::string& key_env_name,
                          const std::string& timestamp){
    if (key.empty()) throw KeyResolutionError("no key given for encryption");
    if (!is_identifier(key_env_name)) throw ConfigError("invalid key environment variable name: '" + key_env_name + "'");

    check_unique_names(lines);
    std::set<std::string> backed = encrypted_names(lines);
    EncryptResult r;
    r.lines.reserve(lines.size() + 1);
    for (const auto& l: lines) {
        if (l.kind != LineKind::SecretPlain) { r.lines.push_back(l); continue; }
        if (backed.count(l.name)) {
            if (!l.value.empty()) {
                r.skipped.push_back(l.name);
                r.lines.push_back(make_plain(l.name, ""));
            } else {
                r.lines.push_back(l);
            }
            continue;
        }
        if (l.value.empty()) { r.lines.push_back(l); continue; }

        std::string token = encrypt_value(l.name, l.value, cipher, key);
        r.lines.push_back(make_plain(l.name, ""));
        r.lines.push_back(make_encrypted(l.name, token, stamp(token, key_env_name, timestamp)));
        r.encrypted.push_back(l.name);
    }
    ensure_disclaimer(r.lines);
    return r;
}

DecryptResult decrypt_all(const std::vector<FileLine>& lines, const SecretCipher& cipher,
                          const std::string& key){
    if (key.empty()) throw KeyResolutionError("no key given for decryption");
    check_unique_names(lines);

    std::set<std::string> backed;
    for (const auto& l: lines)
        if (l.kind == LineKind::SecretEncrypted) backed.insert(l.name);

    DecryptResult r;
    r.lines.reserve(lines.size() + 1);
    for (const auto& l: lines) {
        if (l.kind == LineKind::SecretPlain && backed.count(l.name)) continue;
        if (l.kind != LineKind::SecretEncrypted) { r.lines.push_back(l); continue; }

        if (l.meta) check_signature(l);
        else r.unsigned_names.push_back(l.name);
        std::string value = decrypt_record(l, cipher, key);
        if (value.find_first_of("\"\r\n") != std::string::npos)
            throw FormatError("decrypted value of " + l.name + " contains a quote or line break and cannot be stored");
        r.lines.push_back(make_plain(l.name, value));
        r.decrypted.push_back(l.name);
    }
    ensure_disclaimer(r.lines);
    return r;
}

size_t delete_secret(std::vector<FileLine>& lines, const std::string& name){
    // Accepts either X or X_ENCRYPTED and removes both, whatever their classification.
    std::string suffix = kEncryptedSuffix;
    std::string base = name;
    if (ends_with(base, suffix) && base.size() > suffix.size()) base = base.substr(0, base.size() - suffix.size());
    size_t before = lines.size();
    std::vector<FileLine> kept;
    kept.reserve(lines.size());
    for (auto& l: lines) {
        std::string n = l.kind == LineKind::KeyDeclaration ? "" : declared_name(l);
        bool match = !n.empty() && (n == base || n == base + suffix);
        if (!match) kept.push_back(std::move(l));
    }
    lines.swap(kept);
    size_t removed = before - lines.size();
    if (removed) ensure_disclaimer(lines);
    return removed;
}

bool set_key_declaration(std::vector<FileLine>& lines, const std::string& env_name){
    if (!is_identifier(env_name)) throw ConfigError("invalid key environment variable name: '" + env_name + "'");
    for (auto& l: lines) {
        if (l.kind != LineKind::KeyDeclaration) continue;
        l.value = env_name;
        l.raw = format_plain(l.name, env_name);
        return true;
    }
    return false;
}

ConvertResult convert_key(const std::vector<FileLine>& lines, const SecretCipher& cipher,
                          const std::string& old_key, const std::string& new_key,
                          const std::string& new_env_name, const std::string& timestamp){
    if (old_key.empty() || new_key.empty()) throw KeyResolutionError("both the old and the new key are required");
    if (!is_identifier(new_env_name)) throw ConfigError("invalid key environment variable name: '" + new_env_name + "'");

    check_unique_names(lines);
    std::string suffix = kEncryptedSuffix;
    for (const auto& l: lines) {
        if (l.kind != LineKind::Unrecognized) continue;
        std::string n = declared_name(l);
        if (ends_with(n, suffix) && n.size() > suffix.size())
            throw FormatError(n + " cannot be parsed (bad metadata or empty value); fix or delete it before converting");
    }

    ConvertResult r;
    r.lines.reserve(lines.size() + 1);
    for (const auto& l: lines) {
        if (l.kind == LineKind::KeyDeclaration) {
            FileLine d = l;
            d.value = new_env_name;
            d.raw = format_plain(l.name, new_env_name);
            r.lines.push_back(d);
            continue;
        }
        if (l.kind != LineKind::SecretEncrypted) { r.lines.push_back(l); continue; }

        if (l.meta) check_signature(l);
        else r.unsigned_names.push_back(l.name);
        std::string value = decrypt_record(l, cipher, old_key);
        std::string token = encrypt_value(l.name, value, cipher, new_key);
        r.lines.push_back(make_encrypted(l.name, token, stamp(token, new_env_name, timestamp)));
        r.converted.push_back(l.name);
    }
    ensure_disclaimer(r.lines);
    return r;
}
