#pragma once
#include <string>
#include <vector>
#include <optional>

static const char* const kDefaultKeyDeclName = "MASTER_KEY_ENV";
static const char* const kEncryptedSuffix = "_ENCRYPTED";
static const char* const kHeaderDisclaimer =
    "# Generated by secman. Do not edit manually, unless you know what you are doing";

enum class LineKind { Comment, Blank, KeyDeclaration, SecretPlain, SecretEncrypted, Unrecognized };

struct SecretMetadata {
    std::string key_env_name;
    std::string signature;
    std::string timestamp;  // YYYY-MM-DD HH:MM:SS
};

// One line of a secrets file. raw is always the original text.
// KeyDeclaration: value is the env var name.
// SecretPlain: name/value.
// SecretEncrypted: name is the secret name without _ENCRYPTED, value is the token.
struct FileLine {
    LineKind kind = LineKind::Unrecognized;
    std::string raw;
    std::string name;
    std::string value;
    std::optional<SecretMetadata> meta;
};

FileLine classify_line(const std::string& line, const std::string& key_decl_name = kDefaultKeyDeclName);
std::vector<FileLine> parse_secrets(const std::string& text, const std::string& key_decl_name = kDefaultKeyDeclName);

// Throws FormatError if the comment is not "#env,signature,YYYY-MM-DD HH:MM:SS".
SecretMetadata parse_metadata(const std::string& comment);

std::string format_plain(const std::string& name, const std::string& value);
std::string format_encrypted(const std::string& name, const std::string& token, const SecretMetadata& meta);

FileLine make_plain(const std::string& name, const std::string& value);
FileLine make_encrypted(const std::string& name, const std::string& token, const SecretMetadata& meta);

std::string render_secrets(const std::vector<FileLine>& lines);

// Name as written before '=' (with _ENCRYPTED for encrypted lines), empty for comments/blanks.
std::string declared_name(const FileLine& l);

const char* line_kind_name(LineKind k);
