#include "secrets_file.hpp"
#include "errors.hpp"
#include "signature.hpp"
#include "util.hpp"
#include <cctype>

static bool is_timestamp(const std::string& s){
    // YYYY-MM-DD HH:MM:SS
    if (s.size() != 19) return false;
    for (size_t i = 0; i < s.size(); ++i){
        char c = s[i];
        if (i==4 || i==7) { if (c != '-') return false; }
        else if (i==10) { if (c != ' ') return false; }
        else if (i==13 || i==16) { if (c != ':') return false; }
        else if (!std::isdigit((unsigned char)c)) return false;
    }
    return true;
}

SecretMetadata parse_metadata(const std::string& comment){
    std::string t = trim(comment);
    if (t.empty() || t[0] != '#') throw FormatError("metadata must start with '#'");
    std::vector<std::string> fields;
    std::string body = t.substr(1);
    size_t start = 0;
    while (true) {
        size_t comma = body.find(',', start);
        fields.push_back(trim(body.substr(start, comma == std::string::npos ? std::string::npos : comma - start)));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    if (fields.size() != 3) throw FormatError("metadata needs 3 comma separated fields, got " + std::to_string(fields.size()));
    SecretMetadata m{fields[0], fields[1], fields[2]};
    if (!is_identifier(m.key_env_name)) throw FormatError("bad key env name in metadata: '" + m.key_env_name + "'");
    if (m.signature.size() != kSignatureLen) throw FormatError("signature must be " + std::to_string(kSignatureLen) + " characters");
    if (!is_timestamp(m.timestamp)) throw FormatError("bad timestamp in metadata: '" + m.timestamp + "'");
    return m;
}

FileLine classify_line(const std::string& line, const std::string& key_decl_name){
    FileLine l;
    l.raw = line;
    std::string t = trim(line);
    if (t.empty()) { l.kind = LineKind::Blank; return l; }
    if (t[0] == '#') { l.kind = LineKind::Comment; return l; }

    l.kind = LineKind::Unrecognized;
    size_t eq = t.find('=');
    if (eq == std::string::npos) return l;
    std::string name = trim(t.substr(0, eq));
    if (!is_identifier(name)) return l;
    std::string rest = trim(t.substr(eq + 1));
    if (rest.empty() || rest[0] != '"') return l;
    size_t close = rest.find('"', 1);
    if (close == std::string::npos) return l;
    std::string value = rest.substr(1, close - 1);
    std::string tail = trim(rest.substr(close + 1));
    if (!tail.empty() && tail[0] != '#') return l;

    std::string suffix = kEncryptedSuffix;
    if (ends_with(name, suffix) && name.size() > suffix.size()) {
        if (value.empty()) return l;
        std::optional<SecretMetadata> meta;
        if (!tail.empty()) {
            try {
                meta = parse_metadata(tail);
            } catch (const FormatError&) {
                return l;
            }
        }
        l.kind = LineKind::SecretEncrypted;
        l.name = name.substr(0, name.size() - suffix.size());
        l.value = value;
        l.meta = meta;
        return l;
    }

    l.kind = name == key_decl_name ? LineKind::KeyDeclaration : LineKind::SecretPlain;
    l.name = name;
    l.value = value;
    return l;
}

std::vector<FileLine> parse_secrets(const std::string& text, const std::string& key_decl_name){
    std::vector<FileLine> out;
    for (const auto& line: split_lines(text)) out.push_back(classify_line(line, key_decl_name));
    return out;
}

std::string format_plain(const std::string& name, const std::string& value){
    return name + " = \"" + value + "\"";
}

std::string format_encrypted(const std::string& name, const std::string& token, const SecretMetadata& meta){
    return name + kEncryptedSuffix + " = \"" + token + "\"    #"
         + meta.key_env_name + "," + meta.signature + "," + meta.timestamp;
}

FileLine make_plain(const std::string& name, const std::string& value){
    FileLine l;
    l.kind = LineKind::SecretPlain;
    l.raw = format_plain(name, value);
    l.name = name;
    l.value = value;
    return l;
}

FileLine make_encrypted(const std::string& name, const std::string& token, const SecretMetadata& meta){
    FileLine l;
    l.kind = LineKind::SecretEncrypted;
    l.raw = format_encrypted(name, token, meta);
    l.name = name;
    l.value = token;
    l.meta = meta;
    return l;
}

std::string render_secrets(const std::vector<FileLine>& lines){
    std::string out;
    for (const auto& l: lines) { out += l.raw; out += '\n'; }
    return out;
}

std::string declared_name(const FileLine& l){
    switch (l.kind) {
        case LineKind::Comment:
        case LineKind::Blank:
            return "";
        case LineKind::SecretEncrypted:
            return l.name + kEncryptedSuffix;
        case LineKind::KeyDeclaration:
        case LineKind::SecretPlain:
            return l.name;
        case LineKind::Unrecognized: {
            size_t eq = l.raw.find('=');
            if (eq == std::string::npos) return "";
            std::string n = trim(l.raw.substr(0, eq));
            return is_identifier(n) ? n : "";
        }
    }
    return "";
}

const char* line_kind_name(LineKind k){
    switch (k) {
        case LineKind::Comment: return "comment";
        case LineKind::Blank: return "blank";
        case LineKind::KeyDeclaration: return "key-declaration";
        case LineKind::SecretPlain: return "plain";
        case LineKind::SecretEncrypted: return "encrypted";
        case LineKind::Unrecognized: return "unrecognized";
    }
    return "?";
}
