#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <cstdio>
#include <ctime>
#include "errors.hpp"

inline std::string read_file(const std::string& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw ConfigError("cannot open: " + p);
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

// Writes a sibling temp file and renames it over p, so a failed write never truncates p.
inline void write_file(const std::string& p, const std::string& s) {
    std::string tmp = p + ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) throw SecmanError("cannot create: " + tmp);
        f << s;
        f.flush();
        if (!f) { f.close(); std::remove(tmp.c_str()); throw SecmanError("write failed: " + tmp); }
    }
    if (std::rename(tmp.c_str(), p.c_str()) != 0) {
        std::remove(tmp.c_str());
        throw SecmanError("cannot replace: " + p);
    }
}

inline bool file_exists(const std::string& p) {
    std::ifstream f(p);
    return (bool)f;
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

inline bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    auto head = [](char c){ return (c>='A'&&c<='Z') || (c>='a'&&c<='z') || c=='_'; };
    if (!head(s[0])) return false;
    for (char c: s) if (!head(c) && !(c>='0'&&c<='9')) return false;
    return true;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix) == 0;
}

// Splits on '\n'. A final newline does not produce an empty trailing element.
inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start < text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) { out.push_back(text.substr(start)); break; }
        out.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return out;
}

// Local time as YYYY-MM-DD HH:MM:SS.
inline std::string now_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}
