#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <sstream>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace rekal {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p == "~") return home_dir();
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    return p;
}

inline std::string rekal_dir() {
    return home_dir() + "/.rekal";
}

// REKAL_CONFIG overrides the location of the config file.
inline std::string default_config_path() {
    const char* env = std::getenv("REKAL_CONFIG");
    if (env && *env) return env;
    return rekal_dir() + "/config.json";
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// "YYYY-MM-DD HH:MM:SS" in UTC, the same shape SQLite's datetime('now') produces.
inline std::string format_utc(int64_t epoch) {
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

inline std::string now_utc_str() {
    return format_utc(epoch_now());
}

// Accepts "YYYY-MM-DD HH:MM:SS" and "YYYY-MM-DDTHH:MM:SS", with optional
// fractional seconds and a trailing 'Z'. Naive timestamps are taken as UTC.
inline std::optional<int64_t> parse_utc_timestamp(const std::string& ts) {
    if (ts.size() < 19) return std::nullopt;
    std::string norm = ts.substr(0, 19);
    if (norm[10] == 'T') norm[10] = ' ';
    std::tm tm{};
    std::istringstream in(norm);
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) return std::nullopt;
    return static_cast<int64_t>(timegm(&tm));
}

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n\f\v");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(b, e - b + 1);
}

inline std::vector<std::string> split_whitespace(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) out.push_back(tok);
    return out;
}

inline std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

// Cut to at most max_bytes without splitting a UTF-8 sequence.
inline std::string truncate_utf8(const std::string& s, size_t max_bytes) {
    if (s.size() <= max_bytes) return s;
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return s.substr(0, cut);
}

// Last component of a path, ignoring trailing slashes.
inline std::string path_basename(const std::string& p) {
    std::string s = p;
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    auto pos = s.rfind('/');
    return pos == std::string::npos ? s : s.substr(pos + 1);
}

} // namespace rekal
