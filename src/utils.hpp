#pragma once
#include <string>
#include <cstdlib>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <chrono>
#include <ctime>
#include <random>
#include <mutex>

namespace polygate {

namespace fs = std::filesystem;

inline std::string home_dir() {
    const char* h = std::getenv("HOME");
    return h ? std::string(h) : ".";
}

inline std::string expand_path(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        return home_dir() + p.substr(1);
    }
    if (p == "~") return home_dir();
    return p;
}

inline std::string default_config_path() {
    return home_dir() + "/.polygate/config.json";
}

inline std::string current_dir() {
    std::error_code ec;
    auto p = fs::current_path(ec);
    return ec ? std::string(".") : p.string();
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return "";
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\n' || s[b] == '\r')) b++;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\n' || s[e - 1] == '\r')) e--;
    return s.substr(b, e - b);
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

// Code points in a UTF-8 string; continuation bytes are not counted
inline size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

inline int64_t epoch_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

inline int64_t epoch_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// prefix_<millis hex>_<random hex>, unique enough for session, turn and tool-call ids
inline std::string generate_id(const std::string& prefix) {
    static std::mutex mu;
    static std::mt19937_64 rng{std::random_device{}()};
    uint64_t r;
    {
        std::lock_guard<std::mutex> lock(mu);
        r = rng();
    }
    std::ostringstream ss;
    ss << prefix << "_" << std::hex << epoch_millis() << "_" << (r & 0xffffffffffULL);
    return ss.str();
}

// Find matching closing brace for a JSON object starting at pos (s[pos] == '{')
inline size_t find_json_object_end(const std::string& s, size_t pos) {
    if (pos >= s.size() || s[pos] != '{') return std::string::npos;
    int depth = 0;
    bool in_str = false;
    bool esc = false;
    for (size_t i = pos; i < s.size(); i++) {
        char c = s[i];
        if (esc) { esc = false; continue; }
        if (c == '\\' && in_str) { esc = true; continue; }
        if (c == '"') { in_str = !in_str; continue; }
        if (in_str) continue;
        if (c == '{') depth++;
        else if (c == '}') { depth--; if (depth == 0) return i; }
    }
    return std::string::npos;
}

} // namespace polygate
