#include "../include/util.hpp"
#include "../include/log.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <random>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

long getenv_positive(const char* key, long def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        std::size_t used = 0;
        long n = std::stol(v, &used);
        if (used == std::string(v).size() && n >= 1) return n;
    } catch (const std::logic_error&) {
    }
    log_line(LogLevel::Warn, "config", std::string(key) + "=" + v + " is not a positive integer, using " + std::to_string(def));
    return def;
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string gen_uuid() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC 4122 variant
    char buf[37];
    snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
             (unsigned long long)(a >> 32),
             (unsigned long long)((a >> 16) & 0xFFFF),
             (unsigned long long)(a & 0xFFFF),
             (unsigned long long)(b >> 48),
             (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}
