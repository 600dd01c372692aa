#include "util.hpp"
#include <openssl/sha.h>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

int getenv_int_or(const char* key, int def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        std::cerr << "[frontier] Ignoring invalid " << key << "=" << v << ", using " << def << std::endl;
        return def;
    }
}

double getenv_double_or(const char* key, double def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    double d = def;
    try {
        d = std::stod(v);
    } catch (const std::exception&) {
        std::cerr << "[frontier] Ignoring invalid " << key << "=" << v << ", using " << def << std::endl;
        return def;
    }
    if (!std::isfinite(d)) {
        std::cerr << "[frontier] Ignoring non-finite " << key << "=" << v << ", using " << def << std::endl;
        return def;
    }
    return d;
}

Timestamp now_utc() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

long long to_micros(Timestamp t) {
    return static_cast<long long>(t.time_since_epoch().count());
}

Timestamp from_micros(long long us) {
    return Timestamp(std::chrono::microseconds(us));
}

std::string format_iso8601(Timestamp t) {
    long long us = to_micros(t);
    long long secs = us / 1000000;
    long long frac = us % 1000000;
    if (frac < 0) {
        frac += 1000000;
        --secs;
    }
    std::time_t tt = static_cast<std::time_t>(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06lld+00:00",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return std::string(buf);
}

Timestamp parse_iso8601(const std::string& s) {
    auto bad = [&]() { return std::invalid_argument("invalid ISO-8601 timestamp: " + s); };

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6 || consumed != 19) {
        throw bad();
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        throw bad();
    }

    std::size_t pos = 19;
    long long frac_us = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            if (digits < 6) frac_us = frac_us * 10 + (s[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) throw bad();
        for (int i = digits; i < 6; ++i) frac_us *= 10;
    }

    long long offset_s = 0;
    if (pos < s.size()) {
        char c = s[pos];
        if (c == 'Z' && pos + 1 == s.size()) {
            ++pos;
        } else if (c == '+' || c == '-') {
            int oh = 0, om = 0;
            std::string rest = s.substr(pos + 1);
            if (rest.size() == 5 && rest[2] == ':') {
                if (std::sscanf(rest.c_str(), "%2d:%2d", &oh, &om) != 2) throw bad();
            } else if (rest.size() == 4) {
                if (std::sscanf(rest.c_str(), "%2d%2d", &oh, &om) != 2) throw bad();
            } else {
                throw bad();
            }
            offset_s = (oh * 3600LL + om * 60LL) * (c == '-' ? -1 : 1);
            pos = s.size();
        } else {
            throw bad();
        }
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    long long epoch = static_cast<long long>(timegm(&tm));
    return from_micros((epoch - offset_s) * 1000000LL + frac_us);
}

std::string new_uuid() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t a = dist(rng), b = dist(rng);
    // version 4, RFC 4122 variant
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  (unsigned long long)(a >> 32),
                  (unsigned long long)((a >> 16) & 0xFFFF),
                  (unsigned long long)(a & 0xFFFF),
                  (unsigned long long)(b >> 48),
                  (unsigned long long)(b & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

bool is_uuid(const std::string& s) {
    if (s.size() != 36) return false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (s[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
    }
    return true;
}

std::string sha256_hex(const std::string& data) {
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}
