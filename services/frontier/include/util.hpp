#pragma once
#include <chrono>
#include <string>

// Microsecond-resolution wall clock time (UTC).
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);
double getenv_double_or(const char* key, double def);

Timestamp now_utc();
long long to_micros(Timestamp t);
Timestamp from_micros(long long us);

// "YYYY-MM-DDTHH:MM:SS.ffffff+00:00"
std::string format_iso8601(Timestamp t);
// Accepts an optional fraction (any precision) and a "Z" or "+HH:MM"/"-HH:MM" suffix.
// Throws std::invalid_argument on malformed input.
Timestamp parse_iso8601(const std::string& s);

std::string new_uuid();
bool is_uuid(const std::string& s);

std::string sha256_hex(const std::string& data);
