#pragma once

#include <cstddef>
#include <string>

// Login name of the real uid; falls back to $USER, then "unknown".
std::string current_username();

// Local wall-clock time as HH:MM:SS.
std::string now_clock();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Lower-case ASCII copy.
std::string to_lower(const std::string& s);

// Number of UTF-8 code points in s (continuation bytes are not counted).
size_t utf8_length(const std::string& s);

// Leading `count` code points of s; never splits a multi-byte sequence.
std::string utf8_prefix(const std::string& s, size_t count);
