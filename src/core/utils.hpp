#pragma once

#include <string>
#include <optional>

// Parse a whole string as a base-10 integer. Surrounding whitespace is allowed,
// anything else (sign-only, trailing junk, overflow) yields nullopt.
std::optional<long> parse_int_strict(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
