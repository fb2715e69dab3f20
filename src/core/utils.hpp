#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Parse a whole-string non-negative integer (round numbers, slots).
// nullopt on junk, trailing characters, sign, or overflow.
std::optional<uint32_t> parse_index(const std::string& s);

// Split a command argument string on whitespace.
std::vector<std::string> split_args(const std::string& args);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
