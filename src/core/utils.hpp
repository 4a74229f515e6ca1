#pragma once

#include <string>
#include <ctime>
#include <cstdint>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Human-readable age of an ISO timestamp relative to now: "8s", "14m22s", "2h35m".
// Returns "never" if empty, "?" on parse failure.
std::string format_age(const std::string& iso, std::time_t now = std::time(nullptr));

// Parse a persisted revision counter. Negative, empty or malformed input yields 0.
uint64_t parse_revision(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
