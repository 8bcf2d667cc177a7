#pragma once

#include <string>
#include <ctime>

// Format a UTC time_t as YYYY-MM-DDTHH:MM:SS.
std::string format_iso_time(std::time_t t);

// Parse an ISO 8601 timestamp (UTC) to time_t. A bare date (YYYY-MM-DD)
// means midnight. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Safe double parse: returns fallback on failure (no exceptions).
double safe_stod(const std::string& s, double fallback = 0.0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
