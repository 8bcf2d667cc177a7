#pragma once

#include <string>
#include <optional>
#include <ctime>

// UTC day number (days since 1970-01-01). Negative times round down.
long day_index(std::time_t t);

// Midnight (UTC) at the start of a day number.
std::time_t day_start(long day);

// Format a day number as YYYY-MM-DD.
std::string format_date(long day);

// Parse YYYY-MM-DD to a day number. Returns nullopt on failure.
std::optional<long> parse_date(const std::string& date);

// Format the duration between two times as "3d4h", "2h35m", "14m22s" or "8s".
// Returns "-" if start is 0 and "?" if end precedes start.
std::string format_duration(std::time_t start, std::time_t end);

// Format a time as "YYYY-MM-DD HH:MM" (UTC). Returns "-" for 0.
std::string format_timestamp(std::time_t t);
