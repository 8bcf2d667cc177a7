#include "time_utils.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <fmt/format.h>

long day_index(std::time_t t) {
    long secs = static_cast<long>(t);
    long day = secs / SECONDS_PER_DAY;
    if (secs % SECONDS_PER_DAY < 0) day -= 1;
    return day;
}

std::time_t day_start(long day) {
    return static_cast<std::time_t>(day) * SECONDS_PER_DAY;
}

std::string format_date(long day) {
    std::time_t t = day_start(day);
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_buf);
    return std::string(buf);
}

std::optional<long> parse_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return std::nullopt;
    std::time_t t = parse_iso_time(date);
    if (t == 0 && date != "1970-01-01") return std::nullopt;
    return day_index(t);
}

std::string format_duration(std::time_t start, std::time_t end) {
    if (start == 0) return "-";
    if (end < start) return "?";

    long seconds = static_cast<long>(end - start);
    long days = seconds / SECONDS_PER_DAY;
    long hours = (seconds % SECONDS_PER_DAY) / 3600;
    long mins = (seconds % 3600) / 60;
    long secs = seconds % 60;

    if (days > 0) {
        return fmt::format("{}d{}h", days, hours);
    } else if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_timestamp(std::time_t t) {
    if (t == 0) return "-";

    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm_buf);
    return std::string(buf);
}
