#include "utils.hpp"
#include <cstdio>
#include <stdexcept>

std::string format_iso_time(std::time_t t) {
    struct tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::time_t parse_iso_time(const std::string& iso) {
    struct tm tm_buf = {};
    int fields = sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
                        &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                        &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec);
    if (fields != 6 && fields != 3) return 0;
    if (tm_buf.tm_mon < 1 || tm_buf.tm_mon > 12 || tm_buf.tm_mday < 1 || tm_buf.tm_mday > 31) {
        return 0;
    }
    if (fields == 3) {
        tm_buf.tm_hour = tm_buf.tm_min = tm_buf.tm_sec = 0;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;
    return timegm(&tm_buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

double safe_stod(const std::string& s, double fallback) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}
