#pragma once

#include <string>
#include <chrono>
#include <ctime>
#include <cmath>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <iomanip>

namespace quote_gateway {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Shared formatting helpers used by the gateway, the upstream adapter and
 * the controller.
 */
namespace utils {

/**
 * Format timestamp as ISO 8601 string with microseconds in UTC
 * (e.g., "2024-01-15T10:30:00.123456Z").
 */
inline std::string ts_to_iso(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  ts.time_since_epoch()).count() % 1000000;
    if (us < 0) us += 1000000;
    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%06lldZ", static_cast<long long>(us));
    return std::string(buf) + frac;
}

/**
 * Format timestamp as a date in the process's local time zone.
 */
inline std::string ts_to_local_date(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}

/**
 * Format epoch seconds as a date in a zone given by its UTC offset
 * (exchange-local trading date).
 */
inline std::string epoch_to_date(int64_t epoch_sec, int64_t gmtoffset_sec) {
    std::time_t t = static_cast<std::time_t>(epoch_sec + gmtoffset_sec);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}

/**
 * Round half away from zero to a fixed number of decimal places.
 */
inline double round_to(double value, int places) {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

/**
 * Percent-encode a string for use in a URL path segment or query value.
 */
inline std::string url_encode(const std::string& s) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

} // namespace utils
} // namespace quote_gateway
