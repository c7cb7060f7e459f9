#include "timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace envkeeper {
namespace common {

namespace {

std::string format_utc(TimePoint tp, const char *fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_buf);
    return std::string(buf, n);
}

}  // namespace

std::string format_rfc3339(TimePoint tp) { return format_utc(tp, "%Y-%m-%dT%H:%M:%SZ"); }

std::string compact_utc_stamp(TimePoint tp) { return format_utc(tp, "%Y%m%dT%H%M%SZ"); }

bool parse_rfc3339(const std::string &text, TimePoint &out) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n", &year, &month, &day, &sep, &hour, &minute, &second,
                    &consumed) != 7) {
        return false;
    }
    if (sep != 'T' && sep != 't' && sep != ' ') {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            ++pos;
        }
    }

    long offset_seconds = 0;
    if (pos < text.size()) {
        char zone = text[pos];
        if (zone == 'Z' || zone == 'z') {
            ++pos;
        } else if (zone == '+' || zone == '-') {
            int oh = 0, om = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                return false;
            }
            offset_seconds = (oh * 3600L + om * 60L) * (zone == '+' ? 1 : -1);
            pos += 6;
        } else {
            return false;
        }
    }
    if (pos != text.size()) {
        return false;
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) {
        return false;
    }
    out = std::chrono::system_clock::from_time_t(t - offset_seconds);
    return true;
}

std::string date_or_epoch(const std::string &text) {
    if (text.empty()) {
        return "1970-01-01T00:00:00Z";
    }
    return text;
}

}  // namespace common
}  // namespace envkeeper
