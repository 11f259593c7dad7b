// CONCORD - Time Utilities Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/util/time.h>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace concord {
namespace util {

int64_t ToUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
    return TimePoint{Milliseconds{ms}};
}

std::string FormatISO8601Millis(TimePoint tp) {
    int64_t totalMs = ToUnixMillis(tp);
    int64_t secs = totalMs / 1000;
    int64_t ms = totalMs % 1000;
    if (ms < 0) {
        ms += 1000;
        secs -= 1;
    }
    std::time_t time = static_cast<std::time_t>(secs);

    std::tm tm_buf;
    gmtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
    return oss.str();
}

bool ParseISO8601(const std::string& str, TimePoint* out) {
    std::tm tm_buf = {};
    std::istringstream iss(str);
    iss >> std::get_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return false;
    }

    // Optional fraction, truncated to milliseconds
    int64_t millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        int digits = 0;
        while (std::isdigit(iss.peek())) {
            int d = iss.get() - '0';
            if (digits < 3) millis = millis * 10 + d;
            ++digits;
        }
        if (digits == 0) return false;
        for (; digits < 3; ++digits) millis *= 10;
    }

    // Zone designator
    int64_t offsetSec = 0;
    int zc = iss.peek();
    if (zc == 'Z' || zc == 'z') {
        iss.get();
    } else if (zc == '+' || zc == '-') {
        iss.get();
        int hh = 0;
        int mm = 0;
        char colon = 0;
        if (!(iss >> hh >> colon >> mm) || colon != ':') {
            return false;
        }
        offsetSec = (hh * 3600 + mm * 60) * (zc == '+' ? 1 : -1);
    } else if (zc != std::char_traits<char>::eof()) {
        return false;
    }
    if (iss.peek() != std::char_traits<char>::eof()) {
        return false;
    }

    std::time_t time = timegm(&tm_buf);
    if (time == -1) {
        return false;
    }
    *out = FromUnixMillis((static_cast<int64_t>(time) - offsetSec) * 1000 + millis);
    return true;
}

} // namespace util
} // namespace concord
