// CONCORD - Time Utilities
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Provides:
// - An injectable Clock (system clock in production, manual clock in tests)
// - Millisecond Unix timestamp conversions
// - ISO 8601 formatting and parsing for envelope timestamps

#ifndef CONCORD_UTIL_TIME_H
#define CONCORD_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace concord {
namespace util {

using TimePoint = std::chrono::system_clock::time_point;
using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Conversions
// ============================================================================

int64_t ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

/// True for the zero (epoch) time point
inline bool IsZero(TimePoint tp) { return tp.time_since_epoch().count() == 0; }

/// "2024-01-15T10:30:00.123Z"
std::string FormatISO8601Millis(TimePoint tp);

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff][Z|+HH:MM|-HH:MM]".
/// Returns false (and leaves *out untouched) on malformed input.
bool ParseISO8601(const std::string& str, TimePoint* out);

// ============================================================================
// Clock
// ============================================================================

/// Source of wall-clock time. Passed explicitly into components that
/// evaluate timeouts so tests never depend on real time.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint Now() const override { return std::chrono::system_clock::now(); }
};

/// Clock that only moves when told to
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start = FromUnixMillis(1700000000000)) : now_(start) {}

    TimePoint Now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void Set(TimePoint tp) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = tp;
    }

    void Advance(Milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += d;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

} // namespace util
} // namespace concord

#endif // CONCORD_UTIL_TIME_H
