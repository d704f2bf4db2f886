// BONDVAULT - Time Utilities
// Copyright (c) 2024 BondVault Developers
// MIT License
//
// Unix-seconds clock used for round timestamps and staleness checks.
// Tests pin it with SetMockTime() or a ScopedMockTime.

#ifndef BONDVAULT_UTIL_TIME_H
#define BONDVAULT_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace bondvault {
namespace util {

using Seconds = std::chrono::seconds;

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 60 * SECONDS_PER_MINUTE;
constexpr int64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;

/// Current Unix time in seconds; the pinned value while mock time is set
int64_t GetTime();

/// "2023-11-14T22:13:20Z"
std::string FormatISO8601(int64_t timestamp);

/// Largest non-zero unit first, e.g. "1d 1h 1m 1s", "1h 0m 0s", "59s"
std::string FormatDuration(int64_t seconds);

// ============================================================================
// Mock Clock
// ============================================================================

/// Pin the clock at timestamp until ClearMockTime()
void SetMockTime(int64_t timestamp);

/// Move a pinned clock; no effect on the real clock
void AdvanceMockTime(Seconds duration);

void ClearMockTime();

bool IsMockTimeEnabled();

/// Pins the clock for the lifetime of the object
class ScopedMockTime {
public:
    explicit ScopedMockTime(int64_t start) { SetMockTime(start); }
    ~ScopedMockTime() { ClearMockTime(); }

    ScopedMockTime(const ScopedMockTime&) = delete;
    ScopedMockTime& operator=(const ScopedMockTime&) = delete;

    void Advance(Seconds duration) { AdvanceMockTime(duration); }
};

} // namespace util
} // namespace bondvault

#endif // BONDVAULT_UTIL_TIME_H
