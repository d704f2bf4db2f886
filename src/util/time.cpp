// BONDVAULT - Time Utilities Implementation
// Copyright (c) 2024 BondVault Developers
// MIT License

#include "bondvault/util/time.h"

#include <atomic>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace bondvault {
namespace util {

namespace {

constexpr int64_t CLOCK_NOT_PINNED = std::numeric_limits<int64_t>::min();

std::atomic<int64_t> g_pinnedTime{CLOCK_NOT_PINNED};

} // namespace

int64_t GetTime() {
    int64_t pinned = g_pinnedTime.load();
    if (pinned != CLOCK_NOT_PINNED) {
        return pinned;
    }
    return std::chrono::duration_cast<Seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatISO8601(int64_t timestamp) {
    std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf, n);
}

std::string FormatDuration(int64_t seconds) {
    struct Unit {
        int64_t size;
        char suffix;
    };
    static const Unit UNITS[] = {
        {SECONDS_PER_DAY, 'd'},
        {SECONDS_PER_HOUR, 'h'},
        {SECONDS_PER_MINUTE, 'm'},
    };

    std::ostringstream out;
    uint64_t rest = seconds < 0 ? 0 - static_cast<uint64_t>(seconds)
                                : static_cast<uint64_t>(seconds);
    if (seconds < 0) out << '-';

    bool started = false;
    for (const Unit& unit : UNITS) {
        uint64_t count = rest / static_cast<uint64_t>(unit.size);
        rest %= static_cast<uint64_t>(unit.size);
        if (count > 0 || started) {
            out << count << unit.suffix << ' ';
            started = true;
        }
    }
    out << rest << 's';
    return out.str();
}

// ============================================================================
// Mock Clock
// ============================================================================

void SetMockTime(int64_t timestamp) {
    g_pinnedTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    int64_t current = g_pinnedTime.load();
    while (current != CLOCK_NOT_PINNED &&
           !g_pinnedTime.compare_exchange_weak(current, current + duration.count())) {
    }
}

void ClearMockTime() {
    g_pinnedTime.store(CLOCK_NOT_PINNED);
}

bool IsMockTimeEnabled() {
    return g_pinnedTime.load() != CLOCK_NOT_PINNED;
}

} // namespace util
} // namespace bondvault
