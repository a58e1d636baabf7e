#pragma once

#include <quid/result.hpp>
#include <chrono>
#include <cstdint>

namespace quid {

// 100-ns ticks between the Gregorian reform (1582-10-15T00:00:00Z) and the
// Unix epoch.
constexpr uint64_t kGregorianOffset = 0x01B21DD213814000ULL;

// Timestamps occupy 60 bits of the layout.
constexpr uint64_t kTimestampMask = 0x0FFFFFFFFFFFFFFFULL;

struct Timestamp {
    uint64_t ticks = 0;

    // Read the system clock. Fails with ClockOverflow when the clock reads
    // before 1970 or past the range of a 64-bit nanosecond count.
    static Result<Timestamp> now();
    static Result<Timestamp> from_unix_nanos(uint64_t nanos);
    static Result<Timestamp> from_system_time(std::chrono::system_clock::time_point tp);

    // 100-ns ticks relative to the Unix epoch; negative before 1970.
    int64_t unix_ticks() const;

    bool operator==(const Timestamp& other) const { return ticks == other.ticks; }
    bool operator!=(const Timestamp& other) const { return ticks != other.ticks; }
};

} // namespace quid
