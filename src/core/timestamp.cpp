#include <quid/timestamp.hpp>
#include <limits>

namespace quid {

static constexpr uint64_t kOffsetNanos = kGregorianOffset * 100;

Result<Timestamp> Timestamp::from_unix_nanos(uint64_t nanos) {
    if (nanos > std::numeric_limits<uint64_t>::max() - kOffsetNanos) {
        return QuidError(QuidError::ClockOverflow,
            "timestamp does not fit in 64 bits after adding the Gregorian offset",
            "nanoseconds since 1970 must not exceed " +
                std::to_string(std::numeric_limits<uint64_t>::max() - kOffsetNanos));
    }
    Timestamp ts;
    ts.ticks = ((nanos + kOffsetNanos) / 100) & kTimestampMask;
    return Result<Timestamp>::ok(ts);
}

Result<Timestamp> Timestamp::from_system_time(std::chrono::system_clock::time_point tp) {
    auto since = std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
    if (since < 0) {
        return QuidError(QuidError::ClockOverflow,
            "system clock reads before the Unix epoch",
            "check the host clock");
    }
    return from_unix_nanos(static_cast<uint64_t>(since));
}

Result<Timestamp> Timestamp::now() {
    return from_system_time(std::chrono::system_clock::now());
}

int64_t Timestamp::unix_ticks() const {
    return static_cast<int64_t>(ticks) - static_cast<int64_t>(kGregorianOffset);
}

} // namespace quid
