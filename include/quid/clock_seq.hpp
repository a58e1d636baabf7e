#pragma once

#include <atomic>
#include <cstdint>

namespace quid {

// Counter that keeps time-based identifiers distinct when the clock repeats
// or runs backwards. Only the low 14 bits reach the layout.
class ClockSeq {
public:
    explicit ClockSeq(uint16_t seed) : counter_(seed) {}

    ClockSeq(const ClockSeq&) = delete;
    ClockSeq& operator=(const ClockSeq&) = delete;

    // Atomic fetch-and-increment; returns the value before the increment.
    uint16_t next() {
        return counter_.fetch_add(1, std::memory_order_acq_rel);
    }

    // Value the next call to next() would return.
    uint16_t peek() const {
        return counter_.load(std::memory_order_acquire);
    }

    // The process-wide sequence. Seeded from the random source on first use
    // (thread-safe static initialization), never re-seeded, destroyed with
    // the other statics at exit.
    static ClockSeq& process();

private:
    std::atomic<uint16_t> counter_;
};

} // namespace quid
