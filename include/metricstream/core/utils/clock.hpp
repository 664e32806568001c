// ============================================================================
// CLOCKS
// Monotonic clock for measuring durations, wall clock for metric timestamps.

#pragma once

#include <chrono>
#include <cstdint>

namespace MetricStream {

using Timestamp = std::chrono::system_clock::time_point;

class Clock {
public:
    // Get current time in nanoseconds (monotonic, steady)
    static inline uint64_t now_ns() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    // Get current time in microseconds
    static inline uint64_t now_us() {
        return now_ns() / 1000;
    }

    // Get current time in milliseconds
    static inline uint64_t now_ms() {
        return now_ns() / 1'000'000;
    }

    // Wall-clock time, used for metric timestamps and retention cutoffs
    static inline Timestamp wall_now() {
        return std::chrono::system_clock::now();
    }

    static inline int64_t to_epoch_ms(Timestamp ts) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            ts.time_since_epoch()
        ).count();
    }

    static inline Timestamp from_epoch_ms(int64_t ms) {
        return Timestamp(std::chrono::milliseconds(ms));
    }
};

} // namespace MetricStream
