/**
 * @file timing.hpp
 * @brief Monotonic wall-clock helpers for stage and epoch timing
 */

#ifndef KAM_UTILS_TIMING_HPP
#define KAM_UTILS_TIMING_HPP

#include <cstdint>
#include <ctime>

namespace kam {

/// CLOCK_MONOTONIC in nanoseconds.
inline int64_t monotonic_time_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

inline double elapsed_ms_since(int64_t start_ns) {
    return static_cast<double>(monotonic_time_ns() - start_ns) * 1e-6;
}

} // namespace kam

#endif // KAM_UTILS_TIMING_HPP
