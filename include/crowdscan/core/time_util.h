/*
 * CrowdScan - Time and Memory Helpers
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_TIME_UTIL_H
#define CROWDSCAN_TIME_UTIL_H

#include <cstddef>
#include <stdint.h>

namespace crowdscan {

// Wall-clock Unix time in milliseconds. Used for payload timestamps and
// period keys.
uint64_t now_wall_ms();

// Monotonic milliseconds since an arbitrary start. Used for durations.
uint64_t now_mono_ms();

// Elapsed time, clamped at zero when the clock went backwards.
inline uint64_t elapsed_ms(uint64_t start_ms, uint64_t now_ms) {
  return now_ms >= start_ms ? now_ms - start_ms : 0;
}

inline bool timeout_elapsed(uint64_t start_ms, uint64_t now_ms, uint64_t duration_ms) {
  return elapsed_ms(start_ms, now_ms) >= duration_ms;
}

// Zero memory in a way the optimizer cannot elide.
void secure_wipe(void* ptr, size_t len);

} // namespace crowdscan

#endif // CROWDSCAN_TIME_UTIL_H
