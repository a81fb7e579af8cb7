/*
 * CrowdScan - Time and Memory Helpers
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/core/time_util.h"

#include <chrono>

namespace crowdscan {

uint64_t now_wall_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

uint64_t now_mono_ms() {
  using namespace std::chrono;
  static const steady_clock::time_point s_start = steady_clock::now();
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(steady_clock::now() - s_start).count());
}

void secure_wipe(void* ptr, size_t len) {
  volatile uint8_t* p = static_cast<volatile uint8_t*>(ptr);
  while (len--) {
    *p++ = 0;
  }
  // Prevent the compiler from reordering or removing the wipe
#if defined(__GNUC__)
  __asm__ __volatile__("" : : "r"(ptr) : "memory");
#endif
}

} // namespace crowdscan
