/*
 * CrowdScan - Health Log Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"

#include <cstring>
#include <mutex>

#ifdef ARDUINO
#include <Arduino.h>
#endif

// ════════════════════════════════════════════════════════════════════════════
// STATE
// ════════════════════════════════════════════════════════════════════════════

namespace {

std::mutex s_log_mutex;
HealthLogEntry s_entries[HEALTH_LOG_MAX_ENTRIES];
size_t s_head = 0;       // Next write slot
size_t s_stored = 0;     // Valid entries in ring
uint32_t s_sequence = 0;
LogLevel s_min_level = LOG_LEVEL_INFO;
HealthLogOutputFn s_output = nullptr;

void default_output(const HealthLogEntry* e) {
#ifdef ARDUINO
  if (e->detail[0]) {
    Serial.printf("[%08lu][%s][%s] %s (%s)\n", (unsigned long)e->timestamp_ms,
                  log_level_name(e->level), log_category_name(e->category),
                  e->message, e->detail);
  } else {
    Serial.printf("[%08lu][%s][%s] %s\n", (unsigned long)e->timestamp_ms,
                  log_level_name(e->level), log_category_name(e->category),
                  e->message);
  }
#else
  if (e->detail[0]) {
    fprintf(stderr, "[%08llu][%s][%s] %s (%s)\n", (unsigned long long)e->timestamp_ms,
            log_level_name(e->level), log_category_name(e->category),
            e->message, e->detail);
  } else {
    fprintf(stderr, "[%08llu][%s][%s] %s\n", (unsigned long long)e->timestamp_ms,
            log_level_name(e->level), log_category_name(e->category),
            e->message);
  }
#endif
}

void copy_bounded(char* dst, size_t cap, const char* src) {
  if (!src) {
    dst[0] = '\0';
    return;
  }
  strncpy(dst, src, cap - 1);
  dst[cap - 1] = '\0';
}

} // namespace

// ════════════════════════════════════════════════════════════════════════════
// PUBLIC API
// ════════════════════════════════════════════════════════════════════════════

void log_health(LogLevel level, LogCategory category, const char* message, const char* detail) {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  if (level < s_min_level) return;

  HealthLogEntry& e = s_entries[s_head];
  e.sequence = ++s_sequence;
  e.timestamp_ms = crowdscan::now_mono_ms();
  e.level = level;
  e.category = category;
  copy_bounded(e.message, sizeof(e.message), message);
  copy_bounded(e.detail, sizeof(e.detail), detail);

  s_head = (s_head + 1) % HEALTH_LOG_MAX_ENTRIES;
  if (s_stored < HEALTH_LOG_MAX_ENTRIES) s_stored++;

  HealthLogOutputFn out = s_output ? s_output : default_output;
  out(&e);
}

void health_log(LogLevel level, LogCategory category, const char* message) {
  log_health(level, category, message, nullptr);
}

void health_log_set_output(HealthLogOutputFn fn) {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  s_output = fn;
}

void health_log_set_min_level(LogLevel level) {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  s_min_level = level;
}

LogLevel health_log_get_min_level() {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  return s_min_level;
}

std::vector<HealthLogEntry> health_log_recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  size_t n = max_entries < s_stored ? max_entries : s_stored;
  std::vector<HealthLogEntry> out;
  out.reserve(n);
  // Oldest of the requested window first
  size_t start = (s_head + HEALTH_LOG_MAX_ENTRIES - n) % HEALTH_LOG_MAX_ENTRIES;
  for (size_t i = 0; i < n; i++) {
    out.push_back(s_entries[(start + i) % HEALTH_LOG_MAX_ENTRIES]);
  }
  return out;
}

uint32_t health_log_count() {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  return s_sequence;
}

void health_log_clear() {
  std::lock_guard<std::mutex> lock(s_log_mutex);
  crowdscan::secure_wipe(s_entries, sizeof(s_entries));
  s_head = 0;
  s_stored = 0;
  s_sequence = 0;
}
