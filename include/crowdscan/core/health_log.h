/*
 * CrowdScan - Health Log Interface
 *
 * Logging interface for system health and diagnostic events. Every module
 * reports failures here instead of throwing; the log keeps a ring buffer of
 * recent entries and forwards each entry to a pluggable output.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_HEALTH_LOG_H
#define CROWDSCAN_HEALTH_LOG_H

#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <stdint.h>
#include <vector>
#include "crowdscan/core/log_level.h"

// ════════════════════════════════════════════════════════════════════════════
// CONFIGURATION
// ════════════════════════════════════════════════════════════════════════════

static constexpr size_t HEALTH_LOG_MESSAGE_LEN = 160;
static constexpr size_t HEALTH_LOG_DETAIL_LEN  = 64;
static constexpr size_t HEALTH_LOG_MAX_ENTRIES = 128;

// ════════════════════════════════════════════════════════════════════════════
// TYPES
// ════════════════════════════════════════════════════════════════════════════

struct HealthLogEntry {
  uint32_t    sequence;
  uint64_t    timestamp_ms;     // Monotonic ms since process start
  LogLevel    level;
  LogCategory category;
  char        message[HEALTH_LOG_MESSAGE_LEN];
  char        detail[HEALTH_LOG_DETAIL_LEN];
};

// Output callback. Called with the log mutex held; must not log recursively.
typedef void (*HealthLogOutputFn)(const HealthLogEntry* entry);

// ════════════════════════════════════════════════════════════════════════════
// HEALTH LOG FUNCTIONS
// ════════════════════════════════════════════════════════════════════════════

/*
 * Log a health/diagnostic event.
 *
 * @param level    Severity level (see log_level.h)
 * @param category Event category (see log_level.h)
 * @param message  Human-readable message describing the event
 *
 * Example usage:
 *   health_log(LOG_LEVEL_INFO, LOG_CAT_SYNC, "sync: batch delivered");
 */
void health_log(LogLevel level, LogCategory category, const char* message);

/*
 * Log a health/diagnostic event with optional detail.
 *
 * @param detail   Optional additional detail (can be nullptr)
 *
 * Example usage:
 *   log_health(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "scan failed", "code=3");
 */
void log_health(LogLevel level, LogCategory category, const char* message, const char* detail);

// Replace the output callback. nullptr restores the platform default
// (Serial on ESP32, stderr on host).
void health_log_set_output(HealthLogOutputFn fn);

// Entries below this level are dropped entirely.
void health_log_set_min_level(LogLevel level);
LogLevel health_log_get_min_level();

// Most recent entries, oldest first, at most max_entries.
std::vector<HealthLogEntry> health_log_recent(size_t max_entries = HEALTH_LOG_MAX_ENTRIES);

// Total entries logged since start (or since the last clear).
uint32_t health_log_count();

void health_log_clear();

// ════════════════════════════════════════════════════════════════════════════
// HEALTH_LOGGING NAMESPACE
// ════════════════════════════════════════════════════════════════════════════

/*
 * Namespace-based interface for health logging, used by the scan, sync and
 * geo modules. Named health_logging (not health_log) to avoid conflict with
 * the global health_log() function.
 */
namespace health_logging {

inline void log(LogLevel level, LogCategory category, const char* message, const char* detail) {
  ::log_health(level, category, message, detail);
}

// Buffer size matches HealthLogEntry.message
#if defined(__GNUC__)
__attribute__((format(printf, 3, 4)))
#endif
inline void logf(LogLevel level, LogCategory category, const char* fmt, ...) {
  char buffer[HEALTH_LOG_MESSAGE_LEN];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  ::health_log(level, category, buffer);
}

} // namespace health_logging

#endif // CROWDSCAN_HEALTH_LOG_H
