/*
 * CrowdScan - Log Level Definitions
 *
 * Severity levels and categories for health and diagnostic logging.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_LOG_LEVEL_H
#define CROWDSCAN_LOG_LEVEL_H

#include <stdint.h>

// ════════════════════════════════════════════════════════════════════════════
// LOG SEVERITY LEVELS
// ════════════════════════════════════════════════════════════════════════════

enum LogLevel : uint8_t {
  LOG_LEVEL_DEBUG    = 0,   // Verbose debugging (not stored by default)
  LOG_LEVEL_INFO     = 1,   // Normal operational events
  LOG_LEVEL_NOTICE   = 2,   // Notable but expected events
  LOG_LEVEL_WARNING  = 3,   // Degraded operation, recovered automatically
  LOG_LEVEL_ERROR    = 4,   // Failed operation
  LOG_LEVEL_CRITICAL = 5,   // Scan or sync terminated
  LOG_LEVEL_ALERT    = 6    // Immediate action required
};

// ════════════════════════════════════════════════════════════════════════════
// LOG CATEGORIES
// ════════════════════════════════════════════════════════════════════════════

enum LogCategory : uint8_t {
  LOG_CAT_SYSTEM     = 0,   // Startup, lifecycle, state machine
  LOG_CAT_CRYPTO     = 1,   // Key material, salt rotation, hashing
  LOG_CAT_GPS        = 2,   // Location fixes, NMEA feed
  LOG_CAT_STORAGE    = 3,   // Payload cache, settings persistence
  LOG_CAT_NETWORK    = 4,   // HTTP transport
  LOG_CAT_BLUETOOTH  = 5,   // Discovery sources and aggregation
  LOG_CAT_SYNC       = 6,   // Batch build, merge, delivery
  LOG_CAT_GEO        = 7,   // Region and route checks
  LOG_CAT_USER       = 8    // Calibration and trip actions
};

// ════════════════════════════════════════════════════════════════════════════
// HELPER FUNCTIONS
// ════════════════════════════════════════════════════════════════════════════

inline const char* log_level_name(LogLevel level) {
  switch (level) {
    case LOG_LEVEL_DEBUG:    return "DEBUG";
    case LOG_LEVEL_INFO:     return "INFO";
    case LOG_LEVEL_NOTICE:   return "NOTICE";
    case LOG_LEVEL_WARNING:  return "WARN";
    case LOG_LEVEL_ERROR:    return "ERROR";
    case LOG_LEVEL_CRITICAL: return "CRIT";
    case LOG_LEVEL_ALERT:    return "ALERT";
    default:                 return "???";
  }
}

inline const char* log_category_name(LogCategory cat) {
  switch (cat) {
    case LOG_CAT_SYSTEM:    return "SYSTEM";
    case LOG_CAT_CRYPTO:    return "CRYPTO";
    case LOG_CAT_GPS:       return "GPS";
    case LOG_CAT_STORAGE:   return "STORAGE";
    case LOG_CAT_NETWORK:   return "NETWORK";
    case LOG_CAT_BLUETOOTH: return "BLUETOOTH";
    case LOG_CAT_SYNC:      return "SYNC";
    case LOG_CAT_GEO:       return "GEO";
    case LOG_CAT_USER:      return "USER";
    default:                return "???";
  }
}

#endif // CROWDSCAN_LOG_LEVEL_H
