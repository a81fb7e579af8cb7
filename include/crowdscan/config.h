/*
 * CrowdScan - Compile-time Configuration
 *
 * Defaults for timing, thresholds, endpoints and file names. Values marked
 * as tunable can be overridden at runtime through Settings.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_CONFIG_H
#define CROWDSCAN_CONFIG_H

#include <stddef.h>
#include <stdint.h>

// -------------------- Identity --------------------
static constexpr const char* APP_NAME         = "crowdscan";
static constexpr const char* APP_VERSION_NAME = "0.1.0";

// -------------------- Discovery aggregator --------------------
static constexpr uint32_t BATCH_REPORT_DELAY_MS        = 200;
static constexpr uint32_t COUNT_DEBOUNCE_MS            = BATCH_REPORT_DELAY_MS * 2;
static constexpr uint32_t INITIAL_SCAN_PERIOD_MS       = 10'000;   // Low-latency phase
static constexpr uint32_t BATCH_SWITCH_GAP_MS          = 100;
static constexpr uint32_t RADIO_INIT_RETRY_DELAY_MS    = 1000;
static constexpr uint8_t  RADIO_INIT_RETRIES           = 3;
static constexpr uint32_t BLE_RESTART_DELAY_MS         = 1000;
static constexpr uint32_t CLASSIC_RESTART_DELAY_MS     = 500;

// -------------------- Orchestrator --------------------
static constexpr uint32_t SYNC_PERIOD_MS               = 10'000;
static constexpr uint32_t INITIAL_FIX_TIMEOUT_MS       = 30'000;
static constexpr uint32_t LOW_YIELD_MIN_DEVICES        = 5;        // tunable
static constexpr uint32_t LOW_YIELD_GRACE_MS           = 5 * 60 * 1000;  // tunable
static constexpr uint32_t LOW_YIELD_RESTART_DELAY_MS   = 500;
static constexpr uint64_t SALT_ROTATION_INTERVAL_MS    = 2ULL * 60 * 60 * 1000;
static constexpr uint8_t  MAX_INFLIGHT_SUBMISSIONS     = 2;        // Running + one overlap

// -------------------- Location --------------------
static constexpr uint32_t LOCATION_UPDATE_INTERVAL_MS  = 5000;

// -------------------- Geo gate --------------------
static constexpr double   ROUTE_PROXIMITY_THRESHOLD_M  = 300.0;
static constexpr double   EARTH_RADIUS_M               = 6371000.0;
static constexpr const char* ROUTE_FILE_PREFIX         = "gtfs_";
static constexpr const char* ROUTE_FILE_SUFFIX         = ".txt";

// -------------------- Sync --------------------
static constexpr const char* DEFAULT_SERVER_URL        = "https://prod.urbanvind.com";
static constexpr const char* SYNC_ENDPOINT_PATH        = "/api/prototype/save_discoveries";
static constexpr uint32_t HTTP_TIMEOUT_MS              = 30'000;

// -------------------- Persistence --------------------
static constexpr const char* CACHE_FILE_NAME           = "crowdflow_requests_cache.json";
static constexpr size_t   CACHE_MAX_ENTRIES            = 200;
// Largest ArduinoJson document built for the cache file or a merged
// payload; 0 sizes documents from their input alone
static constexpr size_t   JSON_DOCUMENT_BUDGET         = 0;
static constexpr const char* SETTINGS_FILE_NAME        = "crowdscan_settings.json";
static constexpr const char* METADATA_FILE_NAME        = "bt_metadata.json";

// -------------------- Privacy --------------------
static constexpr size_t   SECRET_KEY_BYTES             = 32;
static constexpr size_t   SALT_BYTES                   = 16;

#endif // CROWDSCAN_CONFIG_H
