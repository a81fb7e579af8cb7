/*
 * CrowdScan - Sync Pipeline Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/sync/sync_pipeline.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/storage/file_io.h"

#include <ArduinoJson.h>
#include <cmath>
#include <stdlib.h>

namespace crowdscan {
namespace sync {

static const char* KEY_PERIODS = "periods";
static const char* KEY_UUID    = "uuid";
static const char* DEVICE_LISTS[] = { "devices", "classic_devices" };

const char* sync_outcome_name(SyncOutcome outcome) {
  switch (outcome) {
    case SYNC_SUCCESS:       return "SUCCESS";
    case SYNC_FAILED_CACHED: return "FAILED_CACHED";
    case SYNC_FAILED:        return "FAILED";
    case SYNC_SKIPPED_EMPTY: return "SKIPPED_EMPTY";
    default:                 return "UNKNOWN";
  }
}

// Numbers or numeric strings, truncated toward zero; anything else is 0
static int32_t lenient_int(JsonVariant v) {
  double d = 0.0;
  if (v.is<double>() || v.is<long>()) {
    d = v.as<double>();
  } else if (v.is<const char*>()) {
    const char* s = v.as<const char*>();
    char* end = nullptr;
    d = strtod(s, &end);
    if (end == s || *end != '\0') return 0;
  } else {
    return 0;
  }
  if (std::isnan(d) || d > 2147483647.0 || d < -2147483648.0) return 0;
  return (int32_t)d;
}

ServerResponse SyncPipeline::parseResponse(const std::string& body) {
  ServerResponse r;
  if (body.empty()) return r;

  DynamicJsonDocument doc(storage::json_capacity_for(body.size()));
  DeserializationError err = deserializeJson(doc, body);
  if (err) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_SYNC, "Server response not JSON", err.c_str());
    return r;
  }
  if (!doc.is<JsonObject>()) return r;

  JsonVariant status = doc["status"];
  if (status.is<const char*>()) {
    r.status = status.as<const char*>();
  } else if (!status.isNull()) {
    serializeJson(status, r.status);
  }
  r.estimated_crowd = lenient_int(doc["estimatedCrowd"]);
  r.recently_seen = lenient_int(doc["recentlySeen"]);
  r.recently_seen_window_ms = lenient_int(doc["recentlySeenWindowMs"]);
  return r;
}

// ════════════════════════════════════════════════════════════════════════════
// MERGE
// ════════════════════════════════════════════════════════════════════════════

bool SyncPipeline::mergeEntries(const std::vector<std::string>& entries, std::string* out,
                               size_t* deviceCount, size_t documentBudget) {
  out->clear();
  size_t total_len = 0;
  for (const std::string& e : entries) total_len += e.size();

  DynamicJsonDocument merged(storage::json_capacity_for(total_len, documentBudget));
  JsonObject periods = merged.createNestedObject(KEY_PERIODS);
  bool any = false;

  for (const std::string& entry : entries) {
    DynamicJsonDocument doc(storage::json_capacity_for(entry.size(), documentBudget));
    DeserializationError err = deserializeJson(doc, entry);
    if (err == DeserializationError::NoMemory || doc.overflowed()) {
      health_logging::logf(LOG_LEVEL_ERROR, LOG_CAT_SYNC, "Batch (%u bytes) does not fit in memory",
                           (unsigned)entry.size());
      return false;
    }
    if (err || !doc.is<JsonObject>()) {
      log_health(LOG_LEVEL_WARNING, LOG_CAT_SYNC, "Skipping unreadable batch", err.c_str());
      continue;
    }
    any = true;
    JsonObject obj = doc.as<JsonObject>();

    // Metadata: later entries overwrite, uuid keeps the first non-empty one
    for (JsonPair kv : obj) {
      std::string key = kv.key().c_str();
      if (key == KEY_PERIODS) continue;
      if (key == KEY_UUID) {
        const char* existing = merged[KEY_UUID] | "";
        const char* incoming = kv.value() | "";
        if (existing[0] != '\0' && incoming[0] == '\0') continue;
      }
      merged[key] = kv.value();
    }

    JsonObject src_periods = obj[KEY_PERIODS];
    if (src_periods.isNull()) continue;
    for (JsonPair p : src_periods) {
      std::string period_key = p.key().c_str();
      JsonObject src = p.value().as<JsonObject>();
      if (src.isNull()) continue;

      JsonObject dst = periods[period_key];
      if (dst.isNull()) {
        periods[period_key] = src;
        continue;
      }
      for (const char* list : DEVICE_LISTS) {
        JsonArray from = src[list];
        if (from.isNull()) continue;
        JsonArray to = dst[list];
        if (to.isNull()) to = dst.createNestedArray(list);
        for (JsonVariant d : from) to.add(d);
      }
    }
  }

  if (merged.overflowed()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_SYNC, "Merged payload overflowed");
    return false;
  }
  if (!any) return true;

  size_t count = 0;
  for (JsonPair p : periods) {
    for (const char* list : DEVICE_LISTS) {
      JsonArray arr = p.value()[list];
      if (!arr.isNull()) count += arr.size();
    }
  }
  if (deviceCount) *deviceCount = count;

  serializeJson(merged, *out);
  return true;
}

// ════════════════════════════════════════════════════════════════════════════
// SUBMIT
// ════════════════════════════════════════════════════════════════════════════

std::string SyncPipeline::endpointUrl() {
  return m_settings.server() + SYNC_ENDPOINT_PATH;
}

SyncResult SyncPipeline::submit(const SyncBatch& batch, double lat, double lon) {
  std::lock_guard<std::mutex> lock(m_submit_mutex);
  SyncResult result;

  std::vector<std::string> cached;
  bool merged = m_cache.load(&cached);

  std::vector<std::string> entries = cached;
  if (batch.valid()) entries.push_back(batch.json());

  size_t devices = 0;
  std::string payload;
  if (merged) merged = mergeEntries(entries, &payload, &devices, m_document_budget);
  if (!merged) {
    // The cache stays on disk as is; only the new batch goes out
    health_log(LOG_LEVEL_ERROR, LOG_CAT_SYNC, "Cached batches do not fit in memory, sending new batch only");
    cached.clear();
    result.cache_deferred = true;
    payload = batch.json();
    devices = batch.deviceCount();
  }
  const bool is_retry = !cached.empty();
  result.merged_entries = cached.size();

  if (payload.empty() || devices == 0) {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_SYNC, "Nothing to sync, skipping request");
    if (is_retry && !m_cache.clear()) {
      health_log(LOG_LEVEL_WARNING, LOG_CAT_SYNC, "Could not clear empty cache");
    }
    result.outcome = SYNC_SKIPPED_EMPTY;
    return result;
  }

  health_logging::logf(LOG_LEVEL_DEBUG, LOG_CAT_SYNC, "Sending %u devices (%u cached batches)",
                       (unsigned)devices, (unsigned)cached.size());

  HttpHeaders headers;
  headers.emplace_back("Accept", "application/json");
  headers.emplace_back("Content-Type", "application/json");
  HttpResponse response = m_sender.post(endpointUrl(), payload, headers);

  if (response.isSuccess()) {
    if (response.has_body) {
      result.response = parseResponse(response.body);
      m_events.emitString(events::SERVER_STATUS_CHANGED, result.response.status);
      m_events.emit(events::PAX_ESTIMATED_CHANGED, result.response.estimated_crowd);
      m_events.emit(events::RECENTLY_SEEN_COUNT_CHANGED, result.response.recently_seen);
      m_events.emit(events::RECENTLY_SEEN_WINDOW_CHANGED, result.response.recently_seen_window_ms);
    } else {
      health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_SYNC, "Sync accepted (%d) without body",
                           response.status);
    }

    if (lat == 0.0 && lon == 0.0) {
      health_log(LOG_LEVEL_INFO, LOG_CAT_SYNC, "Synced without location, requesting restart");
      result.location_restart_requested = true;
    }

    if (is_retry) {
      if (!m_cache.clear()) {
        health_log(LOG_LEVEL_ERROR, LOG_CAT_SYNC, "Delivered cached batches but cache clear failed");
      }
      m_events.emit(events::SYNC_RETRY_SUCCEEDED, 1);
    }
    result.outcome = SYNC_SUCCESS;
    return result;
  }

  if (!response.transport_ok) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_NETWORK, "Sync transport error", response.error.c_str());
  } else {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_NETWORK, "Sync rejected with status %d",
                         response.status);
  }

  // Cached batches are still on disk; only the new batch is added
  if (batch.valid() && batch.deviceCount() > 0 && !m_cache.append(batch.json())) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Failed batch could not be cached, data lost");
    result.outcome = SYNC_FAILED;
    return result;
  }
  m_events.emit(events::SYNC_FAILED_AND_CACHED, 1);
  result.outcome = SYNC_FAILED_CACHED;
  return result;
}

} // namespace sync
} // namespace crowdscan
