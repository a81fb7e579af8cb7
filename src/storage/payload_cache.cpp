/*
 * CrowdScan - Payload Cache Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/storage/payload_cache.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/storage/file_io.h"

#include <ArduinoJson.h>

namespace crowdscan {
namespace storage {

PayloadCache::PayloadCache(const std::string& path, size_t maxEntries, size_t documentBudget)
  : m_path(path), m_max_entries(maxEntries > 0 ? maxEntries : 1),
    m_document_budget(documentBudget) {}

bool PayloadCache::loadLocked(std::vector<std::string>* entries) {
  entries->clear();
  std::string text;
  if (!read_text_file(m_path, &text) || text.empty()) {
    return true;
  }

  DynamicJsonDocument doc(json_capacity_for(text.size(), m_document_budget));
  DeserializationError err = deserializeJson(doc, text);
  if (err == DeserializationError::NoMemory || doc.overflowed()) {
    health_logging::logf(LOG_LEVEL_ERROR, LOG_CAT_STORAGE,
                         "Cache file (%u bytes) does not fit in memory", (unsigned)text.size());
    return false;
  }
  if (err) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_STORAGE, "Cache file malformed, treating as empty", err.c_str());
    return true;
  }
  if (!doc.is<JsonArray>()) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_STORAGE, "Cache file is not an array, treating as empty");
    return true;
  }

  for (JsonVariant v : doc.as<JsonArray>()) {
    if (!v.is<JsonObject>()) continue;
    std::string entry;
    serializeJson(v, entry);
    entries->push_back(std::move(entry));
  }
  return true;
}

bool PayloadCache::writeLocked(const std::vector<std::string>& entries) {
  // Entries are validated JSON objects; join them without a second parse
  std::string out = "[";
  for (size_t i = 0; i < entries.size(); i++) {
    if (i) out += ",";
    out += entries[i];
  }
  out += "]";
  if (!replace_text_file(m_path, out)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Cache write failed", m_path.c_str());
    return false;
  }
  return true;
}

bool PayloadCache::append(const std::string& entryJson) {
  DynamicJsonDocument incoming(json_capacity_for(entryJson.size(), m_document_budget));
  DeserializationError err = deserializeJson(incoming, entryJson);
  if (err || !incoming.is<JsonObject>()) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Refusing to cache non-object payload",
               err ? err.c_str() : "not an object");
    return false;
  }
  std::string compact;
  serializeJson(incoming, compact);

  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> entries;
  if (!loadLocked(&entries)) {
    // Rewriting would drop every entry that could not be read
    health_log(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Cache left as is, entry not cached");
    return false;
  }
  entries.push_back(std::move(compact));

  size_t evicted = 0;
  if (entries.size() > m_max_entries) {
    evicted = entries.size() - m_max_entries;
    entries.erase(entries.begin(), entries.begin() + (long)evicted);
  }
  if (evicted) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_STORAGE,
                         "Cache full, evicted %u oldest entries", (unsigned)evicted);
  }

  if (!writeLocked(entries)) return false;
  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_STORAGE, "Cached payload (%u entries)",
                       (unsigned)entries.size());
  return true;
}

bool PayloadCache::load(std::vector<std::string>* entries) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return loadLocked(entries);
}

bool PayloadCache::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!remove_file(m_path)) {
    // Fall back to truncating the log
    return writeLocked(std::vector<std::string>());
  }
  return true;
}

bool PayloadCache::hasData() {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> entries;
  if (!loadLocked(&entries)) return true;
  return !entries.empty();
}

size_t PayloadCache::size() {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<std::string> entries;
  if (!loadLocked(&entries)) return 0;
  return entries.size();
}

} // namespace storage
} // namespace crowdscan
