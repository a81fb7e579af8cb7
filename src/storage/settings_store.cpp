/*
 * CrowdScan - Settings Store Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/storage/settings_store.h"
#include "crowdscan/core/encoding.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"
#include "crowdscan/storage/file_io.h"

#include <ArduinoJson.h>

namespace crowdscan {
namespace storage {

// ════════════════════════════════════════════════════════════════════════════
// MEMORY STORE
// ════════════════════════════════════════════════════════════════════════════

bool MemorySettingsStore::begin(bool readOnly) {
  (void)readOnly;
  std::lock_guard<std::mutex> lock(m_mutex);
  m_open = true;
  return true;
}

void MemorySettingsStore::end() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_open = false;
}

bool MemorySettingsStore::getBool(const char* key, bool defaultValue) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_bools.find(key);
  return it != m_bools.end() ? it->second : defaultValue;
}

bool MemorySettingsStore::putBool(const char* key, bool value) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_bools[key] = value;
  return commit();
}

int32_t MemorySettingsStore::getInt(const char* key, int32_t defaultValue) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_ints.find(key);
  return it != m_ints.end() ? it->second : defaultValue;
}

bool MemorySettingsStore::putInt(const char* key, int32_t value) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_ints[key] = value;
  return commit();
}

std::string MemorySettingsStore::getString(const char* key, const std::string& defaultValue) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_strings.find(key);
  return it != m_strings.end() ? it->second : defaultValue;
}

bool MemorySettingsStore::putString(const char* key, const std::string& value) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_strings[key] = value;
  return commit();
}

bool MemorySettingsStore::getBlob(const char* key, std::vector<uint8_t>* out) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_blobs.find(key);
  if (it == m_blobs.end()) return false;
  *out = it->second;
  return true;
}

bool MemorySettingsStore::putBlob(const char* key, const uint8_t* data, size_t len) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_blobs[key] = std::vector<uint8_t>(data, data + len);
  return commit();
}

bool MemorySettingsStore::isKey(const char* key) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_bools.count(key) || m_ints.count(key) || m_strings.count(key) || m_blobs.count(key);
}

bool MemorySettingsStore::remove(const char* key) {
  std::lock_guard<std::mutex> lock(m_mutex);
  size_t n = m_bools.erase(key) + m_ints.erase(key) + m_strings.erase(key) + m_blobs.erase(key);
  if (n == 0) return false;
  return commit();
}

bool MemorySettingsStore::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_bools.clear();
  m_ints.clear();
  m_strings.clear();
  for (auto& kv : m_blobs) {
    if (!kv.second.empty()) secure_wipe(kv.second.data(), kv.second.size());
  }
  m_blobs.clear();
  return commit();
}

// ════════════════════════════════════════════════════════════════════════════
// JSON FILE STORE
// ════════════════════════════════════════════════════════════════════════════

bool JsonFileSettingsStore::begin(bool readOnly) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_open) {
    m_readOnly = m_readOnly && readOnly;
    return true;
  }
  m_readOnly = readOnly;
  m_open = true;
  return load();
}

bool JsonFileSettingsStore::load() {
  m_bools.clear();
  m_ints.clear();
  m_strings.clear();
  m_blobs.clear();

  std::string text;
  if (!read_text_file(m_path, &text)) {
    health_logging::log(LOG_LEVEL_INFO, LOG_CAT_STORAGE, "Settings file absent, using defaults",
                        m_path.c_str());
    return true;
  }

  DynamicJsonDocument doc(json_capacity_for(text.size()));
  DeserializationError err = deserializeJson(doc, text);
  if (err) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_STORAGE, "Settings file malformed, ignoring", err.c_str());
    return true;
  }

  for (JsonPair kv : doc["bool"].as<JsonObject>()) {
    m_bools[kv.key().c_str()] = kv.value().as<bool>();
  }
  for (JsonPair kv : doc["int"].as<JsonObject>()) {
    m_ints[kv.key().c_str()] = kv.value().as<int32_t>();
  }
  for (JsonPair kv : doc["str"].as<JsonObject>()) {
    m_strings[kv.key().c_str()] = kv.value().as<std::string>();
  }
  for (JsonPair kv : doc["blob"].as<JsonObject>()) {
    std::vector<uint8_t> bytes;
    if (from_hex(kv.value().as<std::string>(), &bytes)) {
      m_blobs[kv.key().c_str()] = bytes;
    } else {
      log_health(LOG_LEVEL_WARNING, LOG_CAT_STORAGE, "Settings blob not hex, dropped", kv.key().c_str());
    }
  }
  health_logging::logf(LOG_LEVEL_DEBUG, LOG_CAT_STORAGE, "Settings loaded: %u keys",
                       (unsigned)(m_bools.size() + m_ints.size() + m_strings.size() + m_blobs.size()));
  return true;
}

bool JsonFileSettingsStore::commit() {
  if (m_readOnly) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_STORAGE, "Settings write in read-only session");
    return false;
  }

  size_t estimate = 256;
  for (auto& kv : m_strings) estimate += kv.first.size() + kv.second.size() + 64;
  for (auto& kv : m_blobs) estimate += kv.first.size() + kv.second.size() * 2 + 64;
  estimate += (m_bools.size() + m_ints.size()) * 96;

  DynamicJsonDocument doc(estimate);
  JsonObject bools = doc.createNestedObject("bool");
  for (auto& kv : m_bools) bools[kv.first] = kv.second;
  JsonObject ints = doc.createNestedObject("int");
  for (auto& kv : m_ints) ints[kv.first] = kv.second;
  JsonObject strs = doc.createNestedObject("str");
  for (auto& kv : m_strings) strs[kv.first] = kv.second;
  JsonObject blobs = doc.createNestedObject("blob");
  for (auto& kv : m_blobs) blobs[kv.first] = to_hex(kv.second);

  if (doc.overflowed()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Settings document overflow");
    return false;
  }

  std::string out;
  serializeJson(doc, out);
  if (!replace_text_file(m_path, out)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Settings write failed", m_path.c_str());
    return false;
  }
  return true;
}

} // namespace storage
} // namespace crowdscan
