/*
 * CrowdScan - Bluetooth Assigned Numbers
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/scan/bt_metadata.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/storage/file_io.h"

#include <ArduinoJson.h>
#include <cctype>
#include <cstdlib>

namespace crowdscan {
namespace scan {

static bool value_to_int(JsonVariant v, long* out) {
  if (v.is<long>()) {
    *out = v.as<long>();
    return true;
  }
  if (!v.is<const char*>()) return false;
  const char* s = v.as<const char*>();
  if (!s || !*s) return false;
  char* end = nullptr;
  long parsed = strtol(s, &end, 0);   // Accepts "76" and "0x004C"
  if (end == s || *end != '\0') return false;
  *out = parsed;
  return true;
}

std::string BtMetadata::normalizeName(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (char c : name) {
    if (c == ' ') out.push_back('_');
    else if (c == '-') continue;
    else out.push_back((char)tolower((unsigned char)c));
  }
  return out;
}

bool BtMetadata::loadFromJson(const std::string& json) {
  DynamicJsonDocument doc(storage::json_capacity_for(json.size()));
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Metadata parse failed", err.c_str());
    return false;
  }

  std::map<uint16_t, std::string> companies;
  std::map<uint8_t, std::string> ad_types;

  for (JsonObject item : doc["company_identifiers"].as<JsonArray>()) {
    long value = 0;
    const char* name = item["name"];
    JsonVariant raw = item["value"];
    if (!name || !value_to_int(raw, &value) || value < 0 || value > 0xFFFF) continue;
    companies[(uint16_t)value] = name;
  }
  for (JsonObject item : doc["ad_types"].as<JsonArray>()) {
    long value = 0;
    const char* name = item["name"];
    JsonVariant raw = item["value"];
    if (!name || !value_to_int(raw, &value) || value < 0 || value > 0xFF) continue;
    ad_types[(uint8_t)value] = normalizeName(name);
  }

  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH,
                       "Loaded %u company identifiers, %u AD types",
                       (unsigned)companies.size(), (unsigned)ad_types.size());

  std::lock_guard<std::mutex> lock(m_mutex);
  m_companies.swap(companies);
  m_ad_types.swap(ad_types);
  return !m_companies.empty() && !m_ad_types.empty();
}

bool BtMetadata::loadFromFile(const std::string& path) {
  std::string text;
  if (!storage::read_text_file(path, &text)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Metadata file unreadable", path.c_str());
    return false;
  }
  return loadFromJson(text);
}

bool BtMetadata::isLoaded() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return !m_companies.empty() && !m_ad_types.empty();
}

std::string BtMetadata::companyName(uint16_t companyId) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_companies.find(companyId);
  return it != m_companies.end() ? it->second : std::string();
}

std::string BtMetadata::adTypeName(uint8_t adType) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_ad_types.find(adType);
  return it != m_ad_types.end() ? it->second : std::string();
}

size_t BtMetadata::companyCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_companies.size();
}

size_t BtMetadata::adTypeCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_ad_types.size();
}

} // namespace scan
} // namespace crowdscan
