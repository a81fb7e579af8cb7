/*
 * CrowdScan - Preferences Settings Store Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/platform/esp32/preferences_settings_store.h"
#include "crowdscan/core/health_log.h"

namespace crowdscan {
namespace platform {

bool PreferencesSettingsStore::begin(bool readOnly) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_open) {
    if (m_readOnly && !readOnly) {
      m_prefs.end();
      m_open = false;
    } else {
      return true;
    }
  }
  m_open = m_prefs.begin(m_ns, readOnly);
  m_readOnly = readOnly;
  if (!m_open) log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "NVS open failed", m_ns);
  return m_open;
}

void PreferencesSettingsStore::end() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_open) {
    m_prefs.end();
    m_open = false;
  }
}

// ── Scalars ─────────────────────────────────────────────────────────────────

bool PreferencesSettingsStore::getBool(const char* key, bool defaultValue) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_open || !m_prefs.isKey(key)) return defaultValue;
  return m_prefs.getBool(key, defaultValue);
}

bool PreferencesSettingsStore::putBool(const char* key, bool value) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writable() && m_prefs.putBool(key, value) > 0;
}

int32_t PreferencesSettingsStore::getInt(const char* key, int32_t defaultValue) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_open || !m_prefs.isKey(key)) return defaultValue;
  return m_prefs.getInt(key, defaultValue);
}

bool PreferencesSettingsStore::putInt(const char* key, int32_t value) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writable() && m_prefs.putInt(key, value) > 0;
}

std::string PreferencesSettingsStore::getString(const char* key, const std::string& defaultValue) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_open || !m_prefs.isKey(key)) return defaultValue;
  String v = m_prefs.getString(key, defaultValue.c_str());
  return std::string(v.c_str(), v.length());
}

bool PreferencesSettingsStore::putString(const char* key, const std::string& value) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!writable()) return false;
  // putString reports 0 bytes for an empty value
  return m_prefs.putString(key, value.c_str()) > 0 || value.empty();
}

// ── Blobs ───────────────────────────────────────────────────────────────────

bool PreferencesSettingsStore::getBlob(const char* key, std::vector<uint8_t>* out) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_open || !m_prefs.isKey(key)) return false;
  size_t len = m_prefs.getBytesLength(key);
  out->assign(len, 0);
  if (len == 0) return true;
  return m_prefs.getBytes(key, out->data(), len) == len;
}

bool PreferencesSettingsStore::putBlob(const char* key, const uint8_t* data, size_t len) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writable() && m_prefs.putBytes(key, data, len) == len;
}

bool PreferencesSettingsStore::isKey(const char* key) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_open && m_prefs.isKey(key);
}

bool PreferencesSettingsStore::remove(const char* key) {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writable() && m_prefs.remove(key);
}

bool PreferencesSettingsStore::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  return writable() && m_prefs.clear();
}

} // namespace platform
} // namespace crowdscan
