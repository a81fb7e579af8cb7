/*
 * CrowdScan - Preferences Settings Store
 *
 * SettingsStore over NVS through the Arduino Preferences library. All keys
 * live in one namespace; NVS limits key names to 15 characters.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_PREFERENCES_SETTINGS_STORE_H
#define CROWDSCAN_PREFERENCES_SETTINGS_STORE_H

#include <Preferences.h>
#include <mutex>
#include "crowdscan/storage/settings_store.h"

namespace crowdscan {
namespace platform {

static constexpr const char* NVS_NAMESPACE = "crowdscan";

class PreferencesSettingsStore : public storage::SettingsStore {
public:
  explicit PreferencesSettingsStore(const char* ns = NVS_NAMESPACE)
    : m_ns(ns), m_open(false), m_readOnly(false) {}
  ~PreferencesSettingsStore() { end(); }

  // Reopens read-write when write access is requested on a read-only session.
  bool begin(bool readOnly = false) override;
  void end() override;

  bool getBool(const char* key, bool defaultValue) override;
  bool putBool(const char* key, bool value) override;
  int32_t getInt(const char* key, int32_t defaultValue) override;
  bool putInt(const char* key, int32_t value) override;
  std::string getString(const char* key, const std::string& defaultValue) override;
  bool putString(const char* key, const std::string& value) override;
  bool getBlob(const char* key, std::vector<uint8_t>* out) override;
  bool putBlob(const char* key, const uint8_t* data, size_t len) override;
  bool isKey(const char* key) override;
  bool remove(const char* key) override;
  bool clear() override;

private:
  bool writable() const { return m_open && !m_readOnly; }

  const char* m_ns;
  std::mutex m_mutex;
  Preferences m_prefs;
  bool m_open;
  bool m_readOnly;
};

} // namespace platform
} // namespace crowdscan

#endif // CROWDSCAN_PREFERENCES_SETTINGS_STORE_H
