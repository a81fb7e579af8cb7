/*
 * CrowdScan - Settings Store
 *
 * Typed key-value persistence behind an abstract interface. The ESP32 build
 * backs it with NVS (Arduino Preferences), the host build with a JSON file,
 * tests with memory.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_SETTINGS_STORE_H
#define CROWDSCAN_SETTINGS_STORE_H

#include <map>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

namespace crowdscan {
namespace storage {

// ════════════════════════════════════════════════════════════════════════════
// INTERFACE
// ════════════════════════════════════════════════════════════════════════════

class SettingsStore {
public:
  virtual ~SettingsStore() {}

  // Open the store. Returns true on success; calling twice is harmless.
  virtual bool begin(bool readOnly = false) = 0;
  virtual void end() = 0;

  // ──────────────────────────────────────────────────────────────────────────
  // Typed access. put* returns false when the value could not be persisted.
  // ──────────────────────────────────────────────────────────────────────────
  virtual bool getBool(const char* key, bool defaultValue) = 0;
  virtual bool putBool(const char* key, bool value) = 0;

  virtual int32_t getInt(const char* key, int32_t defaultValue) = 0;
  virtual bool putInt(const char* key, int32_t value) = 0;

  virtual std::string getString(const char* key, const std::string& defaultValue) = 0;
  virtual bool putString(const char* key, const std::string& value) = 0;

  // Returns false if the key is absent.
  virtual bool getBlob(const char* key, std::vector<uint8_t>* out) = 0;
  virtual bool putBlob(const char* key, const uint8_t* data, size_t len) = 0;

  virtual bool isKey(const char* key) = 0;
  virtual bool remove(const char* key) = 0;
  virtual bool clear() = 0;
};

// ════════════════════════════════════════════════════════════════════════════
// MEMORY STORE
// ════════════════════════════════════════════════════════════════════════════

class MemorySettingsStore : public SettingsStore {
public:
  MemorySettingsStore() : m_open(false) {}

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

protected:
  // Called after every mutation with the lock held.
  virtual bool commit() { return true; }

  std::mutex m_mutex;
  std::map<std::string, bool> m_bools;
  std::map<std::string, int32_t> m_ints;
  std::map<std::string, std::string> m_strings;
  std::map<std::string, std::vector<uint8_t>> m_blobs;
  bool m_open;
};

// ════════════════════════════════════════════════════════════════════════════
// JSON FILE STORE
// ════════════════════════════════════════════════════════════════════════════

/*
 * Write-through store persisted as one JSON document:
 *   {"bool":{...},"int":{...},"str":{...},"blob":{"key":"<hex>"}}
 * A missing or malformed file starts empty.
 */
class JsonFileSettingsStore : public MemorySettingsStore {
public:
  explicit JsonFileSettingsStore(const std::string& path) : m_path(path), m_readOnly(false) {}

  bool begin(bool readOnly = false) override;

  const std::string& path() const { return m_path; }

protected:
  bool commit() override;

private:
  bool load();

  std::string m_path;
  bool m_readOnly;
};

} // namespace storage
} // namespace crowdscan

#endif // CROWDSCAN_SETTINGS_STORE_H
