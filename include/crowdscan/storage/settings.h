/*
 * CrowdScan - Application Settings
 *
 * Typed accessors over a SettingsStore: collector endpoint, identity,
 * privacy and geo-restriction switches, trip calibration counters and
 * bounded tuning values.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_SETTINGS_H
#define CROWDSCAN_SETTINGS_H

#include <mutex>
#include <stdint.h>
#include <string>
#include "crowdscan/config.h"
#include "crowdscan/storage/settings_store.h"

namespace crowdscan {
namespace storage {

// ════════════════════════════════════════════════════════════════════════════
// KEYS
// ════════════════════════════════════════════════════════════════════════════

namespace keys {
static constexpr const char* IS_SCANNING                = "isScanning";
static constexpr const char* USER_UUID                  = "userUUID";
static constexpr const char* SERVER                     = "server";
static constexpr const char* VEHICLE_TYPE               = "vehicleType";
static constexpr const char* REQUIRE_ESTIMATION_RESULT  = "reqEstimation";
static constexpr const char* SHOULD_REFRESH_SALT        = "refreshSalt";
static constexpr const char* GEO_RESTRICTION_ENABLED    = "geoRestrict";
static constexpr const char* RESTRICTED_CITIES          = "restrictCities";
static constexpr const char* DATA_PRIVACY_ENABLED       = "dataPrivacy";
static constexpr const char* CAL_COUNT                  = "calCount";
static constexpr const char* CAL_BOARDING               = "calBoarding";
static constexpr const char* CAL_ALIGHTING              = "calAlighting";
static constexpr const char* CAL_BOARDING_TOTAL         = "calBoardTotal";
static constexpr const char* CAL_ALIGHTING_TOTAL        = "calAlightTotal";
static constexpr const char* CAL_TRIP_NAME              = "calTripName";
static constexpr const char* LOW_YIELD_MIN_DEVICES      = "lowYieldMin";
static constexpr const char* LOW_YIELD_GRACE_S          = "lowYieldGraceS";
static constexpr const char* ANON_SECRET                = "anon_secret";
} // namespace keys

// ════════════════════════════════════════════════════════════════════════════
// BOUNDS
// ════════════════════════════════════════════════════════════════════════════

static constexpr int32_t LOW_YIELD_MIN_DEVICES_MIN = 1;
static constexpr int32_t LOW_YIELD_MIN_DEVICES_MAX = 500;
static constexpr int32_t LOW_YIELD_GRACE_S_MIN     = 30;
static constexpr int32_t LOW_YIELD_GRACE_S_MAX     = 3600;

// ════════════════════════════════════════════════════════════════════════════
// TYPES
// ════════════════════════════════════════════════════════════════════════════

struct CalibrationCounters {
  int32_t count;
  int32_t boarding;
  int32_t alighting;
  int32_t boarding_total;
  int32_t alighting_total;
};

// ════════════════════════════════════════════════════════════════════════════
// SETTINGS
// ════════════════════════════════════════════════════════════════════════════

class Settings {
public:
  explicit Settings(SettingsStore& store) : m_store(store) {}

  SettingsStore& store() { return m_store; }

  // ──────────────────────────────────────────────────────────────────────────
  // Session and identity
  // ──────────────────────────────────────────────────────────────────────────
  bool isScanning();
  void setScanning(bool scanning);

  std::string userUuid();
  void setUserUuid(const std::string& uuid);

  // Collector base URL, without trailing slash
  std::string server();
  void setServer(const std::string& url);

  std::string vehicleType();
  void setVehicleType(const std::string& type);

  bool requireEstimationResult();
  void setRequireEstimationResult(bool required);

  // ──────────────────────────────────────────────────────────────────────────
  // Privacy and geo restriction
  // ──────────────────────────────────────────────────────────────────────────
  bool shouldRefreshSalt();
  void setShouldRefreshSalt(bool refresh);

  bool isDataPrivacyEnabled();
  void setDataPrivacyEnabled(bool enabled);

  bool isGeoRestrictionEnabled();
  void setGeoRestrictionEnabled(bool enabled);

  // JSON array of {id, name, minLat, maxLat, minLong, maxLong}
  std::string restrictedCitiesJson();
  void setRestrictedCitiesJson(const std::string& json);

  // ──────────────────────────────────────────────────────────────────────────
  // Low-yield restart tuning (out-of-range values fall back to defaults)
  // ──────────────────────────────────────────────────────────────────────────
  uint32_t lowYieldMinDevices();
  bool setLowYieldMinDevices(int32_t devices);

  uint32_t lowYieldGraceMs();
  bool setLowYieldGraceSeconds(int32_t seconds);

  // ──────────────────────────────────────────────────────────────────────────
  // Trip calibration
  // ──────────────────────────────────────────────────────────────────────────
  CalibrationCounters calibration();
  std::string calibrationTripName();
  void setCalibrationTripName(const std::string& name);

  void incrementCalibrationCount();
  void decrementCalibrationCount();
  void setManualCalibrationCount(int32_t count);

  // Boarding adds a passenger; undo only while someone has boarded
  void incrementBoarding();
  void decrementBoarding();

  // Alighting removes a passenger; only possible while count > 0
  void incrementAlighting();
  void decrementAlighting();

  // Per-stop counters back to zero, totals kept
  void nextStop();
  void resetCalibration();

private:
  int32_t getInt(const char* key) { return m_store.getInt(key, 0); }
  void putInt(const char* key, int32_t value);
  void putBool(const char* key, bool value);
  void putString(const char* key, const std::string& value);

  SettingsStore& m_store;
  std::mutex m_cal_mutex;   // Read-modify-write of calibration counters
};

} // namespace storage
} // namespace crowdscan

#endif // CROWDSCAN_SETTINGS_H
