/*
 * CrowdScan - Application Settings Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/storage/settings.h"
#include "crowdscan/core/health_log.h"

namespace crowdscan {
namespace storage {

void Settings::putInt(const char* key, int32_t value) {
  if (!m_store.putInt(key, value)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Failed to persist setting", key);
  }
}

void Settings::putBool(const char* key, bool value) {
  if (!m_store.putBool(key, value)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Failed to persist setting", key);
  }
}

void Settings::putString(const char* key, const std::string& value) {
  if (!m_store.putString(key, value)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Failed to persist setting", key);
  }
}

// ════════════════════════════════════════════════════════════════════════════
// SESSION AND IDENTITY
// ════════════════════════════════════════════════════════════════════════════

bool Settings::isScanning() { return m_store.getBool(keys::IS_SCANNING, false); }
void Settings::setScanning(bool scanning) { putBool(keys::IS_SCANNING, scanning); }

std::string Settings::userUuid() { return m_store.getString(keys::USER_UUID, ""); }
void Settings::setUserUuid(const std::string& uuid) { putString(keys::USER_UUID, uuid); }

std::string Settings::server() {
  std::string url = m_store.getString(keys::SERVER, DEFAULT_SERVER_URL);
  if (url.empty()) url = DEFAULT_SERVER_URL;
  while (!url.empty() && url.back() == '/') url.pop_back();
  return url;
}
void Settings::setServer(const std::string& url) { putString(keys::SERVER, url); }

std::string Settings::vehicleType() { return m_store.getString(keys::VEHICLE_TYPE, ""); }
void Settings::setVehicleType(const std::string& type) { putString(keys::VEHICLE_TYPE, type); }

bool Settings::requireEstimationResult() {
  return m_store.getBool(keys::REQUIRE_ESTIMATION_RESULT, true);
}
void Settings::setRequireEstimationResult(bool required) {
  putBool(keys::REQUIRE_ESTIMATION_RESULT, required);
}

// ════════════════════════════════════════════════════════════════════════════
// PRIVACY AND GEO RESTRICTION
// ════════════════════════════════════════════════════════════════════════════

bool Settings::shouldRefreshSalt() { return m_store.getBool(keys::SHOULD_REFRESH_SALT, true); }
void Settings::setShouldRefreshSalt(bool refresh) { putBool(keys::SHOULD_REFRESH_SALT, refresh); }

bool Settings::isDataPrivacyEnabled() { return m_store.getBool(keys::DATA_PRIVACY_ENABLED, false); }
void Settings::setDataPrivacyEnabled(bool enabled) { putBool(keys::DATA_PRIVACY_ENABLED, enabled); }

bool Settings::isGeoRestrictionEnabled() {
  return m_store.getBool(keys::GEO_RESTRICTION_ENABLED, false);
}
void Settings::setGeoRestrictionEnabled(bool enabled) {
  putBool(keys::GEO_RESTRICTION_ENABLED, enabled);
}

std::string Settings::restrictedCitiesJson() {
  return m_store.getString(keys::RESTRICTED_CITIES, "[]");
}
void Settings::setRestrictedCitiesJson(const std::string& json) {
  putString(keys::RESTRICTED_CITIES, json);
}

// ════════════════════════════════════════════════════════════════════════════
// LOW-YIELD TUNING
// ════════════════════════════════════════════════════════════════════════════

uint32_t Settings::lowYieldMinDevices() {
  int32_t v = m_store.getInt(keys::LOW_YIELD_MIN_DEVICES, (int32_t)LOW_YIELD_MIN_DEVICES);
  if (v < LOW_YIELD_MIN_DEVICES_MIN || v > LOW_YIELD_MIN_DEVICES_MAX) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_STORAGE,
                         "lowYieldMin out of range (%d), using default", (int)v);
    return LOW_YIELD_MIN_DEVICES;
  }
  return (uint32_t)v;
}

bool Settings::setLowYieldMinDevices(int32_t devices) {
  if (devices < LOW_YIELD_MIN_DEVICES_MIN || devices > LOW_YIELD_MIN_DEVICES_MAX) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_USER,
                         "Rejected lowYieldMin=%d (range %d-%d)", (int)devices,
                         (int)LOW_YIELD_MIN_DEVICES_MIN, (int)LOW_YIELD_MIN_DEVICES_MAX);
    return false;
  }
  putInt(keys::LOW_YIELD_MIN_DEVICES, devices);
  return true;
}

uint32_t Settings::lowYieldGraceMs() {
  int32_t s = m_store.getInt(keys::LOW_YIELD_GRACE_S, (int32_t)(LOW_YIELD_GRACE_MS / 1000));
  if (s < LOW_YIELD_GRACE_S_MIN || s > LOW_YIELD_GRACE_S_MAX) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_STORAGE,
                         "lowYieldGraceS out of range (%d), using default", (int)s);
    return LOW_YIELD_GRACE_MS;
  }
  return (uint32_t)s * 1000;
}

bool Settings::setLowYieldGraceSeconds(int32_t seconds) {
  if (seconds < LOW_YIELD_GRACE_S_MIN || seconds > LOW_YIELD_GRACE_S_MAX) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_USER,
                         "Rejected lowYieldGraceS=%d (range %d-%d)", (int)seconds,
                         (int)LOW_YIELD_GRACE_S_MIN, (int)LOW_YIELD_GRACE_S_MAX);
    return false;
  }
  putInt(keys::LOW_YIELD_GRACE_S, seconds);
  return true;
}

// ════════════════════════════════════════════════════════════════════════════
// TRIP CALIBRATION
// ════════════════════════════════════════════════════════════════════════════

CalibrationCounters Settings::calibration() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  CalibrationCounters c;
  c.count = getInt(keys::CAL_COUNT);
  c.boarding = getInt(keys::CAL_BOARDING);
  c.alighting = getInt(keys::CAL_ALIGHTING);
  c.boarding_total = getInt(keys::CAL_BOARDING_TOTAL);
  c.alighting_total = getInt(keys::CAL_ALIGHTING_TOTAL);
  return c;
}

std::string Settings::calibrationTripName() { return m_store.getString(keys::CAL_TRIP_NAME, ""); }
void Settings::setCalibrationTripName(const std::string& name) { putString(keys::CAL_TRIP_NAME, name); }

void Settings::incrementCalibrationCount() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  putInt(keys::CAL_COUNT, getInt(keys::CAL_COUNT) + 1);
}

void Settings::decrementCalibrationCount() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  int32_t count = getInt(keys::CAL_COUNT);
  if (count > 0) putInt(keys::CAL_COUNT, count - 1);
}

void Settings::setManualCalibrationCount(int32_t count) {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  putInt(keys::CAL_COUNT, count < 0 ? 0 : count);
}

void Settings::incrementBoarding() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  putInt(keys::CAL_BOARDING, getInt(keys::CAL_BOARDING) + 1);
  putInt(keys::CAL_BOARDING_TOTAL, getInt(keys::CAL_BOARDING_TOTAL) + 1);
  putInt(keys::CAL_COUNT, getInt(keys::CAL_COUNT) + 1);
}

void Settings::decrementBoarding() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  int32_t count = getInt(keys::CAL_COUNT);
  int32_t boarding = getInt(keys::CAL_BOARDING);
  if (count > 0 && boarding > 0) {
    putInt(keys::CAL_BOARDING, boarding - 1);
    putInt(keys::CAL_BOARDING_TOTAL, getInt(keys::CAL_BOARDING_TOTAL) - 1);
    putInt(keys::CAL_COUNT, count - 1);
  }
}

void Settings::incrementAlighting() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  int32_t count = getInt(keys::CAL_COUNT);
  if (count > 0) {
    putInt(keys::CAL_ALIGHTING, getInt(keys::CAL_ALIGHTING) + 1);
    putInt(keys::CAL_ALIGHTING_TOTAL, getInt(keys::CAL_ALIGHTING_TOTAL) + 1);
    putInt(keys::CAL_COUNT, count - 1);
  }
}

void Settings::decrementAlighting() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  int32_t alighting = getInt(keys::CAL_ALIGHTING);
  if (alighting > 0) {
    putInt(keys::CAL_ALIGHTING, alighting - 1);
    putInt(keys::CAL_ALIGHTING_TOTAL, getInt(keys::CAL_ALIGHTING_TOTAL) - 1);
    putInt(keys::CAL_COUNT, getInt(keys::CAL_COUNT) + 1);
  }
}

void Settings::nextStop() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  putInt(keys::CAL_BOARDING, 0);
  putInt(keys::CAL_ALIGHTING, 0);
}

void Settings::resetCalibration() {
  std::lock_guard<std::mutex> lock(m_cal_mutex);
  putInt(keys::CAL_COUNT, 0);
  putInt(keys::CAL_BOARDING, 0);
  putInt(keys::CAL_ALIGHTING, 0);
  putInt(keys::CAL_BOARDING_TOTAL, 0);
  putInt(keys::CAL_ALIGHTING_TOTAL, 0);
}

} // namespace storage
} // namespace crowdscan
