/*
 * CrowdScan - Payload Builder Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/sync/payload_builder.h"
#include "crowdscan/core/encoding.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"

#include <ArduinoJson.h>
#include <stdio.h>

namespace crowdscan {
namespace sync {

// Rough per-device budget: ~20 members plus parsed advertisement fields
static const size_t DEVICE_JSON_BUDGET = 3072;
static const size_t DOCUMENT_JSON_BUDGET = 2048;

static const char* FIELD_COMPLETE_NAME = "ble_complete_local_name";
static const char* FIELD_SHORT_NAME    = "ble_shortened_local_name";

static std::string local_name_of(const scan::Observation& obs) {
  auto it = obs.fields.find(FIELD_COMPLETE_NAME);
  if (it != obs.fields.end() && !it->second.empty()) return it->second;
  it = obs.fields.find(FIELD_SHORT_NAME);
  if (it != obs.fields.end() && !it->second.empty()) return it->second;
  return sanitize_utf8(obs.latest.name);
}

std::string PayloadBuilder::deviceId(const std::string& address) const {
  if (address.empty()) return "Unknown";
  return m_anonymizer.hash(address);
}

SyncBatch PayloadBuilder::build(const scan::DiscoverySnapshot& snapshot,
                                const location::LocationFix& fix) {
  return build(snapshot, fix, now_wall_ms());
}

SyncBatch PayloadBuilder::build(const scan::DiscoverySnapshot& snapshot,
                                const location::LocationFix& fix, uint64_t periodMs) {
  const double lat = fix.valid ? fix.lat : 0.0;
  const double lon = fix.valid ? fix.lon : 0.0;
  const uint64_t gps_fix = fix.valid ? fix.time_ms : 0;
  const bool privacy = m_settings.isDataPrivacyEnabled();
  const std::string vehicle = m_settings.vehicleType();
  const std::string trip = m_settings.calibrationTripName();
  const storage::CalibrationCounters cal = m_settings.calibration();
  const std::string period_key = std::to_string(periodMs);

  DynamicJsonDocument doc(DOCUMENT_JSON_BUDGET + snapshot.total() * DEVICE_JSON_BUDGET);
  doc["uuid"] = m_settings.userUuid();
  doc["calibrationTripName"] = trip;
  doc["vehicleType"] = vehicle;
  doc["requireEstimationResult"] = m_settings.requireEstimationResult();

  JsonObject period = doc.createNestedObject("periods").createNestedObject(period_key);

  JsonObject context = period.createNestedObject("context");
  context["lat"] = lat;
  context["lon"] = lon;
  context["gpsFix"] = gps_fix;
  context["vehicleType"] = vehicle;
  context["calibrationCount"] = cal.count;
  context["calibrationBoarding"] = cal.boarding;
  context["calibrationAlighting"] = cal.alighting;
  context["calibrationBoardingTotal"] = cal.boarding_total;
  context["calibrationAlightingTotal"] = cal.alighting_total;
  context["calibrationTripName"] = trip;

  // ── BLE devices ─────────────────────────────────────────────────────────
  JsonArray devices = period.createNestedArray("devices");
  for (const scan::Observation& obs : snapshot.ble) {
    const scan::DiscoveryRecord& rec = obs.latest;
    JsonObject d = devices.createNestedObject();
    d["device_id"] = deviceId(obs.identifier);
    d["device_name"] = sanitize_utf8(rec.name);
    d["observed_count"] = obs.count;
    d["rssi"] = rec.rssi;
    d["manufacturer_data"] = rec.manufacturer_data;

    JsonObject service_data = d.createNestedObject("serviceData");
    for (const auto& kv : rec.service_data) service_data[kv.first] = kv.second;
    JsonArray uuids = d.createNestedArray("serviceUUIDs");
    for (const std::string& u : rec.service_uuids) uuids.add(u);

    if (rec.has_tx_power) {
      d["txPowerLevel"] = rec.tx_power;
    } else {
      d["txPowerLevel"] = "N/A";
    }
    d["localName"] = local_name_of(obs);
    d["isConnectable"] = rec.connectable;
    d["lat"] = lat;
    d["lon"] = lon;
    d["gpsFix"] = gps_fix;
    d["timestamp"] = obs.last_seen_ms;
    d["scan_type"] = "ble";

    for (const auto& kv : obs.fields) d[kv.first] = kv.second;

    if (!privacy) {
      d["raw_data"] = to_hex(rec.raw_adv);
      d["device_id_raw"] = obs.identifier;
    }
  }

  // ── Classic devices ─────────────────────────────────────────────────────
  JsonArray classic = period.createNestedArray("classic_devices");
  for (const scan::Observation& obs : snapshot.classic) {
    const scan::DiscoveryRecord& rec = obs.latest;
    JsonObject d = classic.createNestedObject();
    d["device_id"] = deviceId(obs.identifier);
    d["device_name"] = sanitize_utf8(rec.name);
    d["observed_count"] = obs.count;
    d["lat"] = lat;
    d["lon"] = lon;
    d["gpsFix"] = gps_fix;
    d["timestamp"] = obs.last_seen_ms;
    d["scan_type"] = "classic";
    if (rec.has_rssi) d["rssi"] = rec.rssi;
    if (rec.has_device_class) {
      char cls[12];
      snprintf(cls, sizeof(cls), "%x", (unsigned)rec.device_class);
      d["device_class"] = cls;
    }
    if (!privacy) d["device_id_raw"] = obs.identifier;
  }

  doc["appVersionName"] = m_app_version;

  if (doc.overflowed()) {
    health_logging::logf(LOG_LEVEL_ERROR, LOG_CAT_SYNC, "Batch document overflowed (%u devices)",
                         (unsigned)snapshot.total());
    return SyncBatch();
  }

  std::string json;
  serializeJson(doc, json);
  health_logging::logf(LOG_LEVEL_DEBUG, LOG_CAT_SYNC, "Batch %s built: %u ble, %u classic",
                       period_key.c_str(), (unsigned)snapshot.ble.size(),
                       (unsigned)snapshot.classic.size());
  return SyncBatch(period_key, json, snapshot.ble.size(), snapshot.classic.size());
}

} // namespace sync
} // namespace crowdscan
