/*
 * CrowdScan - NimBLE Discovery Source Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/platform/esp32/nimble_discovery_source.h"
#include "crowdscan/config.h"
#include "crowdscan/core/encoding.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"

namespace crowdscan {
namespace platform {

// Scan timing in 0.625 ms units
static const uint16_t LOW_LATENCY_INTERVAL = 100;
static const uint16_t LOW_LATENCY_WINDOW   = 100;   // 100% duty
static const uint16_t BATCHED_INTERVAL     = 160;
static const uint16_t BATCHED_WINDOW       = 48;    // 30% duty

NimBleDiscoverySource::NimBleDiscoverySource(const char* deviceName)
  : m_device_name(deviceName), m_scan(nullptr), m_listener(nullptr), m_stopping(false) {}

bool NimBleDiscoverySource::prepare() {
  if (m_scan) return true;
  if (!NimBLEDevice::isInitialized() && !NimBLEDevice::init(m_device_name)) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "NimBLE init failed");
    return false;
  }
  m_scan = NimBLEDevice::getScan();
  if (!m_scan) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "NimBLE scanner unavailable");
    return false;
  }
  m_scan->setScanCallbacks(this, true);
  m_scan->setActiveScan(true);
  m_scan->setMaxResults(0);   // Do not keep results in the stack
  health_log(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "NimBLE scanner ready");
  return true;
}

bool NimBleDiscoverySource::startScan(scan::BleScanMode mode) {
  if (!m_scan) return false;
  if (mode == scan::BLE_SCAN_BATCHED) {
    m_scan->setInterval(BATCHED_INTERVAL);
    m_scan->setWindow(BATCHED_WINDOW);
  } else {
    m_scan->setInterval(LOW_LATENCY_INTERVAL);
    m_scan->setWindow(LOW_LATENCY_WINDOW);
  }
  m_stopping = false;
  // Duration 0 scans until stopped
  if (!m_scan->start(0, false, true)) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "NimBLE scan start rejected");
    return false;
  }
  return true;
}

void NimBleDiscoverySource::stopScan() {
  m_stopping = true;
  if (m_scan && m_scan->isScanning()) m_scan->stop();
}

void NimBleDiscoverySource::onResult(const NimBLEAdvertisedDevice* device) {
  scan::BleDiscoveryListener* listener = m_listener.load();
  if (!listener || !device) return;

  scan::DiscoveryRecord r;
  r.address = device->getAddress().toString();
  if (device->haveName()) r.name = device->getName();
  r.has_rssi = true;
  r.rssi = device->getRSSI();
  if (device->haveTXPower()) {
    r.has_tx_power = true;
    r.tx_power = device->getTXPower();
  }
  r.connectable = device->isConnectable();
  r.raw_adv = device->getPayload();

  for (uint8_t i = 0; i < device->getServiceUUIDCount(); i++) {
    r.service_uuids.push_back(device->getServiceUUID(i).toString());
  }
  for (uint8_t i = 0; i < device->getServiceDataCount(); i++) {
    std::string data = device->getServiceData(i);
    r.service_data[device->getServiceDataUUID(i).toString()] =
        to_hex((const uint8_t*)data.data(), data.size());
  }
  if (device->haveManufacturerData()) {
    std::string data = device->getManufacturerData();
    r.manufacturer_data = to_hex((const uint8_t*)data.data(), data.size());
  }
  r.timestamp_ms = now_wall_ms();

  listener->onBleRecord(r);
}

void NimBleDiscoverySource::onScanEnd(const NimBLEScanResults& results, int reason) {
  (void)results;
  if (m_stopping) return;
  log_health(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "NimBLE scan ended unexpectedly",
             NimBLEUtils::returnCodeToString(reason));
  scan::BleDiscoveryListener* listener = m_listener.load();
  if (listener) listener->onBleScanFailed(scan::SCAN_FAILED_INTERNAL_ERROR);
}

} // namespace platform
} // namespace crowdscan
