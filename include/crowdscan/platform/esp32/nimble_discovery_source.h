/*
 * CrowdScan - NimBLE Discovery Source
 *
 * Source A on ESP32: continuous active BLE scanning through NimBLE-Arduino
 * 2.x. NimBLE has no controller-side report batching, so BLE_SCAN_BATCHED
 * maps to a lower scan duty cycle with results still delivered one by one.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_NIMBLE_DISCOVERY_SOURCE_H
#define CROWDSCAN_NIMBLE_DISCOVERY_SOURCE_H

#include <NimBLEDevice.h>
#include <atomic>
#include "crowdscan/config.h"
#include "crowdscan/scan/discovery_source.h"

namespace crowdscan {
namespace platform {

class NimBleDiscoverySource : public scan::BleDiscoverySource, public NimBLEScanCallbacks {
public:
  explicit NimBleDiscoverySource(const char* deviceName = APP_NAME);

  const char* name() const override { return "nimble"; }
  bool prepare() override;
  void setListener(scan::BleDiscoveryListener* listener) override { m_listener = listener; }
  bool startScan(scan::BleScanMode mode) override;
  void stopScan() override;

  // NimBLE host task
  void onResult(const NimBLEAdvertisedDevice* device) override;
  void onScanEnd(const NimBLEScanResults& results, int reason) override;

private:
  const char* m_device_name;
  NimBLEScan* m_scan;
  std::atomic<scan::BleDiscoveryListener*> m_listener;
  std::atomic<bool> m_stopping;
};

} // namespace platform
} // namespace crowdscan

#endif // CROWDSCAN_NIMBLE_DISCOVERY_SOURCE_H
