/*
 * CrowdScan - Bluetooth Classic Discovery Source
 *
 * Source B on ESP32: GAP inquiry through the ESP-IDF Bluedroid API. Needs a
 * firmware image built with classic Bluetooth enabled; otherwise prepare()
 * fails and the aggregator runs BLE only.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_BT_CLASSIC_DISCOVERY_SOURCE_H
#define CROWDSCAN_BT_CLASSIC_DISCOVERY_SOURCE_H

#include <atomic>
#include "crowdscan/scan/discovery_source.h"

namespace crowdscan {
namespace platform {

class BtClassicDiscoverySource : public scan::ClassicDiscoverySource {
public:
  // Inquiry length in 1.28 s units (1..48)
  explicit BtClassicDiscoverySource(uint8_t inquiryLength = 10);
  ~BtClassicDiscoverySource();

  const char* name() const override { return "bt-classic"; }
  bool prepare() override;
  void setListener(scan::ClassicDiscoveryListener* listener) override { m_listener = listener; }
  bool isDiscovering() override { return m_discovering.load(); }
  bool startDiscovery() override;
  void stopDiscovery() override;

  // Called from the GAP callback trampoline
  void handleRecord(const scan::DiscoveryRecord& record);
  void handleStateChange(bool discovering);

private:
  uint8_t m_inquiry_length;
  bool m_ready;
  std::atomic<scan::ClassicDiscoveryListener*> m_listener;
  std::atomic<bool> m_discovering;
};

} // namespace platform
} // namespace crowdscan

#endif // CROWDSCAN_BT_CLASSIC_DISCOVERY_SOURCE_H
