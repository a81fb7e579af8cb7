/*
 * CrowdScan - Discovery Source Interfaces
 *
 * Source A (advertisement scanner) and source B (classic discovery) are
 * opaque producers. Both push into listener callbacks from their own driver
 * threads; the aggregator turns those into queued events.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_DISCOVERY_SOURCE_H
#define CROWDSCAN_DISCOVERY_SOURCE_H

#include <vector>
#include "crowdscan/scan/discovery_types.h"

namespace crowdscan {
namespace scan {

// ════════════════════════════════════════════════════════════════════════════
// LISTENERS
// ════════════════════════════════════════════════════════════════════════════

class BleDiscoveryListener {
public:
  virtual ~BleDiscoveryListener() {}
  virtual void onBleRecord(const DiscoveryRecord& record) = 0;
  virtual void onBleBatch(const std::vector<DiscoveryRecord>& records) = 0;
  virtual void onBleScanFailed(uint8_t code) = 0;
};

class ClassicDiscoveryListener {
public:
  virtual ~ClassicDiscoveryListener() {}
  virtual void onClassicRecord(const DiscoveryRecord& record) = 0;
  // One inquiry pass ended; restarting is the consumer's decision
  virtual void onDiscoveryFinished() = 0;
};

// ════════════════════════════════════════════════════════════════════════════
// SOURCES
// ════════════════════════════════════════════════════════════════════════════

class DiscoverySource {
public:
  virtual ~DiscoverySource() {}
  virtual const char* name() const = 0;
  // Bring up the radio stack. May fail transiently; the caller retries.
  virtual bool prepare() = 0;
};

class BleDiscoverySource : public DiscoverySource {
public:
  virtual void setListener(BleDiscoveryListener* listener) = 0;
  virtual bool startScan(BleScanMode mode) = 0;
  virtual void stopScan() = 0;
};

class ClassicDiscoverySource : public DiscoverySource {
public:
  virtual void setListener(ClassicDiscoveryListener* listener) = 0;
  virtual bool isDiscovering() = 0;
  virtual bool startDiscovery() = 0;
  virtual void stopDiscovery() = 0;
};

} // namespace scan
} // namespace crowdscan

#endif // CROWDSCAN_DISCOVERY_SOURCE_H
