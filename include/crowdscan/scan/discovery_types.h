/*
 * CrowdScan - Discovery Types
 *
 * Records delivered by the discovery sources and the aggregated
 * observations kept per scan epoch.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_DISCOVERY_TYPES_H
#define CROWDSCAN_DISCOVERY_TYPES_H

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

namespace crowdscan {
namespace scan {

// ════════════════════════════════════════════════════════════════════════════
// ENUMS
// ════════════════════════════════════════════════════════════════════════════

enum DiscoveryKind : uint8_t {
  DISCOVERY_BLE     = 0,   // Source A: advertisement scanning
  DISCOVERY_CLASSIC = 1    // Source B: inquiry / classic discovery
};

// Codes reported by source A when a scan cannot run
enum ScanFailure : uint8_t {
  SCAN_FAILED_ALREADY_STARTED           = 1,
  SCAN_FAILED_REGISTRATION_FAILED       = 2,
  SCAN_FAILED_INTERNAL_ERROR            = 3,
  SCAN_FAILED_FEATURE_UNSUPPORTED       = 4,
  SCAN_FAILED_OUT_OF_HARDWARE_RESOURCES = 5,
  SCAN_FAILED_SCANNING_TOO_FREQUENTLY   = 6
};

enum ScanFailureClass : uint8_t {
  FAILURE_IGNORED     = 0,
  FAILURE_RECOVERABLE = 1,
  FAILURE_FATAL       = 2,
  FAILURE_UNKNOWN     = 3
};

enum BleScanMode : uint8_t {
  BLE_SCAN_LOW_LATENCY = 0,   // Each result delivered immediately
  BLE_SCAN_BATCHED     = 1    // Results grouped per report delay
};

const char* scan_failure_name(uint8_t code);
ScanFailureClass classify_scan_failure(uint8_t code);

// ════════════════════════════════════════════════════════════════════════════
// RECORDS
// ════════════════════════════════════════════════════════════════════════════

struct DiscoveryRecord {
  std::string address;                 // Opaque device address, may be empty
  std::string name;
  bool        has_rssi = false;
  int16_t     rssi = 0;
  bool        has_tx_power = false;
  int16_t     tx_power = 0;
  bool        connectable = false;
  std::vector<uint8_t> raw_adv;        // Raw advertisement bytes (BLE)
  std::vector<std::string> service_uuids;
  std::map<std::string, std::string> service_data;  // uuid -> hex
  std::string manufacturer_data;       // hex, first manufacturer entry
  bool        has_device_class = false;
  uint32_t    device_class = 0;        // Classic class-of-device
  uint64_t    timestamp_ms = 0;        // Unix ms at receipt
};

struct Observation {
  DiscoveryKind kind;
  std::string identifier;
  DiscoveryRecord latest;                        // Last write wins
  std::map<std::string, std::string> fields;     // Parsed advertisement fields
  uint32_t count;
  uint64_t first_seen_ms;
  uint64_t last_seen_ms;
};

struct DiscoverySnapshot {
  std::vector<Observation> ble;
  std::vector<Observation> classic;

  bool empty() const { return ble.empty() && classic.empty(); }
  size_t total() const { return ble.size() + classic.size(); }
};

} // namespace scan
} // namespace crowdscan

#endif // CROWDSCAN_DISCOVERY_TYPES_H
