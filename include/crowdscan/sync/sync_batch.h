/*
 * CrowdScan - Sync Batch
 *
 * Immutable serialized payload for one sync tick.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_SYNC_BATCH_H
#define CROWDSCAN_SYNC_BATCH_H

#include <stddef.h>
#include <string>

namespace crowdscan {
namespace sync {

class SyncBatch {
public:
  SyncBatch() : m_ble_count(0), m_classic_count(0) {}
  SyncBatch(const std::string& periodKey, const std::string& json, size_t bleCount,
            size_t classicCount)
    : m_period_key(periodKey), m_json(json), m_ble_count(bleCount), m_classic_count(classicCount) {}

  // Wall-clock ms at construction, as a decimal string
  const std::string& periodKey() const { return m_period_key; }
  const std::string& json() const { return m_json; }

  size_t bleCount() const { return m_ble_count; }
  size_t classicCount() const { return m_classic_count; }
  size_t deviceCount() const { return m_ble_count + m_classic_count; }
  bool valid() const { return !m_json.empty(); }

private:
  std::string m_period_key;
  std::string m_json;
  size_t m_ble_count;
  size_t m_classic_count;
};

} // namespace sync
} // namespace crowdscan

#endif // CROWDSCAN_SYNC_BATCH_H
