/*
 * CrowdScan - Discovery Aggregator
 *
 * Merges the two discovery sources into one deduplicated observation table
 * for the current scan epoch. Each source feeds its own queue drained by a
 * dedicated consumer thread; driver callbacks never block and never take the
 * lifecycle lock. Recovery delays run on the aggregator's scheduler.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_DISCOVERY_AGGREGATOR_H
#define CROWDSCAN_DISCOVERY_AGGREGATOR_H

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include "crowdscan/config.h"
#include "crowdscan/core/event_queue.h"
#include "crowdscan/core/event_sink.h"
#include "crowdscan/core/scheduler.h"
#include "crowdscan/scan/adv_parser.h"
#include "crowdscan/scan/discovery_source.h"

namespace crowdscan {
namespace scan {

struct AggregatorConfig {
  uint32_t debounce_ms              = COUNT_DEBOUNCE_MS;
  uint32_t initial_scan_period_ms   = INITIAL_SCAN_PERIOD_MS;
  uint32_t batch_switch_gap_ms      = BATCH_SWITCH_GAP_MS;
  uint32_t init_retry_delay_ms      = RADIO_INIT_RETRY_DELAY_MS;
  uint8_t  init_retries             = RADIO_INIT_RETRIES;
  uint32_t ble_restart_delay_ms     = BLE_RESTART_DELAY_MS;
  uint32_t classic_restart_delay_ms = CLASSIC_RESTART_DELAY_MS;
  uint32_t classic_cancel_gap_ms    = CLASSIC_RESTART_DELAY_MS / 2;
};

// Told when source A reports a failure the aggregator cannot recover from.
class DiscoveryTerminationListener {
public:
  virtual ~DiscoveryTerminationListener() {}
  virtual void onDiscoveryTerminated(uint8_t failureCode) = 0;
};

class DiscoveryAggregator : public BleDiscoveryListener, public ClassicDiscoveryListener {
public:
  DiscoveryAggregator(BleDiscoverySource& ble, ClassicDiscoverySource& classic,
                      const EventDispatcher& events, const AdvParser* parser = nullptr,
                      const AggregatorConfig& config = AggregatorConfig());
  ~DiscoveryAggregator();

  DiscoveryAggregator(const DiscoveryAggregator&) = delete;
  DiscoveryAggregator& operator=(const DiscoveryAggregator&) = delete;

  // Fails without side effects if source A cannot be prepared within the
  // bounded retries. Starting an already running aggregator returns true.
  bool start();

  // Idempotent. Pending producer sends become no-ops.
  void stop();

  // Point-in-time copy; safe concurrently with discovery.
  DiscoverySnapshot snapshot() const;

  // Resets the observation table; starts a new epoch.
  void clear();

  bool isScanning() const { return m_scanning.load(); }
  size_t deviceCount() const;

  void setTerminationListener(DiscoveryTerminationListener* listener) { m_termination = listener; }

  // ──────────────────────────────────────────────────────────────────────────
  // Source callbacks (driver threads)
  // ──────────────────────────────────────────────────────────────────────────
  void onBleRecord(const DiscoveryRecord& record) override;
  void onBleBatch(const std::vector<DiscoveryRecord>& records) override;
  void onBleScanFailed(uint8_t code) override;
  void onClassicRecord(const DiscoveryRecord& record) override;
  void onDiscoveryFinished() override;

private:
  typedef std::unordered_map<std::string, Observation> ObservationTable;

  void consumeLoop(EventQueue<DiscoveryRecord>* queue, DiscoveryKind kind);
  void applyRecord(DiscoveryKind kind, DiscoveryRecord record);
  void clearTables();
  void stopLocked();
  void teardownLocked();
  bool prepareWithRetry();

  // Scheduled work; every task re-checks the session under the lock
  void debounceTick();
  void switchToBatchMode(uint64_t session);
  void handleScanFailure(uint64_t session, uint8_t code);
  void restartBle(uint64_t session);
  void startClassic(uint64_t session);
  void terminate(uint64_t session, uint8_t code);

  BleDiscoverySource& m_ble;
  ClassicDiscoverySource& m_classic;
  const EventDispatcher& m_events;
  const AdvParser* m_parser;
  AggregatorConfig m_config;
  DiscoveryTerminationListener* m_termination;

  std::mutex m_lifecycle_mutex;
  std::atomic<bool> m_scanning;
  std::atomic<uint64_t> m_session;
  bool m_classic_enabled;
  BleScanMode m_ble_mode;

  // Interrupts the init retry wait when stop() races start()
  std::mutex m_start_mutex;
  std::condition_variable m_start_cv;
  std::atomic<bool> m_abort_start;

  mutable std::shared_mutex m_table_mutex;
  ObservationTable m_ble_table;
  ObservationTable m_classic_table;
  std::atomic<uint32_t> m_new_arrivals;

  EventQueue<DiscoveryRecord> m_ble_queue;
  EventQueue<DiscoveryRecord> m_classic_queue;
  std::thread m_ble_consumer;
  std::thread m_classic_consumer;

  Scheduler m_scheduler;
};

} // namespace scan
} // namespace crowdscan

#endif // CROWDSCAN_DISCOVERY_AGGREGATOR_H
