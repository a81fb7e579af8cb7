/*
 * CrowdScan - Discovery Aggregator Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/scan/discovery_aggregator.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"

#include <chrono>

namespace crowdscan {
namespace scan {

DiscoveryAggregator::DiscoveryAggregator(BleDiscoverySource& ble, ClassicDiscoverySource& classic,
                                         const EventDispatcher& events, const AdvParser* parser,
                                         const AggregatorConfig& config)
  : m_ble(ble), m_classic(classic), m_events(events), m_parser(parser), m_config(config),
    m_termination(nullptr), m_scanning(false), m_session(0), m_classic_enabled(false),
    m_ble_mode(BLE_SCAN_LOW_LATENCY), m_abort_start(false), m_new_arrivals(0),
    m_scheduler("aggregator") {}

DiscoveryAggregator::~DiscoveryAggregator() {
  stop();
  m_scheduler.shutdown();
}

// ════════════════════════════════════════════════════════════════════════════
// LIFECYCLE
// ════════════════════════════════════════════════════════════════════════════

bool DiscoveryAggregator::prepareWithRetry() {
  uint8_t attempts = m_config.init_retries > 0 ? m_config.init_retries : 1;
  for (uint8_t attempt = 1; attempt <= attempts; attempt++) {
    if (m_ble.prepare()) return true;
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "%s not ready (attempt %u/%u)",
                         m_ble.name(), (unsigned)attempt, (unsigned)attempts);
    if (attempt == attempts) break;

    std::unique_lock<std::mutex> lock(m_start_mutex);
    if (m_start_cv.wait_for(lock, std::chrono::milliseconds(m_config.init_retry_delay_ms),
                            [this] { return m_abort_start.load(); })) {
      health_log(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "Radio init aborted by stop");
      return false;
    }
  }
  return false;
}

bool DiscoveryAggregator::start() {
  m_abort_start = false;
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
  if (m_scanning) return true;

  if (!prepareWithRetry()) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Scanner unavailable after retries", m_ble.name());
    return false;
  }
  m_classic_enabled = m_classic.prepare();
  if (!m_classic_enabled) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Classic discovery unavailable, continuing without",
               m_classic.name());
  }

  // The previous epoch stays aside until the scanner accepts the request
  ObservationTable prev_ble;
  ObservationTable prev_classic;
  {
    std::unique_lock<std::shared_mutex> table_lock(m_table_mutex);
    prev_ble.swap(m_ble_table);
    prev_classic.swap(m_classic_table);
  }

  uint64_t session = ++m_session;
  m_scanning = true;
  m_ble_queue.reopen();
  m_classic_queue.reopen();
  m_ble_consumer = std::thread(&DiscoveryAggregator::consumeLoop, this, &m_ble_queue, DISCOVERY_BLE);
  m_classic_consumer = std::thread(&DiscoveryAggregator::consumeLoop, this, &m_classic_queue,
                                   DISCOVERY_CLASSIC);

  m_ble.setListener(this);
  m_classic.setListener(this);

  m_ble_mode = BLE_SCAN_LOW_LATENCY;
  if (!m_ble.startScan(m_ble_mode)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Scan start rejected", m_ble.name());
    teardownLocked();
    std::unique_lock<std::shared_mutex> table_lock(m_table_mutex);
    m_ble_table.swap(prev_ble);
    m_classic_table.swap(prev_classic);
    return false;
  }

  m_new_arrivals = 0;
  m_events.emit(events::OBSERVED_DEVICE_COUNT_CHANGED, (int32_t)deviceCount());
  if (m_classic_enabled) {
    m_scheduler.scheduleAfter(0, [this, session] { startClassic(session); });
  }

  m_scheduler.scheduleEvery(m_config.debounce_ms, [this] { debounceTick(); });
  m_scheduler.scheduleAfter(m_config.initial_scan_period_ms,
                            [this, session] { switchToBatchMode(session); });

  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "Discovery started (session %llu)",
                       (unsigned long long)session);
  m_events.emit(events::BLE_SCAN_STARTED, 1);
  return true;
}

void DiscoveryAggregator::stop() {
  {
    std::lock_guard<std::mutex> lock(m_start_mutex);
    m_abort_start = true;
  }
  m_start_cv.notify_all();

  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
  stopLocked();
}

void DiscoveryAggregator::stopLocked() {
  if (!m_scanning) return;
  teardownLocked();
  health_log(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "Discovery stopped");
  m_events.emit(events::BLE_SCAN_STOPPED, 1);
}

void DiscoveryAggregator::teardownLocked() {
  m_scanning = false;
  ++m_session;
  m_scheduler.cancelAll();

  m_ble.stopScan();
  if (m_classic_enabled) m_classic.stopDiscovery();

  m_ble_queue.close();
  m_classic_queue.close();
  if (m_ble_consumer.joinable()) m_ble_consumer.join();
  if (m_classic_consumer.joinable()) m_classic_consumer.join();
}

// ════════════════════════════════════════════════════════════════════════════
// OBSERVATION TABLE
// ════════════════════════════════════════════════════════════════════════════

void DiscoveryAggregator::consumeLoop(EventQueue<DiscoveryRecord>* queue, DiscoveryKind kind) {
  DiscoveryRecord record;
  while (queue->pop(&record)) {
    applyRecord(kind, std::move(record));
  }
}

void DiscoveryAggregator::applyRecord(DiscoveryKind kind, DiscoveryRecord record) {
  if (record.address.empty()) {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_BLUETOOTH, "Record without address dropped");
    return;
  }
  if (record.timestamp_ms == 0) record.timestamp_ms = now_wall_ms();

  // Parse outside the table lock
  AdvFields fields;
  if (kind == DISCOVERY_BLE && m_parser && !record.raw_adv.empty()) {
    fields = m_parser->parse(record.raw_adv);
  }

  {
    std::unique_lock<std::shared_mutex> lock(m_table_mutex);
    ObservationTable& table = (kind == DISCOVERY_BLE) ? m_ble_table : m_classic_table;
    auto it = table.find(record.address);
    if (it == table.end()) {
      Observation obs;
      obs.kind = kind;
      obs.identifier = record.address;
      obs.count = 1;
      obs.first_seen_ms = record.timestamp_ms;
      obs.last_seen_ms = record.timestamp_ms;
      obs.fields = std::move(fields);
      obs.latest = std::move(record);
      table.emplace(obs.identifier, std::move(obs));
    } else {
      Observation& obs = it->second;
      obs.count++;
      obs.last_seen_ms = record.timestamp_ms;
      if (kind == DISCOVERY_BLE && !record.raw_adv.empty()) obs.fields = std::move(fields);
      obs.latest = std::move(record);
    }
  }
  m_new_arrivals++;
}

DiscoverySnapshot DiscoveryAggregator::snapshot() const {
  DiscoverySnapshot snap;
  std::shared_lock<std::shared_mutex> lock(m_table_mutex);
  snap.ble.reserve(m_ble_table.size());
  for (const auto& kv : m_ble_table) snap.ble.push_back(kv.second);
  snap.classic.reserve(m_classic_table.size());
  for (const auto& kv : m_classic_table) snap.classic.push_back(kv.second);
  return snap;
}

void DiscoveryAggregator::clearTables() {
  {
    std::unique_lock<std::shared_mutex> lock(m_table_mutex);
    m_ble_table.clear();
    m_classic_table.clear();
  }
  m_new_arrivals = 0;
  m_events.emit(events::OBSERVED_DEVICE_COUNT_CHANGED, 0);
}

void DiscoveryAggregator::clear() {
  clearTables();
  health_log(LOG_LEVEL_DEBUG, LOG_CAT_BLUETOOTH, "Observation table cleared");
}

size_t DiscoveryAggregator::deviceCount() const {
  std::shared_lock<std::shared_mutex> lock(m_table_mutex);
  return m_ble_table.size() + m_classic_table.size();
}

// ════════════════════════════════════════════════════════════════════════════
// SOURCE CALLBACKS
// ════════════════════════════════════════════════════════════════════════════

void DiscoveryAggregator::onBleRecord(const DiscoveryRecord& record) {
  if (!m_ble_queue.push(record)) {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_BLUETOOTH, "BLE result after stop ignored");
  }
}

void DiscoveryAggregator::onBleBatch(const std::vector<DiscoveryRecord>& records) {
  for (const DiscoveryRecord& r : records) {
    if (!m_ble_queue.push(r)) {
      health_log(LOG_LEVEL_DEBUG, LOG_CAT_BLUETOOTH, "BLE batch after stop ignored");
      return;
    }
  }
}

void DiscoveryAggregator::onClassicRecord(const DiscoveryRecord& record) {
  if (!m_classic_queue.push(record)) {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_BLUETOOTH, "Classic result after stop ignored");
  }
}

void DiscoveryAggregator::onBleScanFailed(uint8_t code) {
  // Driver context: defer to the scheduler so the driver never waits on us
  uint64_t session = m_session.load();
  m_scheduler.scheduleAfter(0, [this, session, code] { handleScanFailure(session, code); });
}

void DiscoveryAggregator::onDiscoveryFinished() {
  uint64_t session = m_session.load();
  if (!m_scanning) return;
  health_log(LOG_LEVEL_DEBUG, LOG_CAT_BLUETOOTH, "Classic pass finished, restart scheduled");
  m_scheduler.scheduleAfter(m_config.classic_restart_delay_ms,
                            [this, session] { startClassic(session); });
}

// ════════════════════════════════════════════════════════════════════════════
// SCHEDULED WORK
// ════════════════════════════════════════════════════════════════════════════

void DiscoveryAggregator::debounceTick() {
  if (m_new_arrivals.exchange(0) == 0) return;
  m_events.emit(events::OBSERVED_DEVICE_COUNT_CHANGED, (int32_t)deviceCount());
}

void DiscoveryAggregator::switchToBatchMode(uint64_t session) {
  std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
  if (!m_scanning || m_session != session) return;
  m_ble.stopScan();
  m_scheduler.scheduleAfter(m_config.batch_switch_gap_ms, [this, session] {
    std::lock_guard<std::mutex> inner(m_lifecycle_mutex);
    if (!m_scanning || m_session != session) return;
    m_ble_mode = BLE_SCAN_BATCHED;
    if (m_ble.startScan(m_ble_mode)) {
      health_log(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "Switched to batched scanning");
    } else {
      health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Batched scan rejected, retrying");
      m_scheduler.scheduleAfter(m_config.ble_restart_delay_ms,
                                [this, session] { restartBle(session); });
    }
  });
}

void DiscoveryAggregator::handleScanFailure(uint64_t session, uint8_t code) {
  switch (classify_scan_failure(code)) {
    case FAILURE_IGNORED:
      health_logging::logf(LOG_LEVEL_DEBUG, LOG_CAT_BLUETOOTH, "Scan failure %s ignored",
                           scan_failure_name(code));
      return;

    case FAILURE_RECOVERABLE: {
      std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
      if (!m_scanning || m_session != session) return;
      health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH,
                           "Scan failure %s, restarting in %ums", scan_failure_name(code),
                           (unsigned)m_config.ble_restart_delay_ms);
      m_ble.stopScan();
      m_scheduler.scheduleAfter(m_config.ble_restart_delay_ms,
                                [this, session] { restartBle(session); });
      return;
    }

    case FAILURE_FATAL:
      terminate(session, code);
      return;

    default:
      health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Unknown scan failure code %u",
                           (unsigned)code);
      return;
  }
}

void DiscoveryAggregator::restartBle(uint64_t session) {
  bool failed = false;
  {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!m_scanning || m_session != session) return;
    if (m_ble.startScan(m_ble_mode)) {
      health_log(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "Scanner restarted");
      return;
    }
    failed = true;
  }
  if (failed) terminate(session, SCAN_FAILED_INTERNAL_ERROR);
}

void DiscoveryAggregator::startClassic(uint64_t session) {
  std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
  if (!m_scanning || m_session != session || !m_classic_enabled) return;

  if (m_classic.isDiscovering()) {
    // Cancel the stale pass, then start fresh after a short gap
    m_classic.stopDiscovery();
    m_scheduler.scheduleAfter(m_config.classic_cancel_gap_ms, [this, session] {
      std::lock_guard<std::mutex> inner(m_lifecycle_mutex);
      if (!m_scanning || m_session != session) return;
      if (!m_classic.startDiscovery()) {
        health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Classic discovery restart rejected");
      }
    });
    return;
  }
  if (!m_classic.startDiscovery()) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Classic discovery start rejected");
  }
}

void DiscoveryAggregator::terminate(uint64_t session, uint8_t code) {
  {
    EventDeferral defer;
    {
      std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
      if (!m_scanning || m_session != session) return;
      log_health(LOG_LEVEL_CRITICAL, LOG_CAT_BLUETOOTH, "Discovery terminated", scan_failure_name(code));
      stopLocked();
    }
    m_events.emit(events::BLE_SCAN_FATAL_ERROR, code);
  }
  DiscoveryTerminationListener* listener = m_termination;
  if (listener) listener->onDiscoveryTerminated(code);
}

} // namespace scan
} // namespace crowdscan
