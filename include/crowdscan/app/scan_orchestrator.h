/*
 * CrowdScan - Scan Orchestrator
 *
 * Owns the scan session state machine:
 *
 *   IDLE -> STARTING -> AWAITING_FIX -> ACTIVE -> STOPPING -> IDLE
 *                                        |  ^
 *                                        v  |
 *                                     RESTARTING
 *
 * Transitions run under one lock. Timers carry the session id they were
 * armed for and do nothing once the session has moved on. Location and
 * discovery callbacks only schedule work; they never take the lock.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_SCAN_ORCHESTRATOR_H
#define CROWDSCAN_SCAN_ORCHESTRATOR_H

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdint.h>
#include <string>
#include "crowdscan/config.h"
#include "crowdscan/core/event_sink.h"
#include "crowdscan/core/scheduler.h"
#include "crowdscan/geo/geo_gate.h"
#include "crowdscan/location/location_oracle.h"
#include "crowdscan/privacy/anonymizer.h"
#include "crowdscan/scan/discovery_aggregator.h"
#include "crowdscan/storage/payload_cache.h"
#include "crowdscan/storage/settings.h"
#include "crowdscan/sync/payload_builder.h"
#include "crowdscan/sync/sync_pipeline.h"

namespace crowdscan {
namespace app {

enum OrchestratorState : uint8_t {
  ORCH_IDLE         = 0,
  ORCH_STARTING     = 1,
  ORCH_AWAITING_FIX = 2,
  ORCH_ACTIVE       = 3,
  ORCH_RESTARTING   = 4,   // Low-yield restart in progress, still a live session
  ORCH_STOPPING     = 5
};

const char* orchestrator_state_name(OrchestratorState state);

struct OrchestratorConfig {
  uint32_t sync_period_ms             = SYNC_PERIOD_MS;
  uint32_t fix_timeout_ms             = INITIAL_FIX_TIMEOUT_MS;
  uint64_t salt_rotation_interval_ms  = SALT_ROTATION_INTERVAL_MS;
  uint32_t low_yield_restart_delay_ms = LOW_YIELD_RESTART_DELAY_MS;
  uint32_t low_yield_min_devices      = 0;   // 0: take from settings
  uint32_t low_yield_grace_ms         = 0;   // 0: take from settings
  uint8_t  max_inflight               = MAX_INFLIGHT_SUBMISSIONS;
};

// Collaborators; all must outlive the orchestrator
struct OrchestratorDeps {
  storage::Settings*            settings;
  location::ConnectivityOracle* connectivity;
  location::LocationOracle*     location;
  scan::DiscoveryAggregator*    aggregator;
  sync::PayloadBuilder*         builder;
  sync::SyncPipeline*           pipeline;
  storage::PayloadCache*        cache;
  geo::GeoGate*                 geo;
  privacy::Anonymizer*          anonymizer;
  const EventDispatcher*        events;
};

class ScanOrchestrator : public location::LocationListener,
                         public scan::DiscoveryTerminationListener {
public:
  explicit ScanOrchestrator(const OrchestratorDeps& deps,
                            const OrchestratorConfig& config = OrchestratorConfig());
  ~ScanOrchestrator();

  ScanOrchestrator(const ScanOrchestrator&) = delete;
  ScanOrchestrator& operator=(const ScanOrchestrator&) = delete;

  // False (and bluetoothNotEnabled) when the radio is off. A start while a
  // session is live is a no-op returning true.
  bool start();

  // No-op while idle. In-flight submissions still complete.
  void stop();

  // One sync cycle. Driven by the periodic timer; public for tests.
  void tick();

  void onRadioStateChanged(bool enabled);

  // Restart a session that was live when the process went down.
  bool resumeIfPersisted();

  OrchestratorState state() const { return (OrchestratorState)m_state.load(); }
  uint8_t inflightSubmissions() const { return m_inflight.load(); }

  // Block until no submission is in flight or the timeout expires.
  bool waitForSubmissions(uint32_t timeout_ms);

  // ──────────────────────────────────────────────────────────────────────────
  // Trip calibration (each emits the matching calibration*Changed events)
  // ──────────────────────────────────────────────────────────────────────────
  void startTrip();
  void endTrip();
  void nextStop();
  void resetCalibration();
  void setCalibrationTripName(const std::string& name);
  void setManualCalibrationCount(int32_t count);
  void incrementCalibrationCount();
  void decrementCalibrationCount();
  void incrementBoarding();
  void decrementBoarding();
  void incrementAlighting();
  void decrementAlighting();

  // ──────────────────────────────────────────────────────────────────────────
  // Listener callbacks
  // ──────────────────────────────────────────────────────────────────────────
  void onLocationFix(const location::LocationFix& fix) override;
  void onLocationUnavailable() override;
  void onDiscoveryTerminated(uint8_t failureCode) override;

private:
  void setState(OrchestratorState s);
  void stopLocked(const char* reason);
  bool isLiveLocked() const;

  // Scheduled work
  void evaluateFirstFix(uint64_t session);
  void onFixTimeout(uint64_t session);
  void onLocationLost(uint64_t session);
  void onTerminated(uint64_t session, uint8_t code);
  void finishLowYieldRestart(uint64_t session);

  void maybeRotateSalt();
  void submitAsync(uint64_t epoch);
  void handleSyncResult(uint64_t epoch, const sync::SyncResult& result);

  void emitCountChanged();
  void emitBoardingChanged();
  void emitAlightingChanged();

  storage::Settings& m_settings;
  location::ConnectivityOracle& m_connectivity;
  location::LocationOracle& m_location;
  scan::DiscoveryAggregator& m_aggregator;
  sync::PayloadBuilder& m_builder;
  sync::SyncPipeline& m_pipeline;
  storage::PayloadCache& m_cache;
  geo::GeoGate& m_geo;
  privacy::Anonymizer& m_anonymizer;
  const EventDispatcher& m_events;
  OrchestratorConfig m_config;

  std::mutex m_mutex;                  // Serializes transitions
  std::atomic<uint8_t> m_state;
  std::atomic<uint64_t> m_session;     // Bumped on start and stop
  uint64_t m_scan_epoch;               // Bumped whenever the aggregator restarts
  uint64_t m_scan_start_ms;            // Monotonic, for the low-yield grace
  uint64_t m_last_salt_refresh_ms;     // Wall clock
  uint32_t m_low_yield_min;
  uint32_t m_low_yield_grace_ms;
  TaskId m_fix_timeout_task;

  std::mutex m_fix_mutex;
  location::LocationFix m_fix;
  uint64_t m_last_fix_ms;              // Wall clock of the last valid fix, 0 if none

  std::mutex m_inflight_mutex;
  std::condition_variable m_inflight_cv;
  std::atomic<uint8_t> m_inflight;

  Scheduler m_scheduler;
};

} // namespace app
} // namespace crowdscan

#endif // CROWDSCAN_SCAN_ORCHESTRATOR_H
