/*
 * CrowdScan - Scan Orchestrator Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/app/scan_orchestrator.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"

#include <chrono>
#include <thread>

namespace crowdscan {
namespace app {

const char* orchestrator_state_name(OrchestratorState state) {
  switch (state) {
    case ORCH_IDLE:         return "IDLE";
    case ORCH_STARTING:     return "STARTING";
    case ORCH_AWAITING_FIX: return "AWAITING_FIX";
    case ORCH_ACTIVE:       return "ACTIVE";
    case ORCH_RESTARTING:   return "RESTARTING";
    case ORCH_STOPPING:     return "STOPPING";
    default:                return "UNKNOWN";
  }
}

ScanOrchestrator::ScanOrchestrator(const OrchestratorDeps& deps, const OrchestratorConfig& config)
  : m_settings(*deps.settings), m_connectivity(*deps.connectivity), m_location(*deps.location),
    m_aggregator(*deps.aggregator), m_builder(*deps.builder), m_pipeline(*deps.pipeline),
    m_cache(*deps.cache), m_geo(*deps.geo), m_anonymizer(*deps.anonymizer),
    m_events(*deps.events), m_config(config),
    m_state(ORCH_IDLE), m_session(0), m_scan_epoch(0), m_scan_start_ms(0),
    m_last_salt_refresh_ms(now_wall_ms()), m_low_yield_min(LOW_YIELD_MIN_DEVICES),
    m_low_yield_grace_ms(LOW_YIELD_GRACE_MS), m_fix_timeout_task(INVALID_TASK),
    m_fix(), m_last_fix_ms(0), m_inflight(0), m_scheduler("orchestrator") {
  m_aggregator.setTerminationListener(this);
}

ScanOrchestrator::~ScanOrchestrator() {
  stop();
  m_scheduler.shutdown();
  // Submissions reference this object until they finish
  std::unique_lock<std::mutex> lock(m_inflight_mutex);
  m_inflight_cv.wait(lock, [this] { return m_inflight.load() == 0; });
  lock.unlock();
  m_aggregator.setTerminationListener(nullptr);
}

void ScanOrchestrator::setState(OrchestratorState s) {
  OrchestratorState prev = (OrchestratorState)m_state.exchange(s);
  if (prev != s) {
    health_logging::logf(LOG_LEVEL_DEBUG, LOG_CAT_SYSTEM, "State %s -> %s",
                         orchestrator_state_name(prev), orchestrator_state_name(s));
  }
}

bool ScanOrchestrator::isLiveLocked() const {
  uint8_t s = m_state.load();
  return s == ORCH_STARTING || s == ORCH_AWAITING_FIX || s == ORCH_ACTIVE || s == ORCH_RESTARTING;
}

// ════════════════════════════════════════════════════════════════════════════
// START / STOP
// ════════════════════════════════════════════════════════════════════════════

bool ScanOrchestrator::start() {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state.load() != ORCH_IDLE) {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_SYSTEM, "Start ignored, session already live");
    return true;
  }

  if (!m_connectivity.isRadioEnabled()) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Bluetooth disabled, scan not started");
    m_events.emit(events::BLUETOOTH_NOT_ENABLED, 1);
    return false;
  }

  setState(ORCH_STARTING);
  uint64_t session = ++m_session;
  m_settings.setScanning(true);

  m_low_yield_min = m_config.low_yield_min_devices > 0 ? m_config.low_yield_min_devices
                                                       : m_settings.lowYieldMinDevices();
  m_low_yield_grace_ms = m_config.low_yield_grace_ms > 0 ? m_config.low_yield_grace_ms
                                                         : m_settings.lowYieldGraceMs();
  {
    std::lock_guard<std::mutex> fix_lock(m_fix_mutex);
    m_fix = location::LocationFix();
    m_last_fix_ms = 0;
  }

  // Fixes delivered synchronously by startUpdates must see AWAITING_FIX
  setState(ORCH_AWAITING_FIX);
  m_fix_timeout_task = m_scheduler.scheduleAfter(m_config.fix_timeout_ms,
                                                 [this, session] { onFixTimeout(session); });
  if (!m_location.startUpdates(this)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_GPS, "Location updates unavailable", "start");
    m_events.emit(events::GEO_LOCATION_UNAVAILABLE, 1);
    stopLocked("location start failed");
    return false;
  }

  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_SYSTEM, "Scan session %llu started, awaiting fix",
                       (unsigned long long)session);
  m_events.emit(events::SERVICE_STARTED, 1);
  return true;
}

void ScanOrchestrator::stop() {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state.load() == ORCH_IDLE) return;
  stopLocked("requested");
}

void ScanOrchestrator::stopLocked(const char* reason) {
  setState(ORCH_STOPPING);
  ++m_session;
  ++m_scan_epoch;
  m_scheduler.cancelAll();
  m_fix_timeout_task = INVALID_TASK;

  m_aggregator.stop();
  m_location.stopUpdates();
  m_settings.setScanning(false);

  setState(ORCH_IDLE);
  log_health(LOG_LEVEL_INFO, LOG_CAT_SYSTEM, "Scan session stopped", reason);
}

bool ScanOrchestrator::resumeIfPersisted() {
  if (!m_settings.isScanning()) return false;
  if (m_state.load() != ORCH_IDLE) return true;
  health_log(LOG_LEVEL_INFO, LOG_CAT_SYSTEM, "Resuming persisted scan session");
  return start();
}

void ScanOrchestrator::onRadioStateChanged(bool enabled) {
  if (enabled) return;
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!isLiveLocked()) return;
  m_events.emit(events::BLUETOOTH_NOT_ENABLED, 1);
  stopLocked("bluetooth disabled");
}

// ════════════════════════════════════════════════════════════════════════════
// LOCATION
// ════════════════════════════════════════════════════════════════════════════

void ScanOrchestrator::onLocationFix(const location::LocationFix& fix) {
  if (!fix.valid) return;
  {
    std::lock_guard<std::mutex> lock(m_fix_mutex);
    m_fix = fix;
    m_last_fix_ms = now_wall_ms();
  }
  if (m_state.load() == ORCH_AWAITING_FIX) {
    uint64_t session = m_session.load();
    m_scheduler.scheduleAfter(0, [this, session] { evaluateFirstFix(session); });
  }
}

void ScanOrchestrator::onLocationUnavailable() {
  uint64_t session = m_session.load();
  m_scheduler.scheduleAfter(0, [this, session] { onLocationLost(session); });
}

void ScanOrchestrator::onLocationLost(uint64_t session) {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (session != m_session.load()) return;
  if (m_state.load() == ORCH_AWAITING_FIX) {
    m_events.emit(events::GEO_LOCATION_UNAVAILABLE, 1);
    stopLocked("location unavailable");
  } else if (m_state.load() == ORCH_ACTIVE) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_GPS, "Location lost, continuing with last fix");
  }
}

void ScanOrchestrator::onFixTimeout(uint64_t session) {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (session != m_session.load() || m_state.load() != ORCH_AWAITING_FIX) return;
  m_events.emit(events::GEO_LOCATION_UNAVAILABLE, 1);
  stopLocked("no location fix");
}

void ScanOrchestrator::evaluateFirstFix(uint64_t session) {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (session != m_session.load() || m_state.load() != ORCH_AWAITING_FIX) return;

  if (m_fix_timeout_task != INVALID_TASK) {
    m_scheduler.cancel(m_fix_timeout_task);
    m_fix_timeout_task = INVALID_TASK;
  }

  location::LocationFix fix;
  {
    std::lock_guard<std::mutex> fix_lock(m_fix_mutex);
    fix = m_fix;
  }

  if (m_settings.isGeoRestrictionEnabled()) {
    std::vector<geo::GeoRegion> regions = geo::parse_regions_json(m_settings.restrictedCitiesJson());
    geo::GeoVerdict verdict = m_geo.evaluate(geo::GeoPoint{fix.lat, fix.lon}, regions);
    if (verdict == geo::GEO_OUTSIDE_REGIONS) {
      m_events.emit(events::GEO_RESTRICTION_FAILED, 1);
      stopLocked("outside permitted regions");
      return;
    }
    if (verdict == geo::GEO_OFF_ROUTE) {
      m_events.emit(events::TRANSIT_ROUTE_CHECK_FAILED, 1);
      stopLocked("not on a transit route");
      return;
    }
  }

  if (!m_aggregator.start()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Discovery could not start");
    stopLocked("discovery start failed");
    return;
  }

  ++m_scan_epoch;
  m_scan_start_ms = now_mono_ms();
  setState(ORCH_ACTIVE);
  m_scheduler.scheduleEvery(m_config.sync_period_ms, [this] { tick(); });
  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_SYSTEM, "Scanning active (fix %.5f, %.5f)",
                       fix.lat, fix.lon);
}

// ════════════════════════════════════════════════════════════════════════════
// TICK
// ════════════════════════════════════════════════════════════════════════════

void ScanOrchestrator::maybeRotateSalt() {
  uint64_t now = now_wall_ms();
  uint64_t last_fix;
  {
    std::lock_guard<std::mutex> lock(m_fix_mutex);
    last_fix = m_last_fix_ms;
  }
  if (!timeout_elapsed(last_fix, now, m_config.salt_rotation_interval_ms)) return;
  if (!timeout_elapsed(m_last_salt_refresh_ms, now, m_config.salt_rotation_interval_ms)) return;

  if (!m_settings.shouldRefreshSalt()) {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_CRYPTO, "Salt refresh disabled, keeping salt");
    return;
  }
  if (m_anonymizer.rotateSalt().empty()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "Salt rotation failed, keeping previous salt");
    return;
  }
  m_last_salt_refresh_ms = now;
  health_log(LOG_LEVEL_INFO, LOG_CAT_CRYPTO, "Salt rotated after location inactivity");
}

void ScanOrchestrator::tick() {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state.load() != ORCH_ACTIVE) return;

  maybeRotateSalt();

  size_t devices = m_aggregator.deviceCount();
  if (devices < m_low_yield_min &&
      timeout_elapsed(m_scan_start_ms, now_mono_ms(), m_low_yield_grace_ms)) {
    health_logging::logf(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH,
                         "Low device count (%u < %u), restarting discovery",
                         (unsigned)devices, (unsigned)m_low_yield_min);
    setState(ORCH_RESTARTING);
    m_aggregator.stop();
    uint64_t session = m_session.load();
    m_scheduler.scheduleAfter(m_config.low_yield_restart_delay_ms,
                              [this, session] { finishLowYieldRestart(session); });
    return;
  }

  if (m_inflight.load() >= m_config.max_inflight) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_SYNC, "Previous submissions still running, tick skipped");
    return;
  }
  submitAsync(m_scan_epoch);
}

void ScanOrchestrator::finishLowYieldRestart(uint64_t session) {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (session != m_session.load() || m_state.load() != ORCH_RESTARTING) return;
  if (!m_aggregator.start()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Restart after low device count failed");
    stopLocked("low-yield restart failed");
    return;
  }
  ++m_scan_epoch;
  m_scan_start_ms = now_mono_ms();
  setState(ORCH_ACTIVE);
  health_log(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "Discovery restarted after low device count");
}

// ════════════════════════════════════════════════════════════════════════════
// SUBMISSION
// ════════════════════════════════════════════════════════════════════════════

void ScanOrchestrator::submitAsync(uint64_t epoch) {
  scan::DiscoverySnapshot snapshot = m_aggregator.snapshot();
  if (snapshot.empty() && !m_cache.hasData()) {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_SYNC, "Nothing observed and nothing cached, skipping");
    return;
  }

  location::LocationFix fix;
  {
    std::lock_guard<std::mutex> lock(m_fix_mutex);
    fix = m_fix;
  }
  sync::SyncBatch batch = m_builder.build(snapshot, fix);
  if (!batch.valid() && !m_cache.hasData()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_SYNC, "Batch could not be built, skipping");
    return;
  }

  const double lat = fix.valid ? fix.lat : 0.0;
  const double lon = fix.valid ? fix.lon : 0.0;
  {
    std::lock_guard<std::mutex> lock(m_inflight_mutex);
    m_inflight++;
  }
  std::thread([this, batch, lat, lon, epoch] {
    sync::SyncResult result = m_pipeline.submit(batch, lat, lon);
    handleSyncResult(epoch, result);

    std::lock_guard<std::mutex> lock(m_inflight_mutex);
    m_inflight--;
    m_inflight_cv.notify_all();
  }).detach();
}

void ScanOrchestrator::handleSyncResult(uint64_t epoch, const sync::SyncResult& result) {
  health_logging::logf(LOG_LEVEL_DEBUG, LOG_CAT_SYNC, "Submission finished: %s",
                       sync::sync_outcome_name(result.outcome));
  if (result.outcome != sync::SYNC_SUCCESS) return;

  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_state.load() != ORCH_ACTIVE) return;
  if (epoch == m_scan_epoch) {
    m_aggregator.clear();
  } else {
    health_log(LOG_LEVEL_DEBUG, LOG_CAT_SYNC, "Scan restarted since batch, table kept");
  }
  if (result.location_restart_requested) {
    health_log(LOG_LEVEL_INFO, LOG_CAT_GPS, "Restarting location updates");
    m_location.stopUpdates();
    if (!m_location.startUpdates(this)) {
      health_log(LOG_LEVEL_WARNING, LOG_CAT_GPS, "Location restart failed");
    }
  }
}

bool ScanOrchestrator::waitForSubmissions(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(m_inflight_mutex);
  return m_inflight_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [this] { return m_inflight.load() == 0; });
}

// ════════════════════════════════════════════════════════════════════════════
// DISCOVERY TERMINATION
// ════════════════════════════════════════════════════════════════════════════

void ScanOrchestrator::onDiscoveryTerminated(uint8_t failureCode) {
  uint64_t session = m_session.load();
  m_scheduler.scheduleAfter(0, [this, session, failureCode] { onTerminated(session, failureCode); });
}

void ScanOrchestrator::onTerminated(uint64_t session, uint8_t code) {
  EventDeferral defer;
  std::lock_guard<std::mutex> lock(m_mutex);
  if (session != m_session.load() || !isLiveLocked()) return;
  log_health(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Stopping after fatal scan failure",
             scan::scan_failure_name(code));
  stopLocked("fatal scan failure");
}

// ════════════════════════════════════════════════════════════════════════════
// TRIP CALIBRATION
// ════════════════════════════════════════════════════════════════════════════

void ScanOrchestrator::emitCountChanged() {
  m_events.emit(events::CALIBRATION_COUNT_CHANGED, m_settings.calibration().count);
}

void ScanOrchestrator::emitBoardingChanged() {
  storage::CalibrationCounters c = m_settings.calibration();
  m_events.emit(events::CALIBRATION_BOARDING_CHANGED, c.boarding);
  m_events.emit(events::CALIBRATION_BOARDING_TOTAL_CHANGED, c.boarding_total);
}

void ScanOrchestrator::emitAlightingChanged() {
  storage::CalibrationCounters c = m_settings.calibration();
  m_events.emit(events::CALIBRATION_ALIGHTING_CHANGED, c.alighting);
  m_events.emit(events::CALIBRATION_ALIGHTING_TOTAL_CHANGED, c.alighting_total);
}

void ScanOrchestrator::startTrip() {
  if (m_anonymizer.rotateSalt().empty()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "Trip salt rotation failed, keeping previous salt");
  }
  m_settings.resetCalibration();
  health_log(LOG_LEVEL_INFO, LOG_CAT_USER, "Trip started");
  m_events.emit(events::PAX_ESTIMATED_CHANGED, -1);
  emitBoardingChanged();
  emitAlightingChanged();
  emitCountChanged();
}

void ScanOrchestrator::endTrip() {
  m_settings.resetCalibration();
  health_log(LOG_LEVEL_INFO, LOG_CAT_USER, "Trip ended");
  emitBoardingChanged();
  emitAlightingChanged();
  emitCountChanged();
}

void ScanOrchestrator::nextStop() {
  m_settings.nextStop();
  storage::CalibrationCounters c = m_settings.calibration();
  m_events.emit(events::CALIBRATION_BOARDING_CHANGED, c.boarding);
  m_events.emit(events::CALIBRATION_ALIGHTING_CHANGED, c.alighting);
}

void ScanOrchestrator::resetCalibration() {
  m_settings.resetCalibration();
}

void ScanOrchestrator::setCalibrationTripName(const std::string& name) {
  m_settings.setCalibrationTripName(name);
  m_events.emitString(events::CALIBRATION_TRIP_NAME_CHANGED, m_settings.calibrationTripName());
}

void ScanOrchestrator::setManualCalibrationCount(int32_t count) {
  m_settings.setManualCalibrationCount(count);
  emitCountChanged();
}

void ScanOrchestrator::incrementCalibrationCount() {
  m_settings.incrementCalibrationCount();
  emitCountChanged();
}

void ScanOrchestrator::decrementCalibrationCount() {
  m_settings.decrementCalibrationCount();
  emitCountChanged();
}

void ScanOrchestrator::incrementBoarding() {
  m_settings.incrementBoarding();
  emitBoardingChanged();
  emitCountChanged();
}

void ScanOrchestrator::decrementBoarding() {
  m_settings.decrementBoarding();
  emitBoardingChanged();
  emitCountChanged();
}

void ScanOrchestrator::incrementAlighting() {
  m_settings.incrementAlighting();
  emitAlightingChanged();
  emitCountChanged();
}

void ScanOrchestrator::decrementAlighting() {
  m_settings.decrementAlighting();
  emitAlightingChanged();
  emitCountChanged();
}

} // namespace app
} // namespace crowdscan
