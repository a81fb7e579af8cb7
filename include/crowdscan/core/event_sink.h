/*
 * CrowdScan - Event Sink
 *
 * Fire-and-forget notifications towards the presentation layer. Event names
 * are part of the UI bridge contract and must not change.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_EVENT_SINK_H
#define CROWDSCAN_EVENT_SINK_H

#include <stdint.h>
#include <string>

namespace crowdscan {

// ════════════════════════════════════════════════════════════════════════════
// EVENT NAMES
// ════════════════════════════════════════════════════════════════════════════

namespace events {

// Discovery
static constexpr const char* OBSERVED_DEVICE_COUNT_CHANGED = "observedDeviceCountChanged";
static constexpr const char* BLE_SCAN_STARTED              = "bleScanStarted";
static constexpr const char* BLE_SCAN_STOPPED              = "bleScanStopped";
static constexpr const char* BLE_SCAN_FATAL_ERROR          = "bleScanFatalError";
static constexpr const char* BLUETOOTH_NOT_ENABLED         = "bluetoothNotEnabled";

// Preconditions
static constexpr const char* GEO_RESTRICTION_FAILED        = "geoRestrictionFailed";
static constexpr const char* TRANSIT_ROUTE_CHECK_FAILED    = "transitRouteCheckFailed";
static constexpr const char* GEO_LOCATION_UNAVAILABLE      = "geoLocationUnavailable";

// Sync
static constexpr const char* SYNC_FAILED_AND_CACHED        = "syncFailedAndCached";
static constexpr const char* SYNC_RETRY_SUCCEEDED          = "syncFailureRetrySucceeded";
static constexpr const char* SERVER_STATUS_CHANGED         = "serverStatusChanged";
static constexpr const char* PAX_ESTIMATED_CHANGED         = "paxEstimatedChanged";
static constexpr const char* RECENTLY_SEEN_COUNT_CHANGED   = "recentlySeenCountChanged";
static constexpr const char* RECENTLY_SEEN_WINDOW_CHANGED  = "recentlySeenWindowMsChanged";

// Calibration
static constexpr const char* CALIBRATION_COUNT_CHANGED           = "calibrationCountChanged";
static constexpr const char* CALIBRATION_BOARDING_CHANGED        = "calibrationBoardingChanged";
static constexpr const char* CALIBRATION_ALIGHTING_CHANGED       = "calibrationAlightingChanged";
static constexpr const char* CALIBRATION_BOARDING_TOTAL_CHANGED  = "calibrationBoardingTotalChanged";
static constexpr const char* CALIBRATION_ALIGHTING_TOTAL_CHANGED = "calibrationAlightingTotalChanged";
static constexpr const char* CALIBRATION_TRIP_NAME_CHANGED       = "calibrationTripNameChanged";

// Lifecycle
static constexpr const char* SERVICE_STARTED               = "serviceStarted";

} // namespace events

// ════════════════════════════════════════════════════════════════════════════
// SINK INTERFACE
// ════════════════════════════════════════════════════════════════════════════

class EventSink {
public:
  virtual ~EventSink() {}
  virtual void sendEvent(const char* name, int32_t value) = 0;
  virtual void sendStringEvent(const char* name, const std::string& value) = 0;
};

/*
 * Wraps an optional sink. Missing sinks are skipped and exceptions thrown by a
 * sink are logged, so a broken presentation layer never reaches the core.
 */
class EventDispatcher {
public:
  explicit EventDispatcher(EventSink* sink = nullptr) : m_sink(sink) {}

  void setSink(EventSink* sink) { m_sink = sink; }
  EventSink* sink() const { return m_sink; }

  void emit(const char* name, int32_t value) const;
  void emitString(const char* name, const std::string& value) const;

private:
  friend class EventDeferral;

  void deliver(const char* name, int32_t value) const;
  void deliverString(const char* name, const std::string& value) const;

  EventSink* m_sink;
};

/*
 * Holds back every emission made on the calling thread while alive. When the
 * outermost scope ends the held events are delivered in order, so a sink may
 * call straight back into the component that emitted. Declare it before the
 * lock it has to outlive.
 */
class EventDeferral {
public:
  EventDeferral();
  ~EventDeferral();

  EventDeferral(const EventDeferral&) = delete;
  EventDeferral& operator=(const EventDeferral&) = delete;
};

} // namespace crowdscan

#endif // CROWDSCAN_EVENT_SINK_H
