/*
 * CrowdScan - Location and Connectivity Oracles
 *
 * Platform-neutral views of the location provider and the radio state.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_LOCATION_ORACLE_H
#define CROWDSCAN_LOCATION_ORACLE_H

#include <stdint.h>

namespace crowdscan {
namespace location {

struct LocationFix {
  bool     valid;
  double   lat;
  double   lon;
  double   hdop;
  int      satellites;
  uint64_t time_ms;        // Unix ms of the fix, 0 if unknown
};

class LocationListener {
public:
  virtual ~LocationListener() {}
  virtual void onLocationFix(const LocationFix& fix) = 0;
  // Terminal: no further fixes will arrive for this session
  virtual void onLocationUnavailable() = 0;
};

class LocationOracle {
public:
  virtual ~LocationOracle() {}
  // Idempotent; a second start replaces the listener.
  virtual bool startUpdates(LocationListener* listener) = 0;
  virtual void stopUpdates() = 0;
};

class ConnectivityOracle {
public:
  virtual ~ConnectivityOracle() {}
  virtual bool isRadioEnabled() = 0;
};

} // namespace location
} // namespace crowdscan

#endif // CROWDSCAN_LOCATION_ORACLE_H
