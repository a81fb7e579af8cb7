/*
 * CrowdScan - NMEA Location Source
 *
 * GNSS NMEA parsing (GGA/RMC) feeding the location oracle interface. Bytes
 * arrive from the receiver UART via feed(); valid fixes are delivered to the
 * listener at most once per update interval.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_NMEA_LOCATION_H
#define CROWDSCAN_NMEA_LOCATION_H

#include <mutex>
#include <stddef.h>
#include <stdint.h>
#include "crowdscan/config.h"
#include "crowdscan/location/location_oracle.h"

namespace crowdscan {
namespace location {

// ════════════════════════════════════════════════════════════════════════════
// TYPES
// ════════════════════════════════════════════════════════════════════════════

struct GnssFix {
  bool     valid;
  double   lat;
  double   lon;
  int      quality;
  int      satellites;
  double   hdop;
  double   altitude_m;
  bool     rmc_active;       // RMC status 'A'
  uint64_t utc_ms;           // Unix ms from RMC date/time, 0 until seen
  uint64_t last_update_ms;   // Monotonic
};

struct NmeaStats {
  uint32_t sentences;
  uint32_t gga_count;
  uint32_t rmc_count;
  uint32_t checksum_errors;
  uint32_t fixes_delivered;
};

// ════════════════════════════════════════════════════════════════════════════
// NMEA LOCATION SOURCE
// ════════════════════════════════════════════════════════════════════════════

class NmeaLocationSource : public LocationOracle {
public:
  explicit NmeaLocationSource(uint32_t minIntervalMs = LOCATION_UPDATE_INTERVAL_MS);

  bool startUpdates(LocationListener* listener) override;
  void stopUpdates() override;

  // Process incoming receiver bytes. Safe to call from the UART task.
  void feed(const uint8_t* data, size_t len);
  void feed(const char* text);

  // Receiver lost or powered down; delivers the terminal signal once.
  void markUnavailable();

  GnssFix getFix() const;
  NmeaStats getStats() const;

private:
  static const size_t RB_SIZE = 1024;
  static const size_t LINE_MAX = 128;

  bool readNmeaLine(char* out, size_t cap);
  void parseNmea(char* line);
  bool verifyChecksum(const char* line) const;
  bool takeDeliverableFix(LocationFix* out);

  mutable std::mutex m_mutex;
  LocationListener* m_listener;
  bool m_running;
  bool m_unavailable_sent;
  uint32_t m_min_interval_ms;
  uint64_t m_last_delivery_ms;
  bool m_delivered_once;

  uint8_t m_rb[RB_SIZE];
  size_t m_rb_head;
  size_t m_rb_tail;
  size_t m_rb_count;
  char m_line_buf[LINE_MAX];
  size_t m_line_len;

  GnssFix m_fix;
  NmeaStats m_stats;
};

} // namespace location
} // namespace crowdscan

#endif // CROWDSCAN_NMEA_LOCATION_H
