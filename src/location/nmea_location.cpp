/*
 * CrowdScan - NMEA Location Source Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/location/nmea_location.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"

#include <stdlib.h>
#include <string.h>

namespace crowdscan {
namespace location {

// ════════════════════════════════════════════════════════════════════════════
// UTILITY FUNCTIONS
// ════════════════════════════════════════════════════════════════════════════

static int parse_int(const char* s, int def) {
  if (!s || !*s || *s == ',' || *s == '*') return def;
  return atoi(s);
}

static double parse_double(const char* s, double def) {
  if (!s || !*s || *s == ',' || *s == '*') return def;
  return atof(s);
}

// Pointer to the start of comma-separated field n (0 = sentence id)
static char* get_field(char* s, int field) {
  int f = 0;
  char* p = s;
  while (*p && f < field) {
    if (*p == ',') f++;
    p++;
  }
  if (f != field) return nullptr;
  return p;
}

static bool field_empty(const char* s) {
  return !s || !*s || *s == ',' || *s == '*';
}

// ddmm.mmmm / dddmm.mmmm to signed decimal degrees
static double nmea_to_degrees(const char* value, const char* hemisphere) {
  double raw = parse_double(value, 0);
  int deg = (int)(raw / 100);
  double minutes = raw - deg * 100;
  double out = deg + minutes / 60.0;
  if (hemisphere && (*hemisphere == 'S' || *hemisphere == 'W')) out = -out;
  return out;
}

static int two_digits(const char* s) {
  return (s[0] - '0') * 10 + (s[1] - '0');
}

static bool all_digits(const char* s, size_t n) {
  for (size_t i = 0; i < n; i++) {
    if (s[i] < '0' || s[i] > '9') return false;
  }
  return true;
}

// Days since 1970-01-01 for a proleptic Gregorian date
static int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = (unsigned)(y - era * 400);
  const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + (int64_t)doe - 719468;
}

// ════════════════════════════════════════════════════════════════════════════
// NMEA LOCATION SOURCE
// ════════════════════════════════════════════════════════════════════════════

NmeaLocationSource::NmeaLocationSource(uint32_t minIntervalMs)
  : m_listener(nullptr), m_running(false), m_unavailable_sent(false),
    m_min_interval_ms(minIntervalMs), m_last_delivery_ms(0), m_delivered_once(false),
    m_rb_head(0), m_rb_tail(0), m_rb_count(0), m_line_len(0) {
  memset(m_rb, 0, sizeof(m_rb));
  memset(m_line_buf, 0, sizeof(m_line_buf));
  memset(&m_fix, 0, sizeof(m_fix));
  m_fix.hdop = 99.9;
  memset(&m_stats, 0, sizeof(m_stats));
}

bool NmeaLocationSource::startUpdates(LocationListener* listener) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_listener = listener;
  if (m_running) return true;
  m_running = true;
  m_unavailable_sent = false;
  m_delivered_once = false;
  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_GPS, "Location updates started (interval %ums)",
                       (unsigned)m_min_interval_ms);
  return true;
}

void NmeaLocationSource::stopUpdates() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_running) return;
  m_running = false;
  m_listener = nullptr;
  health_log(LOG_LEVEL_INFO, LOG_CAT_GPS, "Location updates stopped");
}

void NmeaLocationSource::feed(const char* text) {
  if (!text) return;
  feed((const uint8_t*)text, strlen(text));
}

void NmeaLocationSource::feed(const uint8_t* data, size_t len) {
  size_t offset = 0;
  while (offset < len) {
    LocationFix deliver;
    LocationListener* listener = nullptr;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      // Read data into ring buffer
      while (offset < len && m_rb_count < RB_SIZE) {
        m_rb[m_rb_head] = data[offset++];
        m_rb_head = (m_rb_head + 1) % RB_SIZE;
        m_rb_count++;
      }

      // Parse NMEA lines
      char line[LINE_MAX];
      while (readNmeaLine(line, sizeof(line))) {
        parseNmea(line);
      }

      if (takeDeliverableFix(&deliver)) listener = m_listener;
    }
    if (listener) listener->onLocationFix(deliver);
  }
}

void NmeaLocationSource::markUnavailable() {
  LocationListener* listener = nullptr;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_running || m_unavailable_sent) return;
    m_unavailable_sent = true;
    listener = m_listener;
  }
  health_log(LOG_LEVEL_WARNING, LOG_CAT_GPS, "GNSS receiver unavailable");
  if (listener) listener->onLocationUnavailable();
}

GnssFix NmeaLocationSource::getFix() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_fix;
}

NmeaStats NmeaLocationSource::getStats() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_stats;
}

bool NmeaLocationSource::readNmeaLine(char* out, size_t cap) {
  while (m_rb_count > 0) {
    uint8_t b = m_rb[m_rb_tail];
    m_rb_tail = (m_rb_tail + 1) % RB_SIZE;
    m_rb_count--;

    if (b == '\n' || b == '\r') {
      if (m_line_len > 0) {
        size_t copy_len = (m_line_len < cap - 1) ? m_line_len : cap - 1;
        memcpy(out, m_line_buf, copy_len);
        out[copy_len] = '\0';
        m_line_len = 0;
        return true;
      }
    } else if (m_line_len < sizeof(m_line_buf) - 1) {
      m_line_buf[m_line_len++] = (char)b;
    }
  }
  return false;
}

bool NmeaLocationSource::verifyChecksum(const char* line) const {
  const char* star = strchr(line, '*');
  if (!star) return false;
  if (strlen(star) < 3) return true;   // No checksum digits present

  uint8_t sum = 0;
  for (const char* p = line + 1; p < star; p++) sum ^= (uint8_t)*p;
  char hex[3] = { star[1], star[2], '\0' };
  char* end = nullptr;
  long expected = strtol(hex, &end, 16);
  if (end != hex + 2) return false;
  return (uint8_t)expected == sum;
}

void NmeaLocationSource::parseNmea(char* line) {
  m_stats.sentences++;

  if (line[0] != '$' || strlen(line) < 7) return;
  if (!verifyChecksum(line)) {
    m_stats.checksum_errors++;
    return;
  }

  // Parse sentence type
  char* type = line + 3;  // Skip $XX

  if (strncmp(type, "GGA", 3) == 0) {
    m_stats.gga_count++;
    char* lat_str = get_field(line, 2);
    char* lat_dir = get_field(line, 3);
    char* lon_str = get_field(line, 4);
    char* lon_dir = get_field(line, 5);
    char* quality = get_field(line, 6);
    char* sats = get_field(line, 7);
    char* hdop_str = get_field(line, 8);
    char* alt_str = get_field(line, 9);

    m_fix.quality = parse_int(quality, 0);
    m_fix.satellites = parse_int(sats, 0);
    m_fix.hdop = parse_double(hdop_str, 99.9);
    m_fix.altitude_m = parse_double(alt_str, 0);

    bool has_pos = !field_empty(lat_str) && !field_empty(lon_str);
    if (has_pos) {
      m_fix.lat = nmea_to_degrees(lat_str, lat_dir);
      m_fix.lon = nmea_to_degrees(lon_str, lon_dir);
    }
    m_fix.valid = has_pos && m_fix.quality > 0;
    m_fix.last_update_ms = now_mono_ms();
  }
  else if (strncmp(type, "RMC", 3) == 0) {
    m_stats.rmc_count++;
    char* time_str = get_field(line, 1);
    char* status = get_field(line, 2);
    char* lat_str = get_field(line, 3);
    char* lat_dir = get_field(line, 4);
    char* lon_str = get_field(line, 5);
    char* lon_dir = get_field(line, 6);
    char* date_str = get_field(line, 9);

    m_fix.rmc_active = status && *status == 'A';
    if (m_fix.rmc_active && !field_empty(lat_str) && !field_empty(lon_str)) {
      m_fix.lat = nmea_to_degrees(lat_str, lat_dir);
      m_fix.lon = nmea_to_degrees(lon_str, lon_dir);
      m_fix.valid = true;
    } else if (!m_fix.rmc_active) {
      m_fix.valid = false;
    }

    // hhmmss[.ss] and ddmmyy
    if (time_str && date_str && all_digits(time_str, 6) && all_digits(date_str, 6)) {
      int hour = two_digits(time_str);
      int minute = two_digits(time_str + 2);
      int second = two_digits(time_str + 4);
      int centi = (time_str[6] == '.') ? parse_int(time_str + 7, 0) : 0;
      int day = two_digits(date_str);
      int month = two_digits(date_str + 2);
      int year = 2000 + two_digits(date_str + 4);
      if (month >= 1 && month <= 12 && day >= 1 && day <= 31) {
        int64_t days = days_from_civil(year, (unsigned)month, (unsigned)day);
        int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
        m_fix.utc_ms = (uint64_t)secs * 1000 + (uint64_t)(centi % 100) * 10;
      }
    }
    m_fix.last_update_ms = now_mono_ms();
  }
}

bool NmeaLocationSource::takeDeliverableFix(LocationFix* out) {
  if (!m_running || !m_listener || !m_fix.valid) return false;
  uint64_t now = now_mono_ms();
  if (m_delivered_once && !timeout_elapsed(m_last_delivery_ms, now, m_min_interval_ms)) {
    return false;
  }
  m_delivered_once = true;
  m_last_delivery_ms = now;
  m_stats.fixes_delivered++;

  out->valid = true;
  out->lat = m_fix.lat;
  out->lon = m_fix.lon;
  out->hdop = m_fix.hdop;
  out->satellites = m_fix.satellites;
  out->time_ms = m_fix.utc_ms;
  return true;
}

} // namespace location
} // namespace crowdscan
