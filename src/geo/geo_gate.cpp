/*
 * CrowdScan - Geo Gate Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/geo/geo_gate.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/storage/file_io.h"

#include <ArduinoJson.h>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace crowdscan {
namespace geo {

static const double DEG_TO_RAD_F = 3.14159265358979323846 / 180.0;

const char* geo_verdict_name(GeoVerdict v) {
  switch (v) {
    case GEO_OK:              return "ok";
    case GEO_OUTSIDE_REGIONS: return "outside_regions";
    case GEO_OFF_ROUTE:       return "off_route";
    default:                  return "?";
  }
}

double haversine_m(const GeoPoint& a, const GeoPoint& b) {
  double dlat = (b.lat - a.lat) * DEG_TO_RAD_F;
  double dlon = (b.lon - a.lon) * DEG_TO_RAD_F;
  double s1 = sin(dlat / 2);
  double s2 = sin(dlon / 2);
  double h = s1 * s1 + cos(a.lat * DEG_TO_RAD_F) * cos(b.lat * DEG_TO_RAD_F) * s2 * s2;
  double c = 2 * atan2(sqrt(h), sqrt(1 - h));
  return EARTH_RADIUS_M * c;
}

std::vector<GeoRegion> parse_regions_json(const std::string& json) {
  std::vector<GeoRegion> regions;
  if (json.empty()) return regions;

  DynamicJsonDocument doc(storage::json_capacity_for(json.size()));
  DeserializationError err = deserializeJson(doc, json);
  if (err || !doc.is<JsonArray>()) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_GEO, "Region list malformed, ignoring",
               err ? err.c_str() : "not an array");
    return regions;
  }

  for (JsonObject o : doc.as<JsonArray>()) {
    if (!o.containsKey("id") || !o.containsKey("minLat") || !o.containsKey("maxLat") ||
        !o.containsKey("minLong") || !o.containsKey("maxLong")) {
      health_log(LOG_LEVEL_WARNING, LOG_CAT_GEO, "Region entry incomplete, skipped");
      continue;
    }
    GeoRegion r;
    r.id = o["id"].as<int32_t>();
    r.name = o["name"] | "";
    r.min_lat = o["minLat"].as<double>();
    r.max_lat = o["maxLat"].as<double>();
    r.min_lon = o["minLong"].as<double>();
    r.max_lon = o["maxLong"].as<double>();
    regions.push_back(r);
  }
  return regions;
}

// ════════════════════════════════════════════════════════════════════════════
// GTFS SHAPE ROUTE SOURCE
// ════════════════════════════════════════════════════════════════════════════

static void split_csv(const std::string& line, std::vector<std::string>* out) {
  out->clear();
  std::string cur;
  for (char c : line) {
    if (c == ',') {
      out->push_back(cur);
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  out->push_back(cur);
}

static std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\"");
  if (b == std::string::npos) return std::string();
  size_t e = s.find_last_not_of(" \t\"");
  return s.substr(b, e - b + 1);
}

static bool parse_coord(const std::string& s, double* out) {
  std::string t = trim(s);
  if (t.empty()) return false;
  char* end = nullptr;
  double v = strtod(t.c_str(), &end);
  if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

std::string GtfsShapeRouteSource::pathFor(int32_t regionId) const {
  return storage::join_path(m_dir, std::string(ROUTE_FILE_PREFIX) + std::to_string(regionId) +
                                       ROUTE_FILE_SUFFIX);
}

bool GtfsShapeRouteSource::forEachPoint(int32_t regionId,
                                        const std::function<bool(const GeoPoint&)>& visit) {
  std::string path = pathFor(regionId);
  std::ifstream in(path);
  if (!in) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_GEO, "Route file missing", path.c_str());
    return false;
  }

  std::string line;
  if (!std::getline(in, line)) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_GEO, "Route file empty", path.c_str());
    return false;
  }

  std::vector<std::string> cols;
  split_csv(line, &cols);
  int lat_idx = -1;
  int lon_idx = -1;
  for (size_t i = 0; i < cols.size(); i++) {
    std::string name = trim(cols[i]);
    if (name == "shape_pt_lat") lat_idx = (int)i;
    else if (name == "shape_pt_lon") lon_idx = (int)i;
  }
  if (lat_idx < 0 || lon_idx < 0) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_GEO, "Route file lacks shape columns", path.c_str());
    return false;
  }

  uint32_t skipped = 0;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    split_csv(line, &cols);
    GeoPoint p;
    if ((int)cols.size() <= lat_idx || (int)cols.size() <= lon_idx ||
        !parse_coord(cols[lat_idx], &p.lat) || !parse_coord(cols[lon_idx], &p.lon)) {
      skipped++;
      continue;
    }
    if (!visit(p)) break;
  }
  if (skipped) {
    health_logging::logf(LOG_LEVEL_DEBUG, LOG_CAT_GEO, "Route %d: skipped %u malformed rows",
                         (int)regionId, (unsigned)skipped);
  }
  return true;
}

// ════════════════════════════════════════════════════════════════════════════
// GEO GATE
// ════════════════════════════════════════════════════════════════════════════

bool GeoGate::inside(const GeoPoint& p, const GeoRegion& r) {
  return p.lat >= r.min_lat && p.lat <= r.max_lat && p.lon >= r.min_lon && p.lon <= r.max_lon;
}

bool GeoGate::containmentCheck(const GeoPoint& point, const std::vector<GeoRegion>& regions) const {
  for (const GeoRegion& r : regions) {
    if (inside(point, r)) return true;
  }
  return false;
}

bool GeoGate::routeProximityCheck(const GeoPoint& point, const GeoRegion& region) const {
  bool near = false;
  double threshold = m_threshold_m;
  bool found = m_routes.forEachPoint(region.id, [&](const GeoPoint& p) {
    if (haversine_m(point, p) <= threshold) {
      near = true;
      return false;
    }
    return true;
  });
  return found && near;
}

GeoVerdict GeoGate::evaluate(const GeoPoint& point, const std::vector<GeoRegion>& regions) const {
  bool contained = false;
  for (const GeoRegion& r : regions) {
    if (!inside(point, r)) continue;
    contained = true;
    if (routeProximityCheck(point, r)) {
      health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_GEO, "Fix near route of region %d (%s)",
                           (int)r.id, r.name.c_str());
      return GEO_OK;
    }
  }
  if (!contained) {
    health_logging::logf(LOG_LEVEL_NOTICE, LOG_CAT_GEO, "Fix %.5f,%.5f outside %u regions",
                         point.lat, point.lon, (unsigned)regions.size());
    return GEO_OUTSIDE_REGIONS;
  }
  health_logging::logf(LOG_LEVEL_NOTICE, LOG_CAT_GEO, "Fix %.5f,%.5f not within %.0fm of a route",
                       point.lat, point.lon, m_threshold_m);
  return GEO_OFF_ROUTE;
}

} // namespace geo
} // namespace crowdscan
