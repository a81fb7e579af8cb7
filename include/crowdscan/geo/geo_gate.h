/*
 * CrowdScan - Geo Gate
 *
 * Decides whether a location fix permits scanning: the point must fall inside
 * a configured region's bounding box and lie close to one of that region's
 * transit route shapes.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_GEO_GATE_H
#define CROWDSCAN_GEO_GATE_H

#include <functional>
#include <stdint.h>
#include <string>
#include <vector>
#include "crowdscan/config.h"

namespace crowdscan {
namespace geo {

// ════════════════════════════════════════════════════════════════════════════
// TYPES
// ════════════════════════════════════════════════════════════════════════════

struct GeoPoint {
  double lat;
  double lon;
};

struct GeoRegion {
  int32_t id;
  std::string name;
  double min_lat;
  double max_lat;
  double min_lon;
  double max_lon;
};

enum GeoVerdict : uint8_t {
  GEO_OK              = 0,
  GEO_OUTSIDE_REGIONS = 1,
  GEO_OFF_ROUTE       = 2
};

const char* geo_verdict_name(GeoVerdict v);

// Great-circle distance in metres (haversine, atan2 form).
double haversine_m(const GeoPoint& a, const GeoPoint& b);

// Parse the restrictedCities settings array. Entries missing a field are
// skipped; a malformed document yields an empty list.
std::vector<GeoRegion> parse_regions_json(const std::string& json);

// ════════════════════════════════════════════════════════════════════════════
// ROUTE SOURCE
// ════════════════════════════════════════════════════════════════════════════

class RouteSource {
public:
  virtual ~RouteSource() {}

  // Calls visit for each route point of the region until visit returns
  // false. Returns false if no route data exists for the region.
  virtual bool forEachPoint(int32_t regionId,
                            const std::function<bool(const GeoPoint&)>& visit) = 0;
};

/*
 * Reads "<dir>/gtfs_<id>.txt" CSV files with a header row naming the
 * shape_pt_lat and shape_pt_lon columns. Rows that do not parse are skipped.
 */
class GtfsShapeRouteSource : public RouteSource {
public:
  explicit GtfsShapeRouteSource(const std::string& directory) : m_dir(directory) {}

  bool forEachPoint(int32_t regionId,
                    const std::function<bool(const GeoPoint&)>& visit) override;

  std::string pathFor(int32_t regionId) const;

private:
  std::string m_dir;
};

// ════════════════════════════════════════════════════════════════════════════
// GEO GATE
// ════════════════════════════════════════════════════════════════════════════

class GeoGate {
public:
  explicit GeoGate(RouteSource& routes, double thresholdM = ROUTE_PROXIMITY_THRESHOLD_M)
    : m_routes(routes), m_threshold_m(thresholdM) {}

  // Inclusive bounding-box test against every region.
  bool containmentCheck(const GeoPoint& point, const std::vector<GeoRegion>& regions) const;

  // True if any route point of the region lies within the threshold.
  // Missing or unreadable route data yields false.
  bool routeProximityCheck(const GeoPoint& point, const GeoRegion& region) const;

  // Containment first, then proximity over the containing regions; the
  // first qualifying region short-circuits.
  GeoVerdict evaluate(const GeoPoint& point, const std::vector<GeoRegion>& regions) const;

  double thresholdM() const { return m_threshold_m; }

private:
  static bool inside(const GeoPoint& p, const GeoRegion& r);

  RouteSource& m_routes;
  double m_threshold_m;
};

} // namespace geo
} // namespace crowdscan

#endif // CROWDSCAN_GEO_GATE_H
