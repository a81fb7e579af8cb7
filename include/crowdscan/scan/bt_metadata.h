/*
 * CrowdScan - Bluetooth Assigned Numbers
 *
 * Company identifiers and advertising data type names, loaded explicitly
 * from a JSON document before advertisement parsing is enabled.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_BT_METADATA_H
#define CROWDSCAN_BT_METADATA_H

#include <map>
#include <mutex>
#include <stdint.h>
#include <string>

namespace crowdscan {
namespace scan {

class BtMetadata {
public:
  BtMetadata() {}

  /*
   * Expected shape:
   *   {"company_identifiers":[{"value":76,"name":"Apple, Inc."}, ...],
   *    "ad_types":[{"value":9,"name":"Complete Local Name"}, ...]}
   * Values may be numbers, decimal strings or "0x" hex strings; entries that
   * do not parse are skipped. Returns true if both tables are non-empty.
   */
  bool loadFromJson(const std::string& json);
  bool loadFromFile(const std::string& path);

  bool isLoaded() const;

  // Empty string when unknown
  std::string companyName(uint16_t companyId) const;

  // Normalized: spaces to '_', '-' removed, lower case
  std::string adTypeName(uint8_t adType) const;

  size_t companyCount() const;
  size_t adTypeCount() const;

  static std::string normalizeName(const std::string& name);

private:
  mutable std::mutex m_mutex;
  std::map<uint16_t, std::string> m_companies;
  std::map<uint8_t, std::string> m_ad_types;
};

} // namespace scan
} // namespace crowdscan

#endif // CROWDSCAN_BT_METADATA_H
