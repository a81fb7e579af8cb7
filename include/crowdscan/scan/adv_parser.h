/*
 * CrowdScan - Advertisement Parser
 *
 * Splits raw advertising data into its length/type/value structures and
 * derives coarse company and device-type tags from manufacturer data.
 * Returns nothing until the assigned-number tables are loaded.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_ADV_PARSER_H
#define CROWDSCAN_ADV_PARSER_H

#include <map>
#include <stdint.h>
#include <string>
#include <vector>
#include "crowdscan/scan/bt_metadata.h"

namespace crowdscan {
namespace scan {

typedef std::map<std::string, std::string> AdvFields;

class AdvParser {
public:
  explicit AdvParser(const BtMetadata& metadata) : m_metadata(metadata) {}

  // Input is hex, or Base64 when it contains '='.
  AdvFields parse(const std::string& rawHexOrBase64) const;
  AdvFields parse(const std::vector<uint8_t>& raw) const;

  // Company tag for manufacturer data hex: company name for well-known
  // identifiers, "other" for the rest, "unknown" if too short.
  std::string companyTag(const std::string& manufacturerHex) const;

  // "apple_findmy", "samsung_<n>", "<companyId>_<n>", or "unknown".
  static std::string deviceTypeTag(const std::string& manufacturerHex);

private:
  static bool isCommonCompany(uint16_t companyId);

  const BtMetadata& m_metadata;
};

} // namespace scan
} // namespace crowdscan

#endif // CROWDSCAN_ADV_PARSER_H
