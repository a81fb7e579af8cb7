/*
 * CrowdScan - Advertisement Parser Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/scan/adv_parser.h"
#include "crowdscan/core/encoding.h"
#include "crowdscan/core/health_log.h"

#include <cstdlib>

namespace crowdscan {
namespace scan {

static const uint8_t AD_TYPE_MANUFACTURER_DATA = 0xFF;

static const char* FIELD_SHORT_NAME    = "ble_shortened_local_name";
static const char* FIELD_COMPLETE_NAME = "ble_complete_local_name";

// Companies reported by name; everything else collapses to "other"
static const uint16_t COMMON_COMPANY_IDS[] = {
  76, 117, 6, 257, 301, 224, 1447, 101, 135,
  89, 887, 911, 103, 147, 137, 3, 2000, 637, 343
};

// Company id is little-endian in the first two bytes
static long company_from_hex(const std::string& hex) {
  std::string swapped = hex.substr(2, 2) + hex.substr(0, 2);
  return strtol(swapped.c_str(), nullptr, 16);
}

static void add_unique(std::vector<std::string>* list, const std::string& value) {
  for (const std::string& s : *list) {
    if (s == value) return;
  }
  list->push_back(value);
}

static std::string join(const std::vector<std::string>& list) {
  std::string out;
  for (size_t i = 0; i < list.size(); i++) {
    if (i) out += ",";
    out += list[i];
  }
  return out;
}

static std::string decode_name(const std::string& hex) {
  std::vector<uint8_t> bytes;
  if (!from_hex(hex, &bytes)) return std::string();
  return sanitize_utf8(std::string(bytes.begin(), bytes.end()));
}

bool AdvParser::isCommonCompany(uint16_t companyId) {
  for (uint16_t id : COMMON_COMPANY_IDS) {
    if (id == companyId) return true;
  }
  return false;
}

std::string AdvParser::companyTag(const std::string& manufacturerHex) const {
  if (manufacturerHex.size() < 4) return "unknown";
  uint16_t id = (uint16_t)company_from_hex(manufacturerHex);
  if (!isCommonCompany(id)) return "other";
  std::string name = m_metadata.companyName(id);
  return name.empty() ? "unknown" : name;
}

std::string AdvParser::deviceTypeTag(const std::string& manufacturerHex) {
  if (manufacturerHex.size() < 6) return "unknown";
  long id = company_from_hex(manufacturerHex);
  long param = strtol(manufacturerHex.substr(4, 2).c_str(), nullptr, 16);

  switch (id) {
    case 76:   // Apple
      if (param == 0x12 || param == 0x07) return "apple_findmy";
      return "apple_" + std::to_string(param);
    case 117:  return "samsung_" + std::to_string(param);
    case 6:    return "microsoft_" + std::to_string(param);
    case 257:  return "speaker_" + std::to_string(param);
    default:   return std::to_string(id) + "_" + std::to_string(param);
  }
}

AdvFields AdvParser::parse(const std::string& rawHexOrBase64) const {
  std::vector<uint8_t> raw;
  if (rawHexOrBase64.find('=') != std::string::npos) {
    if (!base64_decode(rawHexOrBase64, &raw)) raw.clear();
  } else if (!from_hex(rawHexOrBase64, &raw)) {
    raw.clear();
  }
  return parse(raw);
}

AdvFields AdvParser::parse(const std::vector<uint8_t>& raw) const {
  AdvFields fields;
  if (!m_metadata.isLoaded()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_BLUETOOTH, "Advertisement metadata not loaded");
    return fields;
  }

  std::vector<std::string> manufacturer;
  size_t pos = 0;
  while (pos < raw.size()) {
    uint8_t length = raw[pos];
    if (length == 0) break;
    pos++;
    if (pos >= raw.size()) break;
    uint8_t ad_type = raw[pos];
    pos++;
    size_t data_len = (size_t)length - 1;
    if (pos + data_len > raw.size()) break;   // Truncated structure

    std::string type_name = m_metadata.adTypeName(ad_type);
    std::string field = "ble_" + BtMetadata::normalizeName(type_name.empty() ? "unknown" : type_name);
    std::string data_hex = to_hex(raw.data() + pos, data_len);

    if (ad_type == AD_TYPE_MANUFACTURER_DATA) {
      if (data_len >= 2) {
        manufacturer.push_back(data_hex);
        fields[field] = data_hex;
      }
    } else {
      fields[field] = data_hex;
    }
    pos += data_len;
  }

  std::vector<std::string> companies;
  std::vector<std::string> device_types;
  for (const std::string& hex : manufacturer) {
    add_unique(&companies, companyTag(hex));
    add_unique(&device_types, deviceTypeTag(hex));
  }

  auto it = fields.find(FIELD_SHORT_NAME);
  if (it != fields.end()) it->second = decode_name(it->second);
  it = fields.find(FIELD_COMPLETE_NAME);
  if (it != fields.end()) it->second = decode_name(it->second);

  fields["ble_company"] = join(companies);
  fields["ble_device_type"] = join(device_types);
  return fields;
}

} // namespace scan
} // namespace crowdscan
