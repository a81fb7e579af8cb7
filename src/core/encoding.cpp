/*
 * CrowdScan - Hex and Base64 Encoding
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/core/encoding.h"

#include <mbedtls/base64.h>

namespace crowdscan {

static const char HEX_DIGITS[] = "0123456789abcdef";

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string to_hex(const uint8_t* data, size_t len) {
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(HEX_DIGITS[data[i] >> 4]);
    out.push_back(HEX_DIGITS[data[i] & 0x0F]);
  }
  return out;
}

bool from_hex(const std::string& hex, std::vector<uint8_t>* out) {
  if (hex.size() % 2 != 0) return false;
  out->clear();
  out->reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) return false;
    out->push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string base64_encode(const uint8_t* data, size_t len) {
  size_t olen = 0;
  // First call reports the required size (including terminator)
  mbedtls_base64_encode(nullptr, 0, &olen, data, len);
  std::vector<unsigned char> buf(olen);
  if (olen == 0 || mbedtls_base64_encode(buf.data(), buf.size(), &olen, data, len) != 0) {
    return std::string();
  }
  return std::string(buf.begin(), buf.begin() + olen);
}

bool base64_decode(const std::string& text, std::vector<uint8_t>* out) {
  size_t olen = 0;
  const unsigned char* src = (const uint8_t*)text.data();
  int ret = mbedtls_base64_decode(nullptr, 0, &olen, src, text.size());
  if (ret == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) return false;
  out->assign(olen, 0);
  if (olen == 0) return text.empty();
  if (mbedtls_base64_decode(out->data(), out->size(), &olen, src, text.size()) != 0) {
    out->clear();
    return false;
  }
  out->resize(olen);
  return true;
}

static const char UTF8_REPLACEMENT[] = "\xEF\xBF\xBD";

std::string sanitize_utf8(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  const size_t n = text.size();
  size_t i = 0;
  while (i < n) {
    const uint8_t c = static_cast<uint8_t>(text[i]);
    if (c < 0x80) {
      out.push_back(text[i]);
      i++;
      continue;
    }

    // Continuation count and the allowed range of the first continuation byte
    size_t need = 0;
    uint8_t lo = 0x80, hi = 0xBF;
    if (c >= 0xC2 && c <= 0xDF)      need = 1;
    else if (c == 0xE0)              { need = 2; lo = 0xA0; }
    else if (c >= 0xE1 && c <= 0xEC) need = 2;
    else if (c == 0xED)              { need = 2; hi = 0x9F; }   // No surrogates
    else if (c >= 0xEE && c <= 0xEF) need = 2;
    else if (c == 0xF0)              { need = 3; lo = 0x90; }
    else if (c >= 0xF1 && c <= 0xF3) need = 3;
    else if (c == 0xF4)              { need = 3; hi = 0x8F; }   // <= U+10FFFF
    else {
      out += UTF8_REPLACEMENT;
      i++;
      continue;
    }

    size_t j = 1;
    while (j <= need && i + j < n) {
      const uint8_t b = static_cast<uint8_t>(text[i + j]);
      if (b < lo || b > hi) break;
      lo = 0x80;
      hi = 0xBF;
      j++;
    }
    if (j == need + 1) {
      out.append(text, i, need + 1);
    } else {
      out += UTF8_REPLACEMENT;
    }
    i += j;
  }
  return out;
}

} // namespace crowdscan
