/*
 * CrowdScan - Hex and Base64 Encoding
 *
 * Thin wrappers over mbedtls_base64 plus hex helpers used by the
 * advertisement parser, the anonymizer and the settings stores.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_ENCODING_H
#define CROWDSCAN_ENCODING_H

#include <stdint.h>
#include <string>
#include <vector>

namespace crowdscan {

// Lower-case hex, no separators.
std::string to_hex(const uint8_t* data, size_t len);
inline std::string to_hex(const std::vector<uint8_t>& data) {
  return to_hex(data.data(), data.size());
}

// Accepts upper or lower case. Returns false on odd length or a non-hex digit.
bool from_hex(const std::string& hex, std::vector<uint8_t>* out);

// Standard alphabet with padding, no line wrapping.
std::string base64_encode(const uint8_t* data, size_t len);

bool base64_decode(const std::string& text, std::vector<uint8_t>* out);

// Copies well-formed UTF-8 through unchanged. Each invalid, overlong or
// truncated sequence becomes one U+FFFD.
std::string sanitize_utf8(const std::string& text);

} // namespace crowdscan

#endif // CROWDSCAN_ENCODING_H
