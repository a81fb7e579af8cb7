/*
 * CrowdScan - Device Identifier Anonymizer
 *
 * Tokens are Base64(HMAC-SHA256(secret, salt || identifier)). The same
 * identifier maps to the same token for the lifetime of one salt and to an
 * unlinkable token after rotation. The secret never leaves this object.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_ANONYMIZER_H
#define CROWDSCAN_ANONYMIZER_H

#include <memory>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

namespace crowdscan {
namespace privacy {

class Anonymizer {
public:
  // Starts with a fresh salt. The secret is copied and wiped on destruction.
  explicit Anonymizer(const std::vector<uint8_t>& secret);
  ~Anonymizer();

  Anonymizer(const Anonymizer&) = delete;
  Anonymizer& operator=(const Anonymizer&) = delete;

  // Replace the salt with 16 fresh random bytes (Base64). Returns the new
  // salt, or "" if the random source failed and the old salt was kept.
  std::string rotateSalt();

  // Returns "" on crypto failure (logged).
  std::string hash(const std::string& identifier) const;

  std::string currentSalt() const;

  // For deterministic tests and migration of a previously issued salt.
  void setSalt(const std::string& salt);

private:
  std::vector<uint8_t> m_secret;
  mutable std::mutex m_salt_mutex;
  std::shared_ptr<const std::string> m_salt;
};

} // namespace privacy
} // namespace crowdscan

#endif // CROWDSCAN_ANONYMIZER_H
