/*
 * CrowdScan - Device Identifier Anonymizer
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/privacy/anonymizer.h"
#include "crowdscan/config.h"
#include "crowdscan/core/encoding.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"
#include "crowdscan/privacy/key_material.h"

#include <mbedtls/md.h>

namespace crowdscan {
namespace privacy {

Anonymizer::Anonymizer(const std::vector<uint8_t>& secret)
  : m_secret(secret), m_salt(std::make_shared<const std::string>()) {
  if (m_secret.empty()) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "Anonymizer created without secret");
  }
  rotateSalt();
}

Anonymizer::~Anonymizer() {
  if (!m_secret.empty()) secure_wipe(m_secret.data(), m_secret.size());
}

std::string Anonymizer::rotateSalt() {
  uint8_t raw[SALT_BYTES];
  if (!random_bytes(raw, sizeof(raw))) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "Salt rotation failed, keeping previous salt");
    return std::string();
  }
  std::string salt = base64_encode(raw, sizeof(raw));
  secure_wipe(raw, sizeof(raw));

  {
    std::lock_guard<std::mutex> lock(m_salt_mutex);
    m_salt = std::make_shared<const std::string>(salt);
  }
  health_log(LOG_LEVEL_INFO, LOG_CAT_CRYPTO, "Anonymization salt rotated");
  return salt;
}

std::string Anonymizer::currentSalt() const {
  std::lock_guard<std::mutex> lock(m_salt_mutex);
  return *m_salt;
}

void Anonymizer::setSalt(const std::string& salt) {
  std::lock_guard<std::mutex> lock(m_salt_mutex);
  m_salt = std::make_shared<const std::string>(salt);
}

std::string Anonymizer::hash(const std::string& identifier) const {
  // Hold one salt generation for the whole computation
  std::shared_ptr<const std::string> salt;
  {
    std::lock_guard<std::mutex> lock(m_salt_mutex);
    salt = m_salt;
  }
  if (salt->empty()) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_CRYPTO, "Hashing with empty salt");
  }

  const mbedtls_md_info_t* md = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
  if (!md) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "SHA-256 unavailable");
    return std::string();
  }

  std::string input = *salt + identifier;
  uint8_t mac[32];
  int ret = mbedtls_md_hmac(md, m_secret.data(), m_secret.size(),
                            (const uint8_t*)input.data(), input.size(),
                            mac);
  if (ret != 0) {
    health_logging::logf(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "HMAC failed: -0x%04x", -ret);
    return std::string();
  }
  std::string token = base64_encode(mac, sizeof(mac));
  secure_wipe(mac, sizeof(mac));
  return token;
}

} // namespace privacy
} // namespace crowdscan
