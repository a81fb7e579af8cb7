/*
 * CrowdScan - Key Material Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/privacy/key_material.h"
#include "crowdscan/config.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"
#include "crowdscan/storage/settings.h"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <cstring>
#include <mutex>

namespace crowdscan {
namespace privacy {

namespace {

std::mutex s_rng_mutex;
mbedtls_entropy_context s_entropy;
mbedtls_ctr_drbg_context s_drbg;
bool s_rng_ready = false;

static const char* DRBG_PERSONALIZATION = "crowdscan-anon";

bool ensure_rng_locked() {
  if (s_rng_ready) return true;
  mbedtls_entropy_init(&s_entropy);
  mbedtls_ctr_drbg_init(&s_drbg);
  int ret = mbedtls_ctr_drbg_seed(&s_drbg, mbedtls_entropy_func, &s_entropy,
                                  (const uint8_t*)DRBG_PERSONALIZATION,
                                  strlen(DRBG_PERSONALIZATION));
  if (ret != 0) {
    health_logging::logf(LOG_LEVEL_CRITICAL, LOG_CAT_CRYPTO, "DRBG seed failed: -0x%04x", -ret);
    mbedtls_ctr_drbg_free(&s_drbg);
    mbedtls_entropy_free(&s_entropy);
    return false;
  }
  s_rng_ready = true;
  return true;
}

bool is_all_zero(const std::vector<uint8_t>& v) {
  for (uint8_t b : v) {
    if (b != 0) return false;
  }
  return true;
}

} // namespace

bool random_bytes(uint8_t* buf, size_t len) {
  std::lock_guard<std::mutex> lock(s_rng_mutex);
  if (!ensure_rng_locked()) return false;
  // CTR_DRBG caps a single request; split large ones
  while (len > 0) {
    size_t chunk = len < MBEDTLS_CTR_DRBG_MAX_REQUEST ? len : MBEDTLS_CTR_DRBG_MAX_REQUEST;
    int ret = mbedtls_ctr_drbg_random(&s_drbg, buf, chunk);
    if (ret != 0) {
      health_logging::logf(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "DRBG generate failed: -0x%04x", -ret);
      return false;
    }
    buf += chunk;
    len -= chunk;
  }
  return true;
}

bool load_or_create_secret(storage::SettingsStore& store, std::vector<uint8_t>* secret) {
  std::vector<uint8_t> loaded;
  if (store.getBlob(storage::keys::ANON_SECRET, &loaded)) {
    if (loaded.size() == SECRET_KEY_BYTES && !is_all_zero(loaded)) {
      *secret = loaded;
      secure_wipe(loaded.data(), loaded.size());
      health_log(LOG_LEVEL_DEBUG, LOG_CAT_CRYPTO, "Anonymization secret loaded");
      return true;
    }
    health_log(LOG_LEVEL_WARNING, LOG_CAT_CRYPTO, "Stored secret invalid, regenerating");
    if (!loaded.empty()) secure_wipe(loaded.data(), loaded.size());
  }

  std::vector<uint8_t> fresh(SECRET_KEY_BYTES, 0);
  if (!random_bytes(fresh.data(), fresh.size()) || is_all_zero(fresh)) {
    health_log(LOG_LEVEL_CRITICAL, LOG_CAT_CRYPTO, "Failed to generate anonymization secret");
    return false;
  }
  if (!store.putBlob(storage::keys::ANON_SECRET, fresh.data(), fresh.size())) {
    // Valid for this session; tokens will not be stable across restarts
    health_log(LOG_LEVEL_ERROR, LOG_CAT_CRYPTO, "Failed to persist anonymization secret");
  } else {
    health_log(LOG_LEVEL_NOTICE, LOG_CAT_CRYPTO, "Anonymization secret generated");
  }
  *secret = fresh;
  secure_wipe(fresh.data(), fresh.size());
  return true;
}

} // namespace privacy
} // namespace crowdscan
