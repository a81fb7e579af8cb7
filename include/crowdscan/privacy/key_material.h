/*
 * CrowdScan - Key Material
 *
 * CSPRNG access (mbedtls CTR_DRBG seeded from the platform entropy source)
 * and the persisted anonymization secret.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_KEY_MATERIAL_H
#define CROWDSCAN_KEY_MATERIAL_H

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "crowdscan/storage/settings_store.h"

namespace crowdscan {
namespace privacy {

// Fill buf with len random bytes. Returns false if the DRBG cannot be
// seeded or reseeded.
bool random_bytes(uint8_t* buf, size_t len);

/*
 * Load the anonymization secret from the store, generating and persisting a
 * new one if absent, of the wrong size, or all zeros. Returns false only
 * if no secret could be produced; a failed persist is logged and the
 * generated secret is still returned for this session.
 */
bool load_or_create_secret(storage::SettingsStore& store, std::vector<uint8_t>* secret);

} // namespace privacy
} // namespace crowdscan

#endif // CROWDSCAN_KEY_MATERIAL_H
