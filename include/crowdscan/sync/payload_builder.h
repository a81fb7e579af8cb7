/*
 * CrowdScan - Payload Builder
 *
 * Turns an observation snapshot and the latest location fix into the
 * collector's batch document. Device addresses are replaced by anonymized
 * tokens; raw addresses and advertisement bytes are only included while
 * data privacy is disabled.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_PAYLOAD_BUILDER_H
#define CROWDSCAN_PAYLOAD_BUILDER_H

#include <stdint.h>
#include <string>
#include "crowdscan/config.h"
#include "crowdscan/location/location_oracle.h"
#include "crowdscan/privacy/anonymizer.h"
#include "crowdscan/scan/discovery_types.h"
#include "crowdscan/storage/settings.h"
#include "crowdscan/sync/sync_batch.h"

namespace crowdscan {
namespace sync {

class PayloadBuilder {
public:
  PayloadBuilder(storage::Settings& settings, const privacy::Anonymizer& anonymizer,
                 const std::string& appVersion = APP_VERSION_NAME)
    : m_settings(settings), m_anonymizer(anonymizer), m_app_version(appVersion) {}

  // Returns an invalid batch only if the document could not be serialized.
  SyncBatch build(const scan::DiscoverySnapshot& snapshot, const location::LocationFix& fix);

  // Same, with an explicit period key (wall-clock ms).
  SyncBatch build(const scan::DiscoverySnapshot& snapshot, const location::LocationFix& fix,
                  uint64_t periodMs);

private:
  std::string deviceId(const std::string& address) const;

  storage::Settings& m_settings;
  const privacy::Anonymizer& m_anonymizer;
  std::string m_app_version;
};

} // namespace sync
} // namespace crowdscan

#endif // CROWDSCAN_PAYLOAD_BUILDER_H
