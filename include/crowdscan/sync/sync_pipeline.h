/*
 * CrowdScan - Sync Pipeline
 *
 * Delivers batches to the collector. Batches that fail delivery are kept in
 * the payload cache and merged into the next submission, keyed by period, so
 * one success drains everything outstanding.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_SYNC_PIPELINE_H
#define CROWDSCAN_SYNC_PIPELINE_H

#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>
#include "crowdscan/config.h"
#include "crowdscan/core/event_sink.h"
#include "crowdscan/storage/payload_cache.h"
#include "crowdscan/storage/settings.h"
#include "crowdscan/sync/http_sender.h"
#include "crowdscan/sync/sync_batch.h"

namespace crowdscan {
namespace sync {

enum SyncOutcome : uint8_t {
  SYNC_SUCCESS       = 0,
  SYNC_FAILED_CACHED = 1,   // Delivery failed, new batch persisted
  SYNC_FAILED        = 2,   // Delivery failed and the cache write failed
  SYNC_SKIPPED_EMPTY = 3    // Nothing to send after merge
};

const char* sync_outcome_name(SyncOutcome outcome);

// Fields relayed from a successful response; defaults when absent
struct ServerResponse {
  std::string status;
  int32_t estimated_crowd = 0;
  int32_t recently_seen = 0;
  int32_t recently_seen_window_ms = 0;
};

struct SyncResult {
  SyncOutcome outcome = SYNC_FAILED;
  ServerResponse response;
  bool location_restart_requested = false;
  size_t merged_entries = 0;          // Cached entries folded into this send
  bool cache_deferred = false;        // Cache too large to merge, left on disk
};

class SyncPipeline {
public:
  SyncPipeline(storage::PayloadCache& cache, HttpSender& sender, storage::Settings& settings,
               const EventDispatcher& events, size_t documentBudget = JSON_DOCUMENT_BUDGET)
    : m_cache(cache), m_sender(sender), m_settings(settings), m_events(events),
      m_document_budget(documentBudget) {}

  // Serialized: each call observes the cache state left by the previous one.
  SyncResult submit(const SyncBatch& batch, double lat, double lon);

  std::string endpointUrl();

  // Lenient: malformed input yields defaults.
  static ServerResponse parseResponse(const std::string& body);

  // Merge entries by period key; devices and classic_devices are
  // concatenated per key. Metadata other than periods comes from the last
  // entry; uuid falls back to the first entry carrying one. *out is "" if
  // nothing parsed. Returns false when the merge ran out of memory.
  static bool mergeEntries(const std::vector<std::string>& entries, std::string* out,
                           size_t* deviceCount, size_t documentBudget = JSON_DOCUMENT_BUDGET);

private:
  storage::PayloadCache& m_cache;
  HttpSender& m_sender;
  storage::Settings& m_settings;
  const EventDispatcher& m_events;
  size_t m_document_budget;
  std::mutex m_submit_mutex;
};

} // namespace sync
} // namespace crowdscan

#endif // CROWDSCAN_SYNC_PIPELINE_H
