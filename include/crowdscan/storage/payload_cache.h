/*
 * CrowdScan - Payload Cache
 *
 * Durable, bounded log of sync batches that failed delivery. Stored as one
 * JSON array; the oldest entries are evicted first once the bound is reached.
 * A missing, empty or malformed file reads as an empty cache. A file that
 * parses but does not fit the document budget is left on disk untouched.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_PAYLOAD_CACHE_H
#define CROWDSCAN_PAYLOAD_CACHE_H

#include <mutex>
#include <stddef.h>
#include <string>
#include <vector>
#include "crowdscan/config.h"

namespace crowdscan {
namespace storage {

class PayloadCache {
public:
  explicit PayloadCache(const std::string& path, size_t maxEntries = CACHE_MAX_ENTRIES,
                        size_t documentBudget = JSON_DOCUMENT_BUDGET);

  // Append one serialized JSON object. Returns false if the entry is not a
  // JSON object, the existing file could not be read into memory, or the
  // file could not be written.
  bool append(const std::string& entryJson);

  // All entries, oldest first, each re-serialized as compact JSON. Returns
  // false, with entries empty, when the file ran out of memory while
  // parsing.
  bool load(std::vector<std::string>* entries);

  bool clear();
  // True for a file that holds entries, including one too large to load.
  bool hasData();
  // Entries that can be loaded right now.
  size_t size();

  const std::string& path() const { return m_path; }
  size_t maxEntries() const { return m_max_entries; }

private:
  bool loadLocked(std::vector<std::string>* entries);
  bool writeLocked(const std::vector<std::string>& entries);

  std::string m_path;
  size_t m_max_entries;
  size_t m_document_budget;
  std::mutex m_mutex;
};

} // namespace storage
} // namespace crowdscan

#endif // CROWDSCAN_PAYLOAD_CACHE_H
