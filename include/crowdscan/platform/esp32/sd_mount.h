/*
 * CrowdScan - SD Card Mount
 *
 * Mounts the SD card on SPI and prepares the data directory holding the
 * payload cache, settings file, metadata table and GTFS route files.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_SD_MOUNT_H
#define CROWDSCAN_SD_MOUNT_H

#include <stdint.h>
#include <string>

namespace crowdscan {
namespace platform {

static constexpr const char* SD_MOUNT_POINT = "/sd";
static constexpr const char* SD_DATA_DIR    = "/crowdscan";   // Relative to the card root

struct SdStatus {
  bool     mounted;
  uint64_t total_bytes;
  uint64_t used_bytes;
};

// Returns false (logged) if the card is missing or unreadable.
bool sd_mount(uint8_t csPin);
void sd_unmount();
SdStatus sd_status();

// VFS path of the data directory, e.g. "/sd/crowdscan"
std::string sd_data_path();

} // namespace platform
} // namespace crowdscan

#endif // CROWDSCAN_SD_MOUNT_H
