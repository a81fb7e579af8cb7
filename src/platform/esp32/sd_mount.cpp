/*
 * CrowdScan - SD Card Mount Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/platform/esp32/sd_mount.h"
#include "crowdscan/core/health_log.h"

#include <FS.h>
#include <SD.h>
#include <SPI.h>

namespace crowdscan {
namespace platform {

static bool s_mounted = false;

bool sd_mount(uint8_t csPin) {
  if (s_mounted) return true;
  if (!SD.begin(csPin, SPI, 4000000, SD_MOUNT_POINT)) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "SD mount failed");
    return false;
  }
  if (SD.cardType() == CARD_NONE) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "No SD card inserted");
    SD.end();
    return false;
  }
  if (!SD.exists(SD_DATA_DIR) && !SD.mkdir(SD_DATA_DIR)) {
    log_health(LOG_LEVEL_ERROR, LOG_CAT_STORAGE, "Cannot create data directory", SD_DATA_DIR);
    SD.end();
    return false;
  }
  s_mounted = true;
  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_STORAGE, "SD mounted (%llu MB)",
                       (unsigned long long)(SD.cardSize() / (1024ULL * 1024ULL)));
  return true;
}

void sd_unmount() {
  if (!s_mounted) return;
  SD.end();
  s_mounted = false;
}

SdStatus sd_status() {
  SdStatus s = {};
  s.mounted = s_mounted;
  if (s_mounted) {
    s.total_bytes = SD.totalBytes();
    s.used_bytes = SD.usedBytes();
  }
  return s;
}

std::string sd_data_path() {
  return std::string(SD_MOUNT_POINT) + SD_DATA_DIR;
}

} // namespace platform
} // namespace crowdscan
