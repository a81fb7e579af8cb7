/*
 * CrowdScan - ESP32 Connectivity Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/platform/esp32/esp32_connectivity.h"
#include "crowdscan/core/health_log.h"

#include <esp_bt.h>

namespace crowdscan {
namespace platform {

bool Esp32Connectivity::isRadioEnabled() {
  if (!m_enabled.load()) return false;
  // IDLE means not brought up yet, which the sources handle
  esp_bt_controller_status_t status = esp_bt_controller_get_status();
  return status == ESP_BT_CONTROLLER_STATUS_IDLE ||
         status == ESP_BT_CONTROLLER_STATUS_INITED ||
         status == ESP_BT_CONTROLLER_STATUS_ENABLED;
}

void Esp32Connectivity::setEnabled(bool enabled) {
  if (m_enabled.exchange(enabled) == enabled) return;
  log_health(LOG_LEVEL_INFO, LOG_CAT_BLUETOOTH, "Radio toggled", enabled ? "on" : "off");
  if (m_handler) m_handler(enabled);
}

} // namespace platform
} // namespace crowdscan
