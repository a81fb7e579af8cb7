/*
 * CrowdScan - Bluetooth Classic Discovery Source Implementation
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include "crowdscan/platform/esp32/bt_classic_discovery_source.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/core/time_util.h"

#include <sdkconfig.h>
#include <stdio.h>
#include <string.h>

#if defined(CONFIG_BT_CLASSIC_ENABLED) && defined(CONFIG_BT_BLUEDROID_ENABLED)
#include <esp_bt.h>
#include <esp_bt_device.h>
#include <esp_bt_main.h>
#include <esp_gap_bt_api.h>
#define CROWDSCAN_HAVE_BT_CLASSIC 1
#else
#define CROWDSCAN_HAVE_BT_CLASSIC 0
#endif

namespace crowdscan {
namespace platform {

// GAP callbacks carry no user context
static BtClassicDiscoverySource* s_instance = nullptr;

#if CROWDSCAN_HAVE_BT_CLASSIC

static std::string format_bda(const esp_bd_addr_t bda) {
  char buf[18];
  snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
           bda[0], bda[1], bda[2], bda[3], bda[4], bda[5]);
  return std::string(buf);
}

static void gap_callback(esp_bt_gap_cb_event_t event, esp_bt_gap_cb_param_t* param) {
  BtClassicDiscoverySource* self = s_instance;
  if (!self) return;

  switch (event) {
    case ESP_BT_GAP_DISC_RES_EVT: {
      scan::DiscoveryRecord r;
      r.address = format_bda(param->disc_res.bda);
      r.timestamp_ms = now_wall_ms();
      for (int i = 0; i < param->disc_res.num_prop; i++) {
        esp_bt_gap_dev_prop_t* p = &param->disc_res.prop[i];
        switch (p->type) {
          case ESP_BT_GAP_DEV_PROP_COD:
            r.has_device_class = true;
            r.device_class = *(uint32_t*)p->val;
            break;
          case ESP_BT_GAP_DEV_PROP_RSSI:
            r.has_rssi = true;
            r.rssi = *(int8_t*)p->val;
            break;
          case ESP_BT_GAP_DEV_PROP_BDNAME:
            r.name.assign((const char*)p->val, strnlen((const char*)p->val, p->len));
            break;
          case ESP_BT_GAP_DEV_PROP_EIR: {
            uint8_t len = 0;
            uint8_t* name = esp_bt_gap_resolve_eir_data((uint8_t*)p->val,
                                                        ESP_BT_EIR_TYPE_CMPL_LOCAL_NAME, &len);
            if (!name) {
              name = esp_bt_gap_resolve_eir_data((uint8_t*)p->val,
                                                 ESP_BT_EIR_TYPE_SHORT_LOCAL_NAME, &len);
            }
            if (name && r.name.empty()) r.name.assign((const char*)name, len);
            break;
          }
          default:
            break;
        }
      }
      self->handleRecord(r);
      break;
    }
    case ESP_BT_GAP_DISC_STATE_CHANGED_EVT:
      self->handleStateChange(param->disc_st_chg.state == ESP_BT_GAP_DISCOVERY_STARTED);
      break;
    default:
      break;
  }
}

#endif // CROWDSCAN_HAVE_BT_CLASSIC

BtClassicDiscoverySource::BtClassicDiscoverySource(uint8_t inquiryLength)
  : m_inquiry_length(inquiryLength), m_ready(false), m_listener(nullptr), m_discovering(false) {}

BtClassicDiscoverySource::~BtClassicDiscoverySource() {
  if (s_instance == this) s_instance = nullptr;
}

bool BtClassicDiscoverySource::prepare() {
#if CROWDSCAN_HAVE_BT_CLASSIC
  if (m_ready) return true;
  if (esp_bluedroid_get_status() == ESP_BLUEDROID_STATUS_UNINITIALIZED &&
      esp_bluedroid_init() != ESP_OK) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Bluedroid init failed");
    return false;
  }
  if (esp_bluedroid_get_status() != ESP_BLUEDROID_STATUS_ENABLED &&
      esp_bluedroid_enable() != ESP_OK) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Bluedroid enable failed");
    return false;
  }
  s_instance = this;
  esp_err_t err = esp_bt_gap_register_callback(gap_callback);
  if (err != ESP_OK) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "GAP callback registration failed",
               esp_err_to_name(err));
    return false;
  }
  m_ready = true;
  return true;
#else
  health_log(LOG_LEVEL_NOTICE, LOG_CAT_BLUETOOTH, "Classic Bluetooth not in this build");
  return false;
#endif
}

bool BtClassicDiscoverySource::startDiscovery() {
#if CROWDSCAN_HAVE_BT_CLASSIC
  if (!m_ready) return false;
  esp_err_t err = esp_bt_gap_start_discovery(ESP_BT_INQ_MODE_GENERAL_INQUIRY, m_inquiry_length, 0);
  if (err != ESP_OK) {
    log_health(LOG_LEVEL_WARNING, LOG_CAT_BLUETOOTH, "Inquiry start failed", esp_err_to_name(err));
    return false;
  }
  m_discovering = true;
  return true;
#else
  return false;
#endif
}

void BtClassicDiscoverySource::stopDiscovery() {
#if CROWDSCAN_HAVE_BT_CLASSIC
  if (m_ready && m_discovering) esp_bt_gap_cancel_discovery();
#endif
  m_discovering = false;
}

void BtClassicDiscoverySource::handleRecord(const scan::DiscoveryRecord& record) {
  scan::ClassicDiscoveryListener* listener = m_listener.load();
  if (listener) listener->onClassicRecord(record);
}

void BtClassicDiscoverySource::handleStateChange(bool discovering) {
  bool was = m_discovering.exchange(discovering);
  if (was && !discovering) {
    scan::ClassicDiscoveryListener* listener = m_listener.load();
    if (listener) listener->onDiscoveryFinished();
  }
}

} // namespace platform
} // namespace crowdscan
