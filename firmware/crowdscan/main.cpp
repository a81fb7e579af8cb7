/*
 * CrowdScan - ESP32 Firmware Entry Point
 *
 * Wires the portable core to the ESP32 adapters:
 *   - NimBLE scanning and (when built with Bluedroid) classic inquiry
 *   - GNSS NMEA over UART1
 *   - NVS settings, SD card cache and route files
 *   - WiFi station + HTTPClient delivery
 *
 * The presentation layer is the USB serial port: events go out as one JSON
 * object per line, commands come in as text lines (see app_handle_command).
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include <Arduino.h>
#include <ArduinoJson.h>
#include <WiFi.h>

#include <memory>
#include <stdio.h>
#include <string.h>

#include "crowdscan/app/scan_orchestrator.h"
#include "crowdscan/config.h"
#include "crowdscan/core/health_log.h"
#include "crowdscan/geo/geo_gate.h"
#include "crowdscan/location/nmea_location.h"
#include "crowdscan/platform/esp32/bt_classic_discovery_source.h"
#include "crowdscan/platform/esp32/esp32_connectivity.h"
#include "crowdscan/platform/esp32/http_client_sender.h"
#include "crowdscan/platform/esp32/nimble_discovery_source.h"
#include "crowdscan/platform/esp32/preferences_settings_store.h"
#include "crowdscan/platform/esp32/sd_mount.h"
#include "crowdscan/privacy/key_material.h"
#include "crowdscan/scan/adv_parser.h"
#include "crowdscan/storage/file_io.h"

using namespace crowdscan;

// ════════════════════════════════════════════════════════════════════════════
// BOARD
// ════════════════════════════════════════════════════════════════════════════

static const uint32_t SERIAL_BAUD       = 115200;
static const uint32_t GNSS_BAUD         = 9600;
static const int8_t   GNSS_RX_PIN       = 44;
static const int8_t   GNSS_TX_PIN       = 43;
static const uint8_t  SD_CS_PIN         = 21;
static const uint32_t WIFI_RETRY_MS     = 15000;
static const size_t   COMMAND_MAX       = 192;

// WiFi credentials live in NVS next to the settings
static const char* KEY_WIFI_SSID = "wifiSsid";
static const char* KEY_WIFI_PASS = "wifiPass";

// ════════════════════════════════════════════════════════════════════════════
// SERIAL EVENT SINK
// ════════════════════════════════════════════════════════════════════════════

class SerialEventSink : public EventSink {
public:
  void sendEvent(const char* name, int32_t value) override {
    StaticJsonDocument<128> doc;
    doc["event"] = name;
    doc["value"] = value;
    write(doc);
  }

  void sendStringEvent(const char* name, const std::string& value) override {
    DynamicJsonDocument doc(128 + value.size());
    doc["event"] = name;
    doc["value"] = value;
    write(doc);
  }

private:
  void write(const JsonDocument& doc) {
    serializeJson(doc, Serial);
    Serial.println();
  }
};

// ════════════════════════════════════════════════════════════════════════════
// APPLICATION STATE
// ════════════════════════════════════════════════════════════════════════════

static SerialEventSink g_sink;
static EventDispatcher g_events(&g_sink);
static platform::PreferencesSettingsStore g_store;
static storage::Settings g_settings(g_store);
static platform::HttpClientSender g_sender;
static platform::NimBleDiscoverySource g_ble;
static platform::BtClassicDiscoverySource g_classic;
static platform::Esp32Connectivity g_connectivity;
static location::NmeaLocationSource g_gnss;
static scan::BtMetadata g_metadata;
static scan::AdvParser g_parser(g_metadata);

// Constructed in setup() once storage and key material are available
static std::unique_ptr<storage::PayloadCache> g_cache;
static std::unique_ptr<privacy::Anonymizer> g_anonymizer;
static std::unique_ptr<geo::GtfsShapeRouteSource> g_routes;
static std::unique_ptr<geo::GeoGate> g_geo;
static std::unique_ptr<scan::DiscoveryAggregator> g_aggregator;
static std::unique_ptr<sync::SyncPipeline> g_pipeline;
static std::unique_ptr<sync::PayloadBuilder> g_builder;
static std::unique_ptr<app::ScanOrchestrator> g_orchestrator;

static bool g_initialized = false;
static uint32_t g_last_wifi_attempt_ms = 0;
static char g_command[COMMAND_MAX];
static size_t g_command_len = 0;

// ════════════════════════════════════════════════════════════════════════════
// INITIALIZATION
// ════════════════════════════════════════════════════════════════════════════

static void app_ensure_user_uuid() {
  if (!g_settings.userUuid().empty()) return;
  uint8_t b[16];
  if (!privacy::random_bytes(b, sizeof(b))) {
    health_log(LOG_LEVEL_ERROR, LOG_CAT_SYSTEM, "Cannot generate installation id");
    return;
  }
  b[6] = (b[6] & 0x0F) | 0x40;   // Version 4
  b[8] = (b[8] & 0x3F) | 0x80;   // RFC 4122 variant
  char uuid[37];
  snprintf(uuid, sizeof(uuid),
           "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
           b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
           b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
  g_settings.setUserUuid(uuid);
}

static bool app_init_storage() {
  if (!g_store.begin(false)) return false;
  app_ensure_user_uuid();

  if (!platform::sd_mount(SD_CS_PIN)) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_STORAGE, "Running without SD; failed batches are lost");
  }
  std::string data_dir = platform::sd_data_path();
  g_cache = std::make_unique<storage::PayloadCache>(storage::join_path(data_dir, CACHE_FILE_NAME));
  g_routes = std::make_unique<geo::GtfsShapeRouteSource>(data_dir);
  g_geo = std::make_unique<geo::GeoGate>(*g_routes);

  if (!g_metadata.loadFromFile(storage::join_path(data_dir, METADATA_FILE_NAME))) {
    health_log(LOG_LEVEL_WARNING, LOG_CAT_STORAGE, "No advertisement metadata, names unresolved");
  }
  return true;
}

static bool app_init_privacy() {
  std::vector<uint8_t> secret;
  if (!privacy::load_or_create_secret(g_store, &secret)) {
    health_log(LOG_LEVEL_CRITICAL, LOG_CAT_CRYPTO, "No hashing secret, refusing to scan");
    return false;
  }
  g_anonymizer = std::make_unique<privacy::Anonymizer>(secret);
  return true;
}

static void app_init_scan() {
  g_aggregator = std::make_unique<scan::DiscoveryAggregator>(g_ble, g_classic, g_events, &g_parser);
  g_pipeline = std::make_unique<sync::SyncPipeline>(*g_cache, g_sender, g_settings, g_events);
  g_builder = std::make_unique<sync::PayloadBuilder>(g_settings, *g_anonymizer);

  app::OrchestratorDeps deps;
  deps.settings = &g_settings;
  deps.connectivity = &g_connectivity;
  deps.location = &g_gnss;
  deps.aggregator = g_aggregator.get();
  deps.builder = g_builder.get();
  deps.pipeline = g_pipeline.get();
  deps.cache = g_cache.get();
  deps.geo = g_geo.get();
  deps.anonymizer = g_anonymizer.get();
  deps.events = &g_events;
  g_orchestrator = std::make_unique<app::ScanOrchestrator>(deps);

  g_connectivity.onChange([](bool enabled) { g_orchestrator->onRadioStateChanged(enabled); });
}

static void app_connect_wifi() {
  if (WiFi.status() == WL_CONNECTED) return;
  uint32_t now = millis();
  if (g_last_wifi_attempt_ms != 0 && now - g_last_wifi_attempt_ms < WIFI_RETRY_MS) return;
  g_last_wifi_attempt_ms = now;

  std::string ssid = g_store.getString(KEY_WIFI_SSID, "");
  if (ssid.empty()) return;
  std::string pass = g_store.getString(KEY_WIFI_PASS, "");
  WiFi.mode(WIFI_STA);
  WiFi.begin(ssid.c_str(), pass.c_str());
  log_health(LOG_LEVEL_INFO, LOG_CAT_NETWORK, "WiFi connecting", ssid.c_str());
}

// ════════════════════════════════════════════════════════════════════════════
// SERIAL COMMANDS
// ════════════════════════════════════════════════════════════════════════════

static void app_dump_log(size_t max_entries) {
  std::vector<HealthLogEntry> entries = health_log_recent(max_entries);
  Serial.printf("-- %u entries logged, showing %u --\n", (unsigned)health_log_count(),
                (unsigned)entries.size());
  for (const HealthLogEntry& e : entries) {
    Serial.printf("%lu [%s][%s] %s %s\n", (unsigned long)e.sequence, log_level_name(e.level),
                  log_category_name(e.category), e.message, e.detail);
  }
}

static void app_handle_command(char* line) {
  char* arg = strchr(line, ' ');
  if (arg) *arg++ = '\0';
  std::string cmd(line);

  if (cmd == "start") {
    g_orchestrator->start();
  } else if (cmd == "stop") {
    g_orchestrator->stop();
  } else if (cmd == "trip-start") {
    g_orchestrator->startTrip();
  } else if (cmd == "trip-end") {
    g_orchestrator->endTrip();
  } else if (cmd == "next-stop") {
    g_orchestrator->nextStop();
  } else if (cmd == "trip-name" && arg) {
    g_orchestrator->setCalibrationTripName(arg);
  } else if (cmd == "count" && arg) {
    g_orchestrator->setManualCalibrationCount(atoi(arg));
  } else if (cmd == "count+") {
    g_orchestrator->incrementCalibrationCount();
  } else if (cmd == "count-") {
    g_orchestrator->decrementCalibrationCount();
  } else if (cmd == "board+") {
    g_orchestrator->incrementBoarding();
  } else if (cmd == "board-") {
    g_orchestrator->decrementBoarding();
  } else if (cmd == "alight+") {
    g_orchestrator->incrementAlighting();
  } else if (cmd == "alight-") {
    g_orchestrator->decrementAlighting();
  } else if (cmd == "radio" && arg) {
    g_connectivity.setEnabled(strcmp(arg, "on") == 0);
  } else if (cmd == "server" && arg) {
    g_settings.setServer(arg);
  } else if (cmd == "vehicle" && arg) {
    g_settings.setVehicleType(arg);
  } else if (cmd == "privacy" && arg) {
    g_settings.setDataPrivacyEnabled(strcmp(arg, "on") == 0);
  } else if (cmd == "geo" && arg) {
    g_settings.setGeoRestrictionEnabled(strcmp(arg, "on") == 0);
  } else if (cmd == "regions" && arg) {
    g_settings.setRestrictedCitiesJson(arg);
  } else if (cmd == "log") {
    app_dump_log(arg ? (size_t)atoi(arg) : 20);
  } else if (cmd == "log-clear") {
    health_log_clear();
  } else if (cmd == "wifi" && arg) {
    char* pass = strchr(arg, ' ');
    if (pass) *pass++ = '\0';
    g_store.putString(KEY_WIFI_SSID, arg);
    g_store.putString(KEY_WIFI_PASS, pass ? pass : "");
    g_last_wifi_attempt_ms = 0;
    WiFi.disconnect();
  } else {
    log_health(LOG_LEVEL_NOTICE, LOG_CAT_USER, "Unknown command", line);
  }
}

static void app_process_serial() {
  while (Serial.available() > 0) {
    int c = Serial.read();
    if (c == '\r') continue;
    if (c == '\n') {
      g_command[g_command_len] = '\0';
      if (g_command_len > 0) app_handle_command(g_command);
      g_command_len = 0;
    } else if (g_command_len < COMMAND_MAX - 1) {
      g_command[g_command_len++] = (char)c;
    }
  }
}

static void app_process_gnss() {
  uint8_t buf[64];
  while (Serial1.available() > 0) {
    size_t n = Serial1.readBytes(buf, sizeof(buf));
    if (n == 0) break;
    g_gnss.feed(buf, n);
  }
}

// ════════════════════════════════════════════════════════════════════════════
// SETUP / LOOP
// ════════════════════════════════════════════════════════════════════════════

void setup() {
  Serial.begin(SERIAL_BAUD);
  Serial1.begin(GNSS_BAUD, SERIAL_8N1, GNSS_RX_PIN, GNSS_TX_PIN);

  health_logging::logf(LOG_LEVEL_INFO, LOG_CAT_SYSTEM, "%s v%s starting", APP_NAME,
                       APP_VERSION_NAME);

  if (!app_init_storage()) {
    health_log(LOG_LEVEL_CRITICAL, LOG_CAT_STORAGE, "NVS unavailable, halting");
    return;
  }
  if (!app_init_privacy()) return;
  app_init_scan();
  app_connect_wifi();

  g_initialized = true;
  g_orchestrator->resumeIfPersisted();
}

void loop() {
  if (!g_initialized) {
    delay(1000);
    return;
  }
  app_process_serial();
  app_process_gnss();
  app_connect_wifi();
  delay(10);
}
