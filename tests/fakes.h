/*
 * CrowdScan - Test Fakes
 *
 * Scriptable stand-ins for the radio sources, oracles, HTTP transport and
 * event sink.
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#ifndef CROWDSCAN_TEST_FAKES_H
#define CROWDSCAN_TEST_FAKES_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stdlib.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

#include "crowdscan/core/event_sink.h"
#include "crowdscan/location/location_oracle.h"
#include "crowdscan/scan/discovery_source.h"
#include "crowdscan/sync/http_sender.h"

namespace crowdscan {
namespace test {

inline bool wait_until(const std::function<bool()>& pred, uint32_t timeout_ms = 3000) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

inline std::string make_temp_dir() {
  char tmpl[] = "/tmp/crowdscan_test_XXXXXX";
  char* dir = mkdtemp(tmpl);
  return dir ? std::string(dir) : std::string("/tmp");
}

inline scan::DiscoveryRecord make_record(const std::string& address, const std::string& name = "") {
  scan::DiscoveryRecord r;
  r.address = address;
  r.name = name;
  r.has_rssi = true;
  r.rssi = -60;
  return r;
}

// ════════════════════════════════════════════════════════════════════════════
// DISCOVERY SOURCES
// ════════════════════════════════════════════════════════════════════════════

class FakeBleSource : public scan::BleDiscoverySource {
public:
  const char* name() const override { return "fake-ble"; }

  bool prepare() override {
    prepare_calls++;
    return prepare_calls > prepare_failures;
  }

  void setListener(scan::BleDiscoveryListener* l) override { listener = l; }

  bool startScan(scan::BleScanMode mode) override {
    std::lock_guard<std::mutex> lock(mutex);
    start_calls++;
    modes.push_back(mode);
    if (reject_starts_after >= 0 && start_calls > reject_starts_after) return false;
    scanning = true;
    return true;
  }

  void stopScan() override {
    stop_calls++;
    scanning = false;
  }

  void deliver(const scan::DiscoveryRecord& r) {
    if (listener) listener->onBleRecord(r);
  }
  void deliverBatch(const std::vector<scan::DiscoveryRecord>& rs) {
    if (listener) listener->onBleBatch(rs);
  }
  void fail(uint8_t code) {
    if (listener) listener->onBleScanFailed(code);
  }

  std::vector<scan::BleScanMode> modesSeen() {
    std::lock_guard<std::mutex> lock(mutex);
    return modes;
  }

  std::atomic<int> prepare_calls{0};
  int prepare_failures = 0;
  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};
  int reject_starts_after = -1;      // -1: never reject
  std::atomic<bool> scanning{false};
  scan::BleDiscoveryListener* listener = nullptr;

private:
  std::mutex mutex;
  std::vector<scan::BleScanMode> modes;
};

class FakeClassicSource : public scan::ClassicDiscoverySource {
public:
  const char* name() const override { return "fake-classic"; }
  bool prepare() override { return available; }
  void setListener(scan::ClassicDiscoveryListener* l) override { listener = l; }
  bool isDiscovering() override { return discovering; }
  bool startDiscovery() override {
    start_calls++;
    discovering = true;
    return true;
  }
  void stopDiscovery() override {
    stop_calls++;
    discovering = false;
  }

  void deliver(const scan::DiscoveryRecord& r) {
    if (listener) listener->onClassicRecord(r);
  }
  void finishPass() {
    discovering = false;
    if (listener) listener->onDiscoveryFinished();
  }

  bool available = true;
  std::atomic<bool> discovering{false};
  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};
  scan::ClassicDiscoveryListener* listener = nullptr;
};

// ════════════════════════════════════════════════════════════════════════════
// ORACLES
// ════════════════════════════════════════════════════════════════════════════

class FakeLocation : public location::LocationOracle {
public:
  bool startUpdates(location::LocationListener* l) override {
    start_calls++;
    listener = l;
    return start_ok;
  }
  void stopUpdates() override {
    stop_calls++;
    listener = nullptr;
  }

  void deliverFix(double lat, double lon) {
    location::LocationFix fix;
    fix.valid = true;
    fix.lat = lat;
    fix.lon = lon;
    fix.hdop = 1.0;
    fix.satellites = 8;
    fix.time_ms = 1700000000000ULL;
    location::LocationListener* l = listener;
    if (l) l->onLocationFix(fix);
  }

  void unavailable() {
    location::LocationListener* l = listener;
    if (l) l->onLocationUnavailable();
  }

  bool start_ok = true;
  std::atomic<int> start_calls{0};
  std::atomic<int> stop_calls{0};
  std::atomic<location::LocationListener*> listener{nullptr};
};

class FakeConnectivity : public location::ConnectivityOracle {
public:
  bool isRadioEnabled() override { return enabled; }
  bool enabled = true;
};

// ════════════════════════════════════════════════════════════════════════════
// HTTP
// ════════════════════════════════════════════════════════════════════════════

struct RecordedRequest {
  std::string url;
  std::string body;
  sync::HttpHeaders headers;
};

class FakeSender : public sync::HttpSender {
public:
  sync::HttpResponse post(const std::string& url, const std::string& body,
                          const sync::HttpHeaders& headers) override {
    std::unique_lock<std::mutex> lock(mutex);
    requests.push_back(RecordedRequest{url, body, headers});
    released.wait(lock, [this] { return !held; });
    if (scripted.empty()) return ok("");
    sync::HttpResponse r = scripted.front();
    scripted.pop_front();
    return r;
  }

  void push(const sync::HttpResponse& r) {
    std::lock_guard<std::mutex> lock(mutex);
    scripted.push_back(r);
  }

  // While held, post() records the request and then blocks until release()
  void hold() {
    std::lock_guard<std::mutex> lock(mutex);
    held = true;
  }

  void release() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      held = false;
    }
    released.notify_all();
  }

  size_t requestCount() {
    std::lock_guard<std::mutex> lock(mutex);
    return requests.size();
  }

  RecordedRequest request(size_t i) {
    std::lock_guard<std::mutex> lock(mutex);
    return requests.at(i);
  }

  static sync::HttpResponse ok(const std::string& body) {
    sync::HttpResponse r;
    r.transport_ok = true;
    r.status = 200;
    r.has_body = !body.empty();
    r.body = body;
    return r;
  }

  static sync::HttpResponse status(int code) {
    sync::HttpResponse r;
    r.transport_ok = true;
    r.status = code;
    return r;
  }

  static sync::HttpResponse transportError() {
    sync::HttpResponse r;
    r.transport_ok = false;
    r.error = "connection refused";
    return r;
  }

private:
  std::mutex mutex;
  std::condition_variable released;
  bool held = false;
  std::deque<sync::HttpResponse> scripted;
  std::vector<RecordedRequest> requests;
};

// ════════════════════════════════════════════════════════════════════════════
// EVENTS
// ════════════════════════════════════════════════════════════════════════════

struct RecordedEvent {
  std::string name;
  int32_t value;
  std::string text;
  bool is_string;
};

class RecordingSink : public EventSink {
public:
  void sendEvent(const char* name, int32_t value) override {
    {
      std::lock_guard<std::mutex> lock(mutex);
      events.push_back(RecordedEvent{name, value, std::string(), false});
    }
    if (on_event) on_event(name, value);
  }

  void sendStringEvent(const char* name, const std::string& value) override {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back(RecordedEvent{name, 0, value, true});
  }

  size_t count(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    size_t n = 0;
    for (const RecordedEvent& e : events) {
      if (e.name == name) n++;
    }
    return n;
  }

  bool last(const std::string& name, RecordedEvent* out) {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto it = events.rbegin(); it != events.rend(); ++it) {
      if (it->name == name) {
        *out = *it;
        return true;
      }
    }
    return false;
  }

  int32_t lastValue(const std::string& name, int32_t fallback = -999) {
    RecordedEvent e;
    return last(name, &e) ? e.value : fallback;
  }

  std::vector<RecordedEvent> all() {
    std::lock_guard<std::mutex> lock(mutex);
    return events;
  }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex);
    events.clear();
  }

  // Runs on the emitting thread after the event is recorded
  std::function<void(const std::string&, int32_t)> on_event;

private:
  std::mutex mutex;
  std::vector<RecordedEvent> events;
};

} // namespace test
} // namespace crowdscan

#endif // CROWDSCAN_TEST_FAKES_H
