/*
 * CrowdScan - Event Dispatcher Tests
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "crowdscan/core/event_sink.h"
#include "fakes.h"

using namespace crowdscan;

namespace {

class ThrowingSink : public EventSink {
public:
  void sendEvent(const char*, int32_t) override {
    calls++;
    throw 42;
  }
  void sendStringEvent(const char*, const std::string&) override {
    calls++;
    throw std::runtime_error("ui gone");
  }
  int calls = 0;
};

} // namespace

TEST(EventDispatcher, MissingSinkIsSkipped) {
  EventDispatcher dispatcher;
  EXPECT_NO_THROW(dispatcher.emit(events::SERVICE_STARTED, 1));
  EXPECT_NO_THROW(dispatcher.emitString(events::SERVER_STATUS_CHANGED, "ok"));
}

TEST(EventDispatcher, ThrowingSinkNeverReachesCaller) {
  ThrowingSink sink;
  EventDispatcher dispatcher(&sink);
  EXPECT_NO_THROW(dispatcher.emit(events::BLE_SCAN_STARTED, 1));
  EXPECT_NO_THROW(dispatcher.emitString(events::SERVER_STATUS_CHANGED, "ok"));
  EXPECT_EQ(2, sink.calls);
}

TEST(EventDeferral, HoldsEventsUntilOutermostScopeEnds) {
  test::RecordingSink sink;
  EventDispatcher dispatcher(&sink);
  {
    EventDeferral outer;
    dispatcher.emit(events::BLE_SCAN_STARTED, 1);
    {
      EventDeferral inner;
      dispatcher.emitString(events::SERVER_STATUS_CHANGED, "ok");
    }
    EXPECT_TRUE(sink.all().empty());
    dispatcher.emit(events::BLE_SCAN_STOPPED, 1);
  }
  std::vector<test::RecordedEvent> seen = sink.all();
  ASSERT_EQ(3u, seen.size());
  EXPECT_EQ(events::BLE_SCAN_STARTED, seen[0].name);
  EXPECT_EQ(events::SERVER_STATUS_CHANGED, seen[1].name);
  EXPECT_EQ("ok", seen[1].text);
  EXPECT_EQ(events::BLE_SCAN_STOPPED, seen[2].name);
}

TEST(EventDeferral, SinkMayEmitWhileHeldEventsAreDelivered) {
  test::RecordingSink sink;
  EventDispatcher dispatcher(&sink);
  sink.on_event = [&dispatcher](const std::string& name, int32_t) {
    if (name == events::BLE_SCAN_STARTED) dispatcher.emit(events::OBSERVED_DEVICE_COUNT_CHANGED, 0);
  };
  {
    EventDeferral defer;
    dispatcher.emit(events::BLE_SCAN_STARTED, 1);
  }
  EXPECT_EQ(1u, sink.count(events::OBSERVED_DEVICE_COUNT_CHANGED));
}

TEST(EventDeferral, OtherThreadsAreNotHeld) {
  test::RecordingSink sink;
  EventDispatcher dispatcher(&sink);
  EventDeferral defer;
  std::thread other([&dispatcher] { dispatcher.emit(events::SERVICE_STARTED, 1); });
  other.join();
  EXPECT_EQ(1u, sink.count(events::SERVICE_STARTED));
}
