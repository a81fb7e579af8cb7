/*
 * CrowdScan - Discovery Aggregator Tests
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include <gtest/gtest.h>

#include <memory>
#include <thread>

#include "crowdscan/scan/discovery_aggregator.h"
#include "fakes.h"

using namespace crowdscan;
using namespace crowdscan::scan;
using crowdscan::test::make_record;
using crowdscan::test::wait_until;

class TerminationRecorder : public DiscoveryTerminationListener {
public:
  void onDiscoveryTerminated(uint8_t code) override {
    last_code = code;
    calls++;
  }
  std::atomic<int> calls{0};
  std::atomic<int> last_code{0};
};

class DiscoveryAggregatorTest : public ::testing::Test {
protected:
  DiscoveryAggregatorTest() : dispatcher(&sink) {
    config.debounce_ms = 20;
    config.initial_scan_period_ms = 60'000;
    config.batch_switch_gap_ms = 5;
    config.init_retry_delay_ms = 5;
    config.init_retries = 3;
    config.ble_restart_delay_ms = 10;
    config.classic_restart_delay_ms = 10;
    config.classic_cancel_gap_ms = 5;
  }

  void build() {
    aggregator = std::make_unique<DiscoveryAggregator>(ble, classic, dispatcher, nullptr, config);
    aggregator->setTerminationListener(&termination);
  }

  Observation find(const std::vector<Observation>& list, const std::string& id) {
    for (const Observation& o : list) {
      if (o.identifier == id) return o;
    }
    Observation none;
    none.count = 0;
    return none;
  }

  test::RecordingSink sink;
  EventDispatcher dispatcher;
  test::FakeBleSource ble;
  test::FakeClassicSource classic;
  TerminationRecorder termination;
  AggregatorConfig config;
  std::unique_ptr<DiscoveryAggregator> aggregator;
};

TEST_F(DiscoveryAggregatorTest, StartAnnouncesAndResetsCount) {
  build();
  ASSERT_TRUE(aggregator->start());
  EXPECT_TRUE(aggregator->isScanning());
  EXPECT_EQ(1u, sink.count(events::BLE_SCAN_STARTED));
  EXPECT_EQ(0, sink.lastValue(events::OBSERVED_DEVICE_COUNT_CHANGED));
  EXPECT_EQ(1, ble.start_calls.load());
  EXPECT_EQ(BLE_SCAN_LOW_LATENCY, ble.modesSeen().front());
  ASSERT_TRUE(wait_until([&] { return classic.start_calls.load() == 1; }));

  // Already running
  EXPECT_TRUE(aggregator->start());
  EXPECT_EQ(1, ble.start_calls.load());
}

TEST_F(DiscoveryAggregatorTest, CountsEveryReceipt) {
  build();
  ASSERT_TRUE(aggregator->start());

  ble.deliver(make_record("AA", "first"));
  ble.deliver(make_record("AA", "second"));
  ble.deliverBatch({ make_record("AA"), make_record("BB") });
  classic.deliver(make_record("CC"));

  ASSERT_TRUE(wait_until([&] {
    DiscoverySnapshot s = aggregator->snapshot();
    return s.ble.size() == 2 && s.classic.size() == 1 && find(s.ble, "AA").count == 3;
  }));
  DiscoverySnapshot snap = aggregator->snapshot();
  Observation aa = find(snap.ble, "AA");
  EXPECT_EQ(3u, aa.count);
  EXPECT_EQ(DISCOVERY_BLE, aa.kind);
  EXPECT_LE(aa.first_seen_ms, aa.last_seen_ms);
  EXPECT_EQ(1u, find(snap.ble, "BB").count);
  EXPECT_EQ(1u, find(snap.classic, "CC").count);
  EXPECT_EQ(3u, aggregator->deviceCount());
}

TEST_F(DiscoveryAggregatorTest, LatestRecordWinsPerDevice) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.deliver(make_record("AA", "old"));
  ASSERT_TRUE(wait_until([&] { return aggregator->deviceCount() == 1; }));
  ble.deliver(make_record("AA", "new"));
  ASSERT_TRUE(wait_until([&] { return find(aggregator->snapshot().ble, "AA").count == 2; }));
  EXPECT_EQ("new", find(aggregator->snapshot().ble, "AA").latest.name);
}

TEST_F(DiscoveryAggregatorTest, EmptyAddressIsIgnored) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.deliver(make_record(""));
  ble.deliver(make_record("AA"));
  ASSERT_TRUE(wait_until([&] { return aggregator->deviceCount() == 1; }));
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(1u, aggregator->deviceCount());
}

TEST_F(DiscoveryAggregatorTest, ConcurrentProducersLoseNothing) {
  build();
  ASSERT_TRUE(aggregator->start());

  const int per_thread = 250;
  std::thread t1([&] { for (int i = 0; i < per_thread; i++) ble.deliver(make_record("AA")); });
  std::thread t2([&] { for (int i = 0; i < per_thread; i++) ble.deliver(make_record("AA")); });
  std::thread t3([&] { for (int i = 0; i < per_thread; i++) classic.deliver(make_record("CC")); });
  t1.join();
  t2.join();
  t3.join();

  ASSERT_TRUE(wait_until([&] {
    DiscoverySnapshot s = aggregator->snapshot();
    return find(s.ble, "AA").count == 2u * per_thread && find(s.classic, "CC").count == (uint32_t)per_thread;
  }, 5000));
}

TEST_F(DiscoveryAggregatorTest, SnapshotCountsNeverDecreaseWithinEpoch) {
  build();
  ASSERT_TRUE(aggregator->start());
  std::atomic<bool> done(false);
  std::thread producer([&] {
    for (int i = 0; i < 300; i++) ble.deliver(make_record("AA"));
    done = true;
  });
  uint32_t previous = 0;
  while (!done) {
    uint32_t now = find(aggregator->snapshot().ble, "AA").count;
    EXPECT_GE(now, previous);
    previous = now;
  }
  producer.join();
}

TEST_F(DiscoveryAggregatorTest, ClearStartsNewEpoch) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.deliver(make_record("AA"));
  ble.deliver(make_record("AA"));
  ASSERT_TRUE(wait_until([&] { return find(aggregator->snapshot().ble, "AA").count == 2; }));

  aggregator->clear();
  EXPECT_TRUE(aggregator->snapshot().empty());
  EXPECT_EQ(0, sink.lastValue(events::OBSERVED_DEVICE_COUNT_CHANGED));

  ble.deliver(make_record("AA"));
  ASSERT_TRUE(wait_until([&] { return aggregator->deviceCount() == 1; }));
  EXPECT_EQ(1u, find(aggregator->snapshot().ble, "AA").count);
}

TEST_F(DiscoveryAggregatorTest, DebouncedCountEvent) {
  build();
  ASSERT_TRUE(aggregator->start());
  sink.reset();
  ble.deliver(make_record("AA"));
  ble.deliver(make_record("BB"));
  classic.deliver(make_record("CC"));
  ASSERT_TRUE(wait_until([&] { return sink.lastValue(events::OBSERVED_DEVICE_COUNT_CHANGED) == 3; }));

  // Quiet period emits nothing further
  size_t emitted = sink.count(events::OBSERVED_DEVICE_COUNT_CHANGED);
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  EXPECT_EQ(emitted, sink.count(events::OBSERVED_DEVICE_COUNT_CHANGED));
}

TEST_F(DiscoveryAggregatorTest, StopIsIdempotentAndDropsLateResults) {
  build();
  ASSERT_TRUE(aggregator->start());
  aggregator->stop();
  aggregator->stop();
  EXPECT_FALSE(aggregator->isScanning());
  EXPECT_EQ(1u, sink.count(events::BLE_SCAN_STOPPED));
  EXPECT_FALSE(ble.scanning.load());

  ble.deliver(make_record("LATE"));
  classic.deliver(make_record("LATE2"));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(0u, aggregator->deviceCount());
}

TEST_F(DiscoveryAggregatorTest, RetriesRadioInit) {
  ble.prepare_failures = 2;
  build();
  ASSERT_TRUE(aggregator->start());
  EXPECT_EQ(3, ble.prepare_calls.load());
}

TEST_F(DiscoveryAggregatorTest, GivesUpAfterBoundedRetries) {
  ble.prepare_failures = 100;
  build();
  EXPECT_FALSE(aggregator->start());
  EXPECT_EQ(3, ble.prepare_calls.load());
  EXPECT_FALSE(aggregator->isScanning());
  EXPECT_EQ(0u, sink.count(events::BLE_SCAN_STARTED));
  EXPECT_EQ(0, ble.start_calls.load());
}

TEST_F(DiscoveryAggregatorTest, RunsWithoutClassicSource) {
  classic.available = false;
  build();
  ASSERT_TRUE(aggregator->start());
  EXPECT_EQ(0, classic.start_calls.load());
  ble.deliver(make_record("AA"));
  ASSERT_TRUE(wait_until([&] { return aggregator->deviceCount() == 1; }));
}

TEST_F(DiscoveryAggregatorTest, RejectedScanStartRollsBack) {
  ble.reject_starts_after = 0;
  build();
  EXPECT_FALSE(aggregator->start());
  EXPECT_FALSE(aggregator->isScanning());
  EXPECT_EQ(0u, sink.count(events::BLE_SCAN_STARTED));
  EXPECT_EQ(0u, sink.count(events::BLE_SCAN_STOPPED));
  EXPECT_EQ(0u, sink.count(events::OBSERVED_DEVICE_COUNT_CHANGED));
}

TEST_F(DiscoveryAggregatorTest, RejectedRestartKeepsPreviousTable) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.deliver(make_record("AA"));
  ASSERT_TRUE(wait_until([&] { return aggregator->deviceCount() == 1; }));
  aggregator->stop();

  ble.reject_starts_after = ble.start_calls.load();
  sink.reset();
  EXPECT_FALSE(aggregator->start());
  EXPECT_FALSE(aggregator->isScanning());
  EXPECT_EQ(1u, aggregator->deviceCount());
  EXPECT_TRUE(sink.all().empty());
}

TEST_F(DiscoveryAggregatorTest, SinkMayStopFromStartedEvent) {
  build();
  sink.on_event = [this](const std::string& name, int32_t) {
    if (name == events::BLE_SCAN_STARTED) aggregator->stop();
  };
  ASSERT_TRUE(aggregator->start());
  EXPECT_FALSE(aggregator->isScanning());
  EXPECT_EQ(1u, sink.count(events::BLE_SCAN_STOPPED));
}

TEST_F(DiscoveryAggregatorTest, SwitchesToBatchedAfterInitialPeriod) {
  config.initial_scan_period_ms = 20;
  build();
  ASSERT_TRUE(aggregator->start());
  ASSERT_TRUE(wait_until([&] { return ble.start_calls.load() == 2; }));
  std::vector<BleScanMode> modes = ble.modesSeen();
  EXPECT_EQ(BLE_SCAN_LOW_LATENCY, modes[0]);
  EXPECT_EQ(BLE_SCAN_BATCHED, modes[1]);
  EXPECT_GE(ble.stop_calls.load(), 1);
}

TEST_F(DiscoveryAggregatorTest, AlreadyStartedFailureIsIgnored) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.fail(SCAN_FAILED_ALREADY_STARTED);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(1, ble.start_calls.load());
  EXPECT_EQ(0, ble.stop_calls.load());
  EXPECT_TRUE(aggregator->isScanning());
}

TEST_F(DiscoveryAggregatorTest, RecoverableFailureRestartsScanner) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.fail(SCAN_FAILED_SCANNING_TOO_FREQUENTLY);
  ASSERT_TRUE(wait_until([&] { return ble.start_calls.load() == 2; }));
  EXPECT_GE(ble.stop_calls.load(), 1);
  EXPECT_TRUE(aggregator->isScanning());
  EXPECT_EQ(0u, sink.count(events::BLE_SCAN_FATAL_ERROR));
}

TEST_F(DiscoveryAggregatorTest, FailedRecoveryTerminates) {
  ble.reject_starts_after = 1;
  build();
  ASSERT_TRUE(aggregator->start());
  ble.fail(SCAN_FAILED_INTERNAL_ERROR);
  ASSERT_TRUE(wait_until([&] { return termination.calls.load() == 1; }));
  EXPECT_FALSE(aggregator->isScanning());
  EXPECT_EQ(1u, sink.count(events::BLE_SCAN_FATAL_ERROR));
}

TEST_F(DiscoveryAggregatorTest, FatalFailureStopsAndNotifies) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.fail(SCAN_FAILED_FEATURE_UNSUPPORTED);
  ASSERT_TRUE(wait_until([&] { return termination.calls.load() == 1; }));
  EXPECT_EQ(SCAN_FAILED_FEATURE_UNSUPPORTED, termination.last_code.load());
  EXPECT_FALSE(aggregator->isScanning());
  EXPECT_EQ(SCAN_FAILED_FEATURE_UNSUPPORTED, sink.lastValue(events::BLE_SCAN_FATAL_ERROR));
  EXPECT_EQ(1u, sink.count(events::BLE_SCAN_STOPPED));
}

TEST_F(DiscoveryAggregatorTest, ClassicPassIsRestarted) {
  build();
  ASSERT_TRUE(aggregator->start());
  ASSERT_TRUE(wait_until([&] { return classic.start_calls.load() == 1; }));
  classic.finishPass();
  ASSERT_TRUE(wait_until([&] { return classic.start_calls.load() == 2; }));
}

TEST_F(DiscoveryAggregatorTest, RestartAfterStopBeginsFreshTable) {
  build();
  ASSERT_TRUE(aggregator->start());
  ble.deliver(make_record("AA"));
  ASSERT_TRUE(wait_until([&] { return aggregator->deviceCount() == 1; }));
  aggregator->stop();
  ASSERT_TRUE(aggregator->start());
  EXPECT_EQ(0u, aggregator->deviceCount());
  ble.deliver(make_record("BB"));
  ASSERT_TRUE(wait_until([&] { return aggregator->deviceCount() == 1; }));
}

TEST(ScanFailure, Classification) {
  EXPECT_EQ(FAILURE_IGNORED, classify_scan_failure(1));
  EXPECT_EQ(FAILURE_FATAL, classify_scan_failure(2));
  EXPECT_EQ(FAILURE_RECOVERABLE, classify_scan_failure(3));
  EXPECT_EQ(FAILURE_FATAL, classify_scan_failure(4));
  EXPECT_EQ(FAILURE_FATAL, classify_scan_failure(5));
  EXPECT_EQ(FAILURE_RECOVERABLE, classify_scan_failure(6));
  EXPECT_EQ(FAILURE_UNKNOWN, classify_scan_failure(42));
  EXPECT_STREQ("INTERNAL_ERROR", scan_failure_name(3));
}
