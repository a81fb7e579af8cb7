/*
 * CrowdScan - Sync Pipeline Tests
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include <gtest/gtest.h>

#include <ArduinoJson.h>
#include <algorithm>
#include <fstream>
#include <sstream>

#include "crowdscan/storage/file_io.h"
#include "crowdscan/sync/sync_pipeline.h"
#include "fakes.h"

using namespace crowdscan;
using namespace crowdscan::sync;

static SyncBatch make_batch(const std::string& period, size_t devices, const std::string& uuid = "u1") {
  std::string json = "{\"uuid\":\"" + uuid + "\",\"periods\":{\"" + period + "\":{\"context\":{},\"devices\":[";
  for (size_t i = 0; i < devices; i++) {
    if (i) json += ",";
    json += "{\"device_id\":\"d" + std::to_string(i) + "\"}";
  }
  json += "],\"classic_devices\":[]}},\"appVersionName\":\"1\"}";
  return SyncBatch(period, json, devices, 0);
}

class SyncPipelineTest : public ::testing::Test {
protected:
  SyncPipelineTest()
    : dispatcher(&sink), settings(store),
      cache(storage::join_path(test::make_temp_dir(), CACHE_FILE_NAME)),
      pipeline(cache, sender, settings, dispatcher) {}

  std::vector<std::string> sentPeriods(size_t request) {
    std::vector<std::string> keys;
    DynamicJsonDocument doc(16384);
    if (deserializeJson(doc, sender.request(request).body)) return keys;
    for (JsonPair p : doc["periods"].as<JsonObject>()) keys.push_back(p.key().c_str());
    return keys;
  }

  test::RecordingSink sink;
  EventDispatcher dispatcher;
  storage::MemorySettingsStore store;
  storage::Settings settings;
  storage::PayloadCache cache;
  test::FakeSender sender;
  SyncPipeline pipeline;
};

TEST_F(SyncPipelineTest, SuccessWithoutCache) {
  SyncResult r = pipeline.submit(make_batch("100", 2), 1.0, 2.0);
  EXPECT_EQ(SYNC_SUCCESS, r.outcome);
  EXPECT_EQ(0u, r.merged_entries);
  EXPECT_FALSE(r.location_restart_requested);
  ASSERT_EQ(1u, sender.requestCount());
  EXPECT_FALSE(cache.hasData());
  EXPECT_EQ(0u, sink.count(events::SYNC_RETRY_SUCCEEDED));
}

TEST_F(SyncPipelineTest, UrlAndHeaders) {
  settings.setServer("http://collector.local:8080");
  pipeline.submit(make_batch("1", 1), 1.0, 1.0);
  test::RecordedRequest req = sender.request(0);
  EXPECT_EQ("http://collector.local:8080/api/prototype/save_discoveries", req.url);
  bool accept = false, content = false;
  for (const auto& h : req.headers) {
    if (h.first == "Accept" && h.second == "application/json") accept = true;
    if (h.first == "Content-Type" && h.second == "application/json") content = true;
  }
  EXPECT_TRUE(accept);
  EXPECT_TRUE(content);
}

TEST_F(SyncPipelineTest, FailureCachesThenRetryDeliversUnion) {
  sender.push(test::FakeSender::transportError());
  SyncResult first = pipeline.submit(make_batch("100", 2), 1.0, 1.0);
  EXPECT_EQ(SYNC_FAILED_CACHED, first.outcome);
  EXPECT_EQ(1u, cache.size());
  EXPECT_EQ(1u, sink.count(events::SYNC_FAILED_AND_CACHED));

  SyncResult second = pipeline.submit(make_batch("200", 1), 1.0, 1.0);
  EXPECT_EQ(SYNC_SUCCESS, second.outcome);
  EXPECT_EQ(1u, second.merged_entries);
  EXPECT_FALSE(cache.hasData());
  EXPECT_EQ(1u, sink.count(events::SYNC_RETRY_SUCCEEDED));

  std::vector<std::string> keys = sentPeriods(1);
  ASSERT_EQ(2u, keys.size());
  EXPECT_NE(keys.end(), std::find(keys.begin(), keys.end(), "100"));
  EXPECT_NE(keys.end(), std::find(keys.begin(), keys.end(), "200"));
}

TEST_F(SyncPipelineTest, TwoFailuresThenSuccessSendsAllPeriods) {
  sender.push(test::FakeSender::status(500));
  sender.push(test::FakeSender::transportError());
  EXPECT_EQ(SYNC_FAILED_CACHED, pipeline.submit(make_batch("1", 1), 1.0, 1.0).outcome);
  EXPECT_EQ(SYNC_FAILED_CACHED, pipeline.submit(make_batch("2", 1), 1.0, 1.0).outcome);
  EXPECT_EQ(2u, cache.size());

  SyncResult r = pipeline.submit(make_batch("3", 1), 1.0, 1.0);
  EXPECT_EQ(SYNC_SUCCESS, r.outcome);
  EXPECT_EQ(2u, r.merged_entries);
  EXPECT_EQ(3u, sentPeriods(2).size());
  EXPECT_FALSE(cache.hasData());
}

TEST_F(SyncPipelineTest, NonSuccessStatusIsCached) {
  sender.push(test::FakeSender::status(404));
  EXPECT_EQ(SYNC_FAILED_CACHED, pipeline.submit(make_batch("7", 1), 1.0, 1.0).outcome);
  EXPECT_TRUE(cache.hasData());
}

TEST_F(SyncPipelineTest, EmptyBatchWithoutCacheSkipsRequest) {
  SyncResult r = pipeline.submit(make_batch("5", 0), 1.0, 1.0);
  EXPECT_EQ(SYNC_SKIPPED_EMPTY, r.outcome);
  EXPECT_EQ(0u, sender.requestCount());
}

TEST_F(SyncPipelineTest, InvalidBatchStillFlushesCache) {
  sender.push(test::FakeSender::transportError());
  pipeline.submit(make_batch("1", 3), 1.0, 1.0);
  SyncResult r = pipeline.submit(SyncBatch(), 1.0, 1.0);
  EXPECT_EQ(SYNC_SUCCESS, r.outcome);
  EXPECT_EQ(2u, sender.requestCount());
  EXPECT_FALSE(cache.hasData());
}

TEST_F(SyncPipelineTest, ResponseFieldsAreRelayedLeniently) {
  sender.push(test::FakeSender::ok(
      "{\"status\":\"ok\",\"estimatedCrowd\":\"12.7\",\"recentlySeen\":4.9,\"recentlySeenWindowMs\":\"abc\"}"));
  SyncResult r = pipeline.submit(make_batch("1", 1), 1.0, 1.0);
  EXPECT_EQ(SYNC_SUCCESS, r.outcome);
  EXPECT_EQ("ok", r.response.status);
  EXPECT_EQ(12, sink.lastValue(events::PAX_ESTIMATED_CHANGED));
  EXPECT_EQ(4, sink.lastValue(events::RECENTLY_SEEN_COUNT_CHANGED));
  EXPECT_EQ(0, sink.lastValue(events::RECENTLY_SEEN_WINDOW_CHANGED));
  test::RecordedEvent status;
  ASSERT_TRUE(sink.last(events::SERVER_STATUS_CHANGED, &status));
  EXPECT_EQ("ok", status.text);
}

TEST_F(SyncPipelineTest, EmptyBodyEmitsNothing) {
  pipeline.submit(make_batch("1", 1), 1.0, 1.0);
  EXPECT_EQ(0u, sink.count(events::PAX_ESTIMATED_CHANGED));
  EXPECT_EQ(0u, sink.count(events::SERVER_STATUS_CHANGED));
}

TEST_F(SyncPipelineTest, ZeroLocationRequestsRestart) {
  SyncResult r = pipeline.submit(make_batch("1", 1), 0.0, 0.0);
  EXPECT_EQ(SYNC_SUCCESS, r.outcome);
  EXPECT_TRUE(r.location_restart_requested);
}

static std::string read_all(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class SyncPipelineLargeCacheTest : public SyncPipelineTest {
protected:
  void SetUp() override {
    for (int i = 0; i < 3; i++) {
      sender.push(test::FakeSender::status(500));
      ASSERT_EQ(SYNC_FAILED_CACHED, pipeline.submit(make_batch(std::to_string(i), 20), 1.0, 1.0).outcome);
    }
    on_disk = read_all(cache.path());
  }

  std::string on_disk;
};

TEST_F(SyncPipelineLargeCacheTest, UnloadableCacheIsLeftAndNewBatchSent) {
  storage::PayloadCache tight(cache.path(), CACHE_MAX_ENTRIES, 1024);
  SyncPipeline tight_pipeline(tight, sender, settings, dispatcher);

  SyncResult r = tight_pipeline.submit(make_batch("9", 1), 1.0, 1.0);
  EXPECT_EQ(SYNC_SUCCESS, r.outcome);
  EXPECT_TRUE(r.cache_deferred);
  EXPECT_EQ(0u, r.merged_entries);
  std::vector<std::string> keys = sentPeriods(3);
  ASSERT_EQ(1u, keys.size());
  EXPECT_EQ("9", keys[0]);

  EXPECT_EQ(on_disk, read_all(cache.path()));
  EXPECT_EQ(0u, sink.count(events::SYNC_RETRY_SUCCEEDED));
}

TEST_F(SyncPipelineLargeCacheTest, FailureWithUnloadableCacheIsReportedNotWritten) {
  storage::PayloadCache tight(cache.path(), CACHE_MAX_ENTRIES, 1024);
  SyncPipeline tight_pipeline(tight, sender, settings, dispatcher);

  sender.push(test::FakeSender::transportError());
  SyncResult r = tight_pipeline.submit(make_batch("9", 1), 1.0, 1.0);
  EXPECT_EQ(SYNC_FAILED, r.outcome);
  EXPECT_EQ(on_disk, read_all(cache.path()));
  EXPECT_EQ(3u, sink.count(events::SYNC_FAILED_AND_CACHED));
}

TEST_F(SyncPipelineLargeCacheTest, MergeBeyondBudgetKeepsCache) {
  SyncPipeline narrow(cache, sender, settings, dispatcher, 1024);

  SyncResult r = narrow.submit(make_batch("9", 1), 1.0, 1.0);
  EXPECT_EQ(SYNC_SUCCESS, r.outcome);
  EXPECT_TRUE(r.cache_deferred);
  EXPECT_EQ(1u, sentPeriods(3).size());
  EXPECT_EQ(3u, cache.size());
}

TEST(SyncPipelineParse, MalformedBodyYieldsDefaults) {
  ServerResponse r = SyncPipeline::parseResponse("not json");
  EXPECT_EQ("", r.status);
  EXPECT_EQ(0, r.estimated_crowd);
  ServerResponse n = SyncPipeline::parseResponse("{\"status\":3,\"estimatedCrowd\":-2}");
  EXPECT_EQ("3", n.status);
  EXPECT_EQ(-2, n.estimated_crowd);
}

TEST(SyncPipelineMerge, SamePeriodConcatenatesDevices) {
  std::vector<std::string> entries = {
    "{\"uuid\":\"a\",\"appVersionName\":\"1\",\"periods\":{\"9\":{\"devices\":[{\"device_id\":\"x\"}],\"classic_devices\":[]}}}",
    "{\"uuid\":\"\",\"appVersionName\":\"2\",\"periods\":{\"9\":{\"devices\":[{\"device_id\":\"y\"}],\"classic_devices\":[{\"device_id\":\"z\"}]}}}"
  };
  size_t count = 0;
  std::string merged;
  ASSERT_TRUE(SyncPipeline::mergeEntries(entries, &merged, &count));
  ASSERT_FALSE(merged.empty());
  EXPECT_EQ(3u, count);

  DynamicJsonDocument doc(8192);
  ASSERT_FALSE(deserializeJson(doc, merged));
  EXPECT_STREQ("a", doc["uuid"].as<const char*>());
  EXPECT_STREQ("2", doc["appVersionName"].as<const char*>());
  EXPECT_EQ(2u, doc["periods"]["9"]["devices"].as<JsonArray>().size());
  EXPECT_EQ(1u, doc["periods"]["9"]["classic_devices"].as<JsonArray>().size());
}

TEST(SyncPipelineMerge, UnreadableEntriesAreSkipped) {
  size_t count = 0;
  std::string merged;
  EXPECT_TRUE(SyncPipeline::mergeEntries({ "garbage" }, &merged, &count));
  EXPECT_EQ("", merged);
  EXPECT_TRUE(SyncPipeline::mergeEntries(
      { "garbage", "{\"periods\":{\"1\":{\"devices\":[{}]}}}" }, &merged, &count));
  EXPECT_FALSE(merged.empty());
  EXPECT_EQ(1u, count);
}

TEST(SyncPipelineMerge, ReportsRunningOutOfMemory) {
  size_t count = 0;
  std::string merged;
  EXPECT_FALSE(SyncPipeline::mergeEntries({ make_batch("1", 20).json() }, &merged, &count, 256));
  EXPECT_EQ("", merged);
}
