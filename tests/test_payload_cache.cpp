/*
 * CrowdScan - Payload Cache Tests
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "crowdscan/storage/file_io.h"
#include "crowdscan/storage/payload_cache.h"
#include "fakes.h"

using namespace crowdscan;
using namespace crowdscan::storage;

class PayloadCacheTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = test::make_temp_dir();
    path = join_path(dir, CACHE_FILE_NAME);
  }

  std::string dir;
  std::string path;
};

TEST_F(PayloadCacheTest, MissingFileIsEmpty) {
  PayloadCache cache(path);
  EXPECT_FALSE(cache.hasData());
  std::vector<std::string> entries;
  EXPECT_TRUE(cache.load(&entries));
  EXPECT_TRUE(entries.empty());
}

TEST_F(PayloadCacheTest, AppendKeepsOrderAndCompacts) {
  PayloadCache cache(path);
  ASSERT_TRUE(cache.append("{ \"uuid\": \"a\", \"n\": 1 }"));
  ASSERT_TRUE(cache.append("{\"uuid\":\"b\",\"n\":2}"));

  std::vector<std::string> entries;
  ASSERT_TRUE(cache.load(&entries));
  ASSERT_EQ(2u, entries.size());
  EXPECT_EQ("{\"uuid\":\"a\",\"n\":1}", entries[0]);
  EXPECT_EQ("{\"uuid\":\"b\",\"n\":2}", entries[1]);
  EXPECT_EQ(2u, cache.size());
}

TEST_F(PayloadCacheTest, SurvivesReopen) {
  {
    PayloadCache cache(path);
    ASSERT_TRUE(cache.append("{\"k\":1}"));
  }
  PayloadCache reopened(path);
  EXPECT_EQ(1u, reopened.size());
}

TEST_F(PayloadCacheTest, RejectsNonObjects) {
  PayloadCache cache(path);
  EXPECT_FALSE(cache.append("[1,2]"));
  EXPECT_FALSE(cache.append("not json"));
  EXPECT_FALSE(cache.hasData());
}

TEST_F(PayloadCacheTest, EvictsOldestBeyondBound) {
  PayloadCache cache(path, 3);
  for (int i = 0; i < 5; i++) {
    ASSERT_TRUE(cache.append("{\"i\":" + std::to_string(i) + "}"));
  }
  std::vector<std::string> entries;
  ASSERT_TRUE(cache.load(&entries));
  ASSERT_EQ(3u, entries.size());
  EXPECT_EQ("{\"i\":2}", entries[0]);
  EXPECT_EQ("{\"i\":4}", entries[2]);
}

TEST_F(PayloadCacheTest, MalformedFileReadsAsEmptyAndIsReplacedOnAppend) {
  {
    std::ofstream out(path);
    out << "[{\"broken\":";
  }
  PayloadCache cache(path);
  std::vector<std::string> entries;
  EXPECT_TRUE(cache.load(&entries));
  EXPECT_TRUE(entries.empty());

  ASSERT_TRUE(cache.append("{\"fresh\":true}"));
  ASSERT_TRUE(cache.load(&entries));
  ASSERT_EQ(1u, entries.size());
  EXPECT_EQ("{\"fresh\":true}", entries[0]);
}

TEST_F(PayloadCacheTest, NonArrayDocumentReadsAsEmpty) {
  {
    std::ofstream out(path);
    out << "{\"uuid\":\"x\"}";
  }
  PayloadCache cache(path);
  EXPECT_FALSE(cache.hasData());
}

TEST_F(PayloadCacheTest, NonObjectElementsAreSkipped) {
  {
    std::ofstream out(path);
    out << "[1,{\"ok\":1},\"s\"]";
  }
  PayloadCache cache(path);
  EXPECT_EQ(1u, cache.size());
}

TEST_F(PayloadCacheTest, ClearEmptiesTheCache) {
  PayloadCache cache(path);
  ASSERT_TRUE(cache.append("{\"k\":1}"));
  ASSERT_TRUE(cache.clear());
  EXPECT_FALSE(cache.hasData());
  EXPECT_TRUE(cache.clear());
}

static std::string read_all(const std::string& path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST_F(PayloadCacheTest, FileBeyondMemoryIsNeverRewritten) {
  const std::string filler(300, 'x');
  PayloadCache roomy(path);
  for (int i = 0; i < 3; i++) {
    ASSERT_TRUE(roomy.append("{\"i\":" + std::to_string(i) + ",\"pad\":\"" + filler + "\"}"));
  }
  const std::string before = read_all(path);

  PayloadCache tight(path, CACHE_MAX_ENTRIES, 512);
  std::vector<std::string> entries;
  EXPECT_FALSE(tight.load(&entries));
  EXPECT_TRUE(entries.empty());
  EXPECT_TRUE(tight.hasData());
  EXPECT_EQ(0u, tight.size());

  EXPECT_FALSE(tight.append("{\"k\":1}"));
  EXPECT_EQ(before, read_all(path));
  EXPECT_EQ(3u, roomy.size());
}
