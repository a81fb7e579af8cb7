/*
 * CrowdScan - Anonymizer Tests
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <thread>

#include "crowdscan/config.h"
#include "crowdscan/privacy/anonymizer.h"
#include "crowdscan/privacy/key_material.h"
#include "crowdscan/storage/settings_store.h"

using namespace crowdscan;
using namespace crowdscan::privacy;

static std::vector<uint8_t> test_secret() {
  return std::vector<uint8_t>(SECRET_KEY_BYTES, 0x5A);
}

TEST(Anonymizer, HashIsStableWithinOneSalt) {
  Anonymizer anon(test_secret());
  anon.setSalt("fixed-salt");
  std::string a = anon.hash("AA:BB:CC:DD:EE:FF");
  std::string b = anon.hash("AA:BB:CC:DD:EE:FF");
  EXPECT_FALSE(a.empty());
  EXPECT_EQ(a, b);
  // Base64 of a 32-byte MAC
  EXPECT_EQ(44u, a.size());
}

TEST(Anonymizer, DifferentIdentifiersGiveDifferentTokens) {
  Anonymizer anon(test_secret());
  EXPECT_NE(anon.hash("11:22:33:44:55:66"), anon.hash("11:22:33:44:55:67"));
}

TEST(Anonymizer, RotationUnlinksTokens) {
  Anonymizer anon(test_secret());
  std::string before = anon.hash("AA:BB:CC:DD:EE:FF");
  std::string old_salt = anon.currentSalt();
  std::string new_salt = anon.rotateSalt();
  ASSERT_FALSE(new_salt.empty());
  EXPECT_NE(old_salt, new_salt);
  EXPECT_EQ(new_salt, anon.currentSalt());
  EXPECT_NE(before, anon.hash("AA:BB:CC:DD:EE:FF"));
}

TEST(Anonymizer, SaltIsBase64OfSixteenBytes) {
  Anonymizer anon(test_secret());
  EXPECT_EQ(24u, anon.currentSalt().size());
}

TEST(Anonymizer, SameSecretAndSaltAgreeAcrossInstances) {
  Anonymizer a(test_secret());
  Anonymizer b(test_secret());
  a.setSalt("shared");
  b.setSalt("shared");
  EXPECT_EQ(a.hash("device"), b.hash("device"));

  Anonymizer c(std::vector<uint8_t>(SECRET_KEY_BYTES, 0x01));
  c.setSalt("shared");
  EXPECT_NE(a.hash("device"), c.hash("device"));
}

TEST(Anonymizer, EmptySaltStillHashes) {
  Anonymizer anon(test_secret());
  anon.setSalt("");
  EXPECT_FALSE(anon.hash("device").empty());
}

TEST(Anonymizer, HashUnderConcurrentRotationMatchesOneSalt) {
  Anonymizer anon(test_secret());
  anon.setSalt("s1");
  const std::string t1 = anon.hash("dev");
  anon.setSalt("s2");
  const std::string t2 = anon.hash("dev");

  std::atomic<bool> done(false);
  std::thread rotator([&] {
    for (int i = 0; i < 500; i++) anon.setSalt(i % 2 ? "s1" : "s2");
    done = true;
  });
  while (!done) {
    std::string t = anon.hash("dev");
    EXPECT_TRUE(t == t1 || t == t2);
  }
  rotator.join();
}

TEST(KeyMaterial, SecretIsCreatedOnceAndReused) {
  storage::MemorySettingsStore store;
  std::vector<uint8_t> first;
  ASSERT_TRUE(load_or_create_secret(store, &first));
  EXPECT_EQ(SECRET_KEY_BYTES, first.size());
  EXPECT_TRUE(store.isKey("anon_secret"));

  std::vector<uint8_t> second;
  ASSERT_TRUE(load_or_create_secret(store, &second));
  EXPECT_EQ(first, second);
}

TEST(KeyMaterial, AllZeroSecretIsReplaced) {
  storage::MemorySettingsStore store;
  std::vector<uint8_t> zeros(SECRET_KEY_BYTES, 0);
  store.putBlob("anon_secret", zeros.data(), zeros.size());

  std::vector<uint8_t> secret;
  ASSERT_TRUE(load_or_create_secret(store, &secret));
  EXPECT_NE(zeros, secret);
}

TEST(KeyMaterial, RandomBytesFillBuffer) {
  uint8_t a[64] = {0};
  uint8_t b[64] = {0};
  ASSERT_TRUE(random_bytes(a, sizeof(a)));
  ASSERT_TRUE(random_bytes(b, sizeof(b)));
  EXPECT_NE(0, memcmp(a, b, sizeof(a)));
}
