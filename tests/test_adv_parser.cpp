/*
 * CrowdScan - Advertisement Parser Tests
 *
 * Copyright (c) 2026 ERRERlabs / Karl May
 * License: Apache-2.0
 */

#include <gtest/gtest.h>

#include "crowdscan/config.h"
#include "crowdscan/core/encoding.h"
#include "crowdscan/scan/adv_parser.h"

using namespace crowdscan;
using namespace crowdscan::scan;

static const char* METADATA_JSON =
  "{\"company_identifiers\":["
  "{\"value\":76,\"name\":\"Apple, Inc.\"},"
  "{\"value\":\"0x0075\",\"name\":\"Samsung Electronics Co. Ltd.\"},"
  "{\"value\":\"1234\",\"name\":\"Rare Corp\"}],"
  "\"ad_types\":["
  "{\"value\":1,\"name\":\"Flags\"},"
  "{\"value\":\"0x09\",\"name\":\"Complete Local Name\"},"
  "{\"value\":8,\"name\":\"Shortened Local Name\"},"
  "{\"value\":22,\"name\":\"Service Data - 16-bit UUID\"},"
  "{\"value\":255,\"name\":\"Manufacturer Specific Data\"}]}";

class AdvParserTest : public ::testing::Test {
protected:
  void SetUp() override { ASSERT_TRUE(metadata.loadFromJson(METADATA_JSON)); }

  BtMetadata metadata;
};

TEST_F(AdvParserTest, MetadataAcceptsNumbersAndStrings) {
  EXPECT_EQ(3u, metadata.companyCount());
  EXPECT_EQ(5u, metadata.adTypeCount());
  EXPECT_EQ("Samsung Electronics Co. Ltd.", metadata.companyName(117));
  EXPECT_EQ("Rare Corp", metadata.companyName(1234));
  EXPECT_EQ("complete_local_name", metadata.adTypeName(9));
  EXPECT_EQ("service_data__16bit_uuid", metadata.adTypeName(22));
  EXPECT_EQ("", metadata.adTypeName(0x30));
}

TEST_F(AdvParserTest, ParsesStructuresAndDerivesTags) {
  AdvParser parser(metadata);
  // Flags, Complete Local Name "Test", Apple manufacturer data (type 0x12)
  AdvFields f = parser.parse("020106" "050954657374" "07ff4c00121900ab");

  EXPECT_EQ("06", f["ble_flags"]);
  EXPECT_EQ("Test", f["ble_complete_local_name"]);
  EXPECT_EQ("4c00121900ab", f["ble_manufacturer_specific_data"]);
  EXPECT_EQ("Apple, Inc.", f["ble_company"]);
  EXPECT_EQ("apple_findmy", f["ble_device_type"]);
}

TEST_F(AdvParserTest, Base64InputIsDecoded) {
  AdvParser parser(metadata);
  std::vector<uint8_t> raw;
  ASSERT_TRUE(from_hex("02010600", &raw));
  std::string b64 = base64_encode(raw.data(), raw.size());
  ASSERT_NE(std::string::npos, b64.find('='));
  EXPECT_EQ("06", parser.parse(b64)["ble_flags"]);
}

TEST_F(AdvParserTest, UnknownTypesAndCompanies) {
  AdvParser parser(metadata);
  // Unknown AD type 0x30, manufacturer 1234 (known name, not a common id)
  AdvFields f = parser.parse("03300102" "05ffd2040700");
  EXPECT_EQ("0102", f["ble_unknown"]);
  EXPECT_EQ("other", f["ble_company"]);
  EXPECT_EQ("1234_7", f["ble_device_type"]);
}

TEST_F(AdvParserTest, ShortManufacturerDataIsDropped) {
  AdvParser parser(metadata);
  AdvFields f = parser.parse("02ff4c");
  EXPECT_EQ(0u, f.count("ble_manufacturer_specific_data"));
  EXPECT_EQ("", f["ble_company"]);
  EXPECT_EQ("", f["ble_device_type"]);
}

TEST_F(AdvParserTest, TruncatedStructureStopsParsing) {
  AdvParser parser(metadata);
  AdvFields f = parser.parse("020106" "0a0954");
  EXPECT_EQ("06", f["ble_flags"]);
  EXPECT_EQ(0u, f.count("ble_complete_local_name"));
}

TEST_F(AdvParserTest, DuplicateManufacturerTagsAreJoinedOnce) {
  AdvParser parser(metadata);
  AdvFields f = parser.parse("05ff4c000501" "05ff4c000501" "05ff75000201");
  EXPECT_EQ("Apple, Inc.,Samsung Electronics Co. Ltd.", f["ble_company"]);
  EXPECT_EQ("apple_5,samsung_2", f["ble_device_type"]);
}

TEST_F(AdvParserTest, NameCutInsideMultibyteCharacterIsReplaced) {
  AdvParser parser(metadata);
  // Shortened Local Name holding the first two bytes of U+4E2D
  AdvFields f = parser.parse("0308e4b8");
  EXPECT_EQ("\xEF\xBF\xBD", f["ble_shortened_local_name"]);
}

TEST_F(AdvParserTest, WellFormedMultibyteNameIsKept) {
  AdvParser parser(metadata);
  AdvFields f = parser.parse("0609" "41e4b8ad42");
  EXPECT_EQ("A\xE4\xB8\xAD" "B", f["ble_complete_local_name"]);
}

TEST(SanitizeUtf8, InvalidSequencesBecomeReplacementCharacters) {
  const std::string rep = "\xEF\xBF\xBD";
  EXPECT_EQ("plain", sanitize_utf8("plain"));
  EXPECT_EQ("\xC3\xA9", sanitize_utf8("\xC3\xA9"));
  EXPECT_EQ("a" + rep + "b", sanitize_utf8("a\xFF" "b"));
  EXPECT_EQ(rep + rep, sanitize_utf8("\xC0\xAF"));          // Overlong
  EXPECT_EQ(rep + rep + rep, sanitize_utf8("\xED\xA0\x80"));   // Surrogate
  EXPECT_EQ(rep + "x", sanitize_utf8("\xE4\xB8" "x"));
  EXPECT_EQ(rep, sanitize_utf8("\xF0\x9F\x98"));
}

TEST(AdvParser, FailsClosedWithoutMetadata) {
  BtMetadata empty;
  AdvParser parser(empty);
  EXPECT_TRUE(parser.parse("020106").empty());
}

TEST(AdvParser, DeviceTypeTags) {
  EXPECT_EQ("apple_findmy", AdvParser::deviceTypeTag("4c0007"));
  EXPECT_EQ("apple_16", AdvParser::deviceTypeTag("4c0010"));
  EXPECT_EQ("microsoft_1", AdvParser::deviceTypeTag("060001"));
  EXPECT_EQ("speaker_3", AdvParser::deviceTypeTag("010103"));
  EXPECT_EQ("unknown", AdvParser::deviceTypeTag("4c00"));
}

TEST(BtMetadata, MalformedJsonIsRejected) {
  BtMetadata metadata;
  EXPECT_FALSE(metadata.loadFromJson("{\"company_identifiers\":"));
  EXPECT_FALSE(metadata.isLoaded());
}

TEST(BtMetadata, NormalizeName) {
  EXPECT_EQ("service_data__16bit_uuid", BtMetadata::normalizeName("Service Data - 16-bit UUID"));
  EXPECT_EQ("flags", BtMetadata::normalizeName("Flags"));
}

TEST(BtMetadataFile, ShippedTableLoads) {
  BtMetadata shipped;
  ASSERT_TRUE(shipped.loadFromFile(std::string(CROWDSCAN_TEST_DATA_DIR) + "/" + METADATA_FILE_NAME));
  EXPECT_TRUE(shipped.isLoaded());
  EXPECT_EQ("Apple, Inc.", shipped.companyName(76));
  EXPECT_EQ("flags", shipped.adTypeName(1));
}
