#include <gtest/gtest.h>

#include "cam_merge/layout.hpp"
#include "cam_merge/naming.hpp"

using namespace cam_merge;

TEST(FolderDateTest, ParsesHourFolder) {
  auto t = parse_folder_date("2025010113");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->year, 2025);
  EXPECT_EQ(t->month, 1);
  EXPECT_EQ(t->day, 1);
  ASSERT_TRUE(t->hour.has_value());
  EXPECT_EQ(*t->hour, 13);
}

TEST(FolderDateTest, ParsesDayName) {
  auto t = parse_folder_date("20241231");
  ASSERT_TRUE(t.has_value());
  EXPECT_EQ(t->month, 12);
  EXPECT_EQ(t->day, 31);
  EXPECT_FALSE(t->hour.has_value());
}

TEST(FolderDateTest, RejectsMalformedNames) {
  EXPECT_FALSE(parse_folder_date(""));
  EXPECT_FALSE(parse_folder_date("2025010"));
  EXPECT_FALSE(parse_folder_date("202501011"));
  EXPECT_FALSE(parse_folder_date("20250101130"));
  EXPECT_FALSE(parse_folder_date("2025o10113"));
  EXPECT_FALSE(parse_folder_date("-025010113"));
}

TEST(FolderDateTest, RejectsImpossibleDates) {
  EXPECT_FALSE(parse_folder_date("20251301"));
  EXPECT_FALSE(parse_folder_date("20250001"));
  EXPECT_FALSE(parse_folder_date("20250100"));
  EXPECT_FALSE(parse_folder_date("20250431"));
  EXPECT_FALSE(parse_folder_date("2025010124"));
  EXPECT_FALSE(parse_folder_date("19691231"));
}

TEST(FolderDateTest, HandlesLeapYears) {
  EXPECT_TRUE(parse_folder_date("20240229"));
  EXPECT_TRUE(parse_folder_date("20000229"));
  EXPECT_FALSE(parse_folder_date("20230229"));
  EXPECT_FALSE(parse_folder_date("21000229"));
}

TEST(FolderDateTest, HourAndDayPredicates) {
  EXPECT_TRUE(is_hour_folder("2025010100"));
  EXPECT_FALSE(is_hour_folder("20250101"));
  EXPECT_TRUE(is_day_name("20250101"));
  EXPECT_FALSE(is_day_name("2025010100"));
}

TEST(LedgerKeyTest, HourKeyFormat) {
  auto key = make_hour_key("Front", "cam01", "2025010107");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->day, "20250101");
  EXPECT_EQ(key->hour, "07");
  EXPECT_EQ(key->folder(), "2025010107");
  EXPECT_EQ(to_string(*key), "Front/cam01/2025010107");

  auto parsed = parse_hour_key("Front/cam01/2025010107");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, *key);
}

TEST(LedgerKeyTest, DayKeySplitsAtLastUnderscore) {
  auto key = parse_day_key("Back_Yard_20250101");
  ASSERT_TRUE(key.has_value());
  EXPECT_EQ(key->location, "Back_Yard");
  EXPECT_EQ(key->day, "20250101");
  EXPECT_EQ(to_string(*key), "Back_Yard_20250101");
}

TEST(LedgerKeyTest, OriginalKeyFormat) {
  OriginalFolderKey key{"Front", "cam01", "2025010107"};
  EXPECT_EQ(to_string(key), "original/Front/cam01/2025010107");
  auto parsed = parse_original_key(to_string(key));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, key);
}

TEST(LedgerKeyTest, ParseDispatchesOnKind) {
  auto hour = parse_ledger_key("Front/cam01/2025010107");
  ASSERT_TRUE(hour.has_value());
  EXPECT_TRUE(std::holds_alternative<HourKey>(*hour));

  auto day = parse_ledger_key("Front_20250101");
  ASSERT_TRUE(day.has_value());
  EXPECT_TRUE(std::holds_alternative<DayKey>(*day));

  auto original = parse_ledger_key("original/Front/cam01/2025010107");
  ASSERT_TRUE(original.has_value());
  EXPECT_TRUE(std::holds_alternative<OriginalFolderKey>(*original));
  EXPECT_EQ(to_string(*original), "original/Front/cam01/2025010107");
}

TEST(LedgerKeyTest, RejectsLegacyAndMalformedKeys) {
  EXPECT_FALSE(parse_ledger_key("xiaomi_camera_videos_cam01_2025010107"));
  EXPECT_FALSE(parse_ledger_key("original_Front_cam01_2025010107"));
  EXPECT_FALSE(parse_ledger_key("Front/cam01/20250101"));
  EXPECT_FALSE(parse_ledger_key("Front/cam01/2025010125"));
  EXPECT_FALSE(parse_ledger_key("Front/a/b/2025010107"));
  EXPECT_FALSE(parse_ledger_key("_20250101"));
  EXPECT_FALSE(parse_ledger_key("Front_2025010"));
  EXPECT_FALSE(parse_ledger_key("original/Front/cam01"));
  EXPECT_FALSE(parse_ledger_key(""));
}

TEST(LedgerKeyTest, KindSpecificParsersRejectOtherKinds) {
  EXPECT_FALSE(parse_hour_key("Front_20250101"));
  EXPECT_FALSE(parse_hour_key("original/Front/cam01/2025010107"));
  EXPECT_FALSE(parse_day_key("Front/cam01/2025010107"));
  EXPECT_FALSE(parse_original_key("Front/cam01/2025010107"));
}

TEST(LedgerKeyTest, SegmentsMustBeWellFormedUtf8) {
  EXPECT_TRUE(is_key_segment("Front"));
  EXPECT_TRUE(is_key_segment("Caf\xc3\xa9"));
  EXPECT_TRUE(is_key_segment("Back_Yard"));

  EXPECT_FALSE(is_key_segment(""));
  EXPECT_FALSE(is_key_segment(".."));
  EXPECT_FALSE(is_key_segment("a/b"));
  EXPECT_FALSE(is_key_segment("Caf\xe9"));
  EXPECT_FALSE(is_key_segment("\xc0\xaf"));
  EXPECT_FALSE(is_key_segment("\xed\xa0\x80"));

  EXPECT_FALSE(make_hour_key("Caf\xe9", "cam01", "2025010107").has_value());
  EXPECT_FALSE(parse_day_key("Caf\xe9_20250101").has_value());
}

TEST(StorageLayoutTest, DerivesOutputPaths) {
  StorageLayout layout("/data/videos", "merged_videos", "xiaomi_camera_videos");
  HourKey hour{"Front", "cam01", "20250101", "07"};
  DayKey day{"Front", "20250101"};
  OriginalFolderKey original{"Front", "cam01", "2025010107"};

  EXPECT_EQ(layout.hour_output(hour).string(),
            "/data/videos/merged_videos/20250101/20250101_Front_07.mp4");
  EXPECT_EQ(layout.day_output(day).string(),
            "/data/videos/merged_videos/20250101/20250101_Front.mp4");
  EXPECT_EQ(layout.original_folder(original).string(),
            "/data/videos/Front/xiaomi_camera_videos/cam01/2025010107");
}
