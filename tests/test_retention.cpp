#include <gtest/gtest.h>

#include <memory>

#include "cam_merge/retention.hpp"
#include "cam_merge/types.hpp"
#include "test_support.hpp"

using namespace cam_merge;
using namespace cam_merge::test;

namespace {

constexpr double NOW = 1'700'000'000.0;
constexpr double OLD = NOW - 2 * SECONDS_PER_DAY;
constexpr double FRESH = NOW - 0.5 * SECONDS_PER_DAY;

} // namespace

class RetentionTest : public TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    layout_ = std::make_unique<StorageLayout>(root_, "merged_videos",
                                              "xiaomi_camera_videos");
  }

  fs::path make_original(const OriginalFolderKey &key, int files) {
    auto dir = layout_->original_folder(key);
    fs::create_directories(dir);
    for (int i = 0; i < files; ++i)
      write_file(dir / ("clip" + std::to_string(i) + ".mp4"), 10);
    return dir;
  }

  std::unique_ptr<StorageLayout> layout_;
};

TEST_F(RetentionTest, OriginalSweepDeletesExpiredFolders) {
  OriginalFolderKey old_key{"Front", "cam01", "2025010107"};
  OriginalFolderKey fresh_key{"Front", "cam01", "2025010108"};
  auto old_dir = make_original(old_key, 3);
  auto fresh_dir = make_original(fresh_key, 3);

  Ledger ledger;
  ledger.record_original(old_key, OLD);
  ledger.record_original(fresh_key, FRESH);

  RetentionEngine engine(*layout_, RetentionPolicy{1, 1});
  EXPECT_EQ(engine.sweep_originals(ledger, NOW), 1);

  EXPECT_FALSE(fs::exists(old_dir));
  EXPECT_TRUE(fs::exists(fresh_dir));
  EXPECT_EQ(ledger.merge_timestamps.count(to_string(old_key)), 0u);
  EXPECT_EQ(ledger.merge_timestamps.count(to_string(fresh_key)), 1u);
}

TEST_F(RetentionTest, OriginalSweepLeavesNonEmptyFolderButDropsRecord) {
  OriginalFolderKey key{"Front", "cam01", "2025010107"};
  auto dir = make_original(key, 2);
  fs::create_directories(dir / "nested");

  Ledger ledger;
  ledger.record_original(key, OLD);

  RetentionEngine engine(*layout_, RetentionPolicy{1, 1});
  engine.sweep_originals(ledger, NOW);

  EXPECT_TRUE(fs::exists(dir / "nested"));
  EXPECT_FALSE(fs::exists(dir / "clip0.mp4"));
  EXPECT_TRUE(ledger.merge_timestamps.empty());
}

TEST_F(RetentionTest, OriginalSweepDropsRecordsOfVanishedFoldersAndBadKeys) {
  Ledger ledger;
  ledger.record_original({"Front", "cam01", "2025010107"}, OLD);
  ledger.merge_timestamps["original/Front/cam01/notafolder"] = OLD;
  ledger.merge_timestamps["Front_20250101"] = OLD;

  RetentionEngine engine(*layout_, RetentionPolicy{1, 0});
  EXPECT_EQ(engine.sweep_originals(ledger, NOW), 0);
  EXPECT_EQ(ledger.merge_timestamps.size(), 1u);
  EXPECT_EQ(ledger.merge_timestamps.count("Front_20250101"), 1u);
}

TEST_F(RetentionTest, DisabledSweepsTouchNothing) {
  OriginalFolderKey key{"Front", "cam01", "2025010107"};
  auto dir = make_original(key, 1);
  DayKey day{"Front", "20250101"};
  write_file(layout_->day_output(day), 10);

  Ledger ledger;
  ledger.record_original(key, OLD);
  ledger.record_day(day, OLD);

  RetentionEngine engine(*layout_, RetentionPolicy{0, -1});
  EXPECT_EQ(engine.sweep_originals(ledger, NOW), 0);
  EXPECT_EQ(engine.sweep_merged(ledger, NOW), 0);
  EXPECT_TRUE(fs::exists(dir / "clip0.mp4"));
  EXPECT_TRUE(fs::exists(layout_->day_output(day)));
  EXPECT_EQ(ledger.merge_timestamps.size(), 2u);
}

TEST_F(RetentionTest, MergedSweepRetiresExpiredOutputsTogetherWithKeys) {
  HourKey old_hour{"Front", "cam01", "20250101", "07"};
  DayKey old_day{"Front", "20250101"};
  DayKey fresh_day{"Front", "20250102"};
  write_file(layout_->hour_output(old_hour), 10);
  write_file(layout_->day_output(old_day), 10);
  write_file(layout_->day_output(fresh_day), 10);

  Ledger ledger;
  ledger.record_hour(old_hour, OLD);
  ledger.record_day(old_day, OLD);
  ledger.record_day(fresh_day, FRESH);

  RetentionEngine engine(*layout_, RetentionPolicy{1, 1});
  EXPECT_EQ(engine.sweep_merged(ledger, NOW), 2);

  EXPECT_FALSE(fs::exists(layout_->hour_output(old_hour)));
  EXPECT_FALSE(fs::exists(layout_->merged_day_dir("20250101")));
  EXPECT_TRUE(fs::exists(layout_->day_output(fresh_day)));
  EXPECT_TRUE(ledger.hours.empty());
  EXPECT_EQ(ledger.days, (std::set<std::string>{to_string(fresh_day)}));
  EXPECT_EQ(ledger.merge_timestamps.count(to_string(old_day)), 0u);
}

TEST_F(RetentionTest, MergedSweepForgetsRecordsWhoseOutputIsGone) {
  HourKey hour{"Front", "cam01", "20250101", "07"};
  Ledger ledger;
  ledger.record_hour(hour, OLD);

  RetentionEngine engine(*layout_, RetentionPolicy{1, 1});
  engine.sweep_merged(ledger, NOW);
  EXPECT_TRUE(ledger.hours.empty());
  EXPECT_TRUE(ledger.merge_timestamps.empty());
}

TEST_F(RetentionTest, RecordsWithoutTimestampAreNeverDeleted) {
  DayKey day{"Front", "20250101"};
  write_file(layout_->day_output(day), 10);
  Ledger ledger;
  ledger.days.insert(to_string(day));

  RetentionEngine engine(*layout_, RetentionPolicy{1, 1});
  EXPECT_EQ(engine.sweep_merged(ledger, NOW), 0);
  EXPECT_TRUE(fs::exists(layout_->day_output(day)));
  EXPECT_EQ(ledger.days.size(), 1u);
}

TEST_F(RetentionTest, SweepPersistsThroughStore) {
  DayKey day{"Front", "20250101"};
  write_file(layout_->day_output(day), 10);
  Ledger ledger;
  ledger.record_day(day, OLD);

  LedgerStore store((root_ / "processed.json").string());
  RetentionEngine engine(*layout_, RetentionPolicy{1, 1}, &store);
  engine.sweep_merged(ledger, NOW);

  Ledger saved = store.load();
  EXPECT_TRUE(saved.days.empty());
  EXPECT_TRUE(saved.merge_timestamps.empty());
}
