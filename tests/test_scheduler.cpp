#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>

#include <fmt/core.h>

#include "cam_merge/merge_engine.hpp"
#include "cam_merge/pipeline.hpp"
#include "cam_merge/reconciler.hpp"
#include "cam_merge/retention.hpp"
#include "cam_merge/scheduler.hpp"
#include "test_support.hpp"

using namespace cam_merge;
using namespace cam_merge::test;
using namespace std::chrono_literals;

class SchedulerTest : public TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    layout_ = std::make_unique<StorageLayout>(root_, "merged_videos",
                                              "xiaomi_camera_videos");

    MergeOptions merge;
    merge.retry_delay = 0s;
    merge.min_valid_size_kb = 1;
    engine_ = std::make_unique<MergeEngine>(transcoder_, merge);

    PipelineOptions pipeline;
    pipeline.min_valid_size_kb = 1;
    pipeline_ = std::make_unique<CameraPipeline>(*layout_, pipeline, *engine_,
                                                 transcoder_);
    reconciler_ = std::make_unique<Reconciler>(*layout_, transcoder_, 1);
    retention_ = std::make_unique<RetentionEngine>(*layout_,
                                                   RetentionPolicy{1, 1});

    options_.run_forever = false;
    options_.scan_interval = 10ms;
    options_.error_cooldown = 10ms;
    options_.sleep_slice = 5ms;
  }

  std::unique_ptr<Scheduler> make_scheduler() {
    auto s = std::make_unique<Scheduler>(*layout_, options_, ledger_,
                                         *pipeline_, *reconciler_, *retention_);
    s->set_today_provider([] { return std::string("20250102"); });
    return s;
  }

  /// Camera with one finished hour yesterday and @p current files today
  void add_camera(const std::string &location, int current) {
    auto dir = layout_->camera_dir(location, "cam01");
    for (int i = 0; i < 2; ++i)
      write_file(dir / "2025010107" / fmt::format("{:02d}.mp4", i), 1024);
    for (int i = 0; i < current; ++i)
      write_file(dir / "2025010209" / fmt::format("{:02d}.mp4", i), 10);
  }

  std::unique_ptr<StorageLayout> layout_;
  FakeTranscoder transcoder_;
  std::unique_ptr<MergeEngine> engine_;
  std::unique_ptr<CameraPipeline> pipeline_;
  std::unique_ptr<Reconciler> reconciler_;
  std::unique_ptr<RetentionEngine> retention_;
  SchedulerOptions options_;
  Ledger ledger_;
};

TEST_F(SchedulerTest, SinglePassMergesReadyLocations) {
  add_camera("Front", 5);
  auto scheduler = make_scheduler();

  EXPECT_EQ(scheduler->run(), 0);
  EXPECT_EQ(scheduler->passes(), 1);
  EXPECT_EQ(scheduler->errors(), 0);
  EXPECT_EQ(scheduler->state(), SchedulerState::Idle);
  EXPECT_TRUE(fs::exists(layout_->day_output({"Front", "20250101"})));
  EXPECT_TRUE(ledger_.has_day({"Front", "20250101"}));
}

TEST_F(SchedulerTest, WaitsForMissingRequiredLocation) {
  add_camera("Front", 5);
  options_.required_locations = {"Front", "Yard"};
  auto scheduler = make_scheduler();

  EXPECT_EQ(scheduler->run(), 0);
  EXPECT_EQ(scheduler->passes(), 0);
  EXPECT_EQ(transcoder_.concat_calls, 0);
  EXPECT_FALSE(fs::exists(layout_->day_output({"Front", "20250101"})));
}

TEST_F(SchedulerTest, WaitsUntilCurrentFootageIsSufficient) {
  add_camera("Front", 4);
  auto scheduler = make_scheduler();

  EXPECT_EQ(scheduler->run(), 0);
  EXPECT_EQ(scheduler->passes(), 0);
}

TEST_F(SchedulerTest, OnlyRequiredLocationsAreProcessed) {
  add_camera("Front", 5);
  add_camera("Yard", 5);
  options_.required_locations = {"Front"};
  auto scheduler = make_scheduler();

  EXPECT_EQ(scheduler->run(), 0);
  EXPECT_TRUE(fs::exists(layout_->day_output({"Front", "20250101"})));
  EXPECT_FALSE(fs::exists(layout_->day_output({"Yard", "20250101"})));
}

TEST_F(SchedulerTest, NoCamerasIsNotAnError) {
  auto scheduler = make_scheduler();
  EXPECT_EQ(scheduler->run(), 0);
  EXPECT_EQ(scheduler->passes(), 0);
}

TEST_F(SchedulerTest, ReconcilesLedgerBeforeScanning) {
  ledger_.record_day({"Front", "20241231"}, 1.0);
  ledger_.record_hour({"Front", "cam01", "20241231", "07"}, 1.0);

  LedgerStore store((root_ / "processed.json").string());
  auto scheduler = make_scheduler();
  scheduler->set_ledger_store(&store);
  EXPECT_EQ(scheduler->run(), 0);

  EXPECT_TRUE(ledger_.days.empty());
  EXPECT_TRUE(ledger_.hours.empty());
  EXPECT_TRUE(store.load().days.empty());
}

TEST_F(SchedulerTest, StopFlagEndsLoopImmediately) {
  add_camera("Front", 5);
  options_.run_forever = true;
  std::atomic<bool> stop{true};

  auto scheduler = make_scheduler();
  scheduler->set_stop_flag(&stop);
  EXPECT_EQ(scheduler->run(), 0);
  EXPECT_EQ(scheduler->passes(), 0);
  EXPECT_EQ(transcoder_.concat_calls, 0);
}

TEST_F(SchedulerTest, FailedSinglePassReturnsError) {
  add_camera("Front", 5);
  auto scheduler = make_scheduler();
  scheduler->set_today_provider(
      []() -> std::string { throw std::runtime_error("clock unavailable"); });

  EXPECT_EQ(scheduler->run(), 1);
  EXPECT_EQ(scheduler->errors(), 1);
  EXPECT_EQ(scheduler->state(), SchedulerState::Backoff);
}

TEST(SchedulerStateTest, HasReadableNames) {
  EXPECT_STREQ(to_string(SchedulerState::Idle), "idle");
  EXPECT_STREQ(to_string(SchedulerState::Backoff), "backoff");
}
