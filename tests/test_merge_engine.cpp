#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fmt/core.h>

#include "cam_merge/merge_engine.hpp"
#include "cam_merge/validity.hpp"
#include "test_support.hpp"

using namespace cam_merge;
using namespace cam_merge::test;
using ::testing::_;
using ::testing::Return;

namespace {

class MockTranscoder : public Transcoder {
public:
  MOCK_METHOD(bool, concat,
              (const std::string &, const std::string &, AudioMode,
               std::chrono::seconds),
              (override));
  MOCK_METHOD(bool, probe, (const std::string &, std::chrono::seconds),
              (override));
};

MergeOptions fast_options() {
  MergeOptions o;
  o.timeout = std::chrono::seconds(60);
  o.max_retries = 3;
  o.retry_delay = std::chrono::seconds(0);
  o.min_valid_size_kb = 1;
  return o;
}

} // namespace

class MergeEngineTest : public TempDirTest {
protected:
  std::vector<std::string> make_inputs(int n, std::size_t bytes = 2048) {
    std::vector<std::string> inputs;
    for (int i = 0; i < n; ++i) {
      auto p = root_ / "in" / fmt::format("clip_{:02d}.mp4", i);
      write_file(p, bytes, static_cast<char>('a' + i));
      inputs.push_back(p.string());
    }
    return inputs;
  }

  FakeTranscoder transcoder_;
};

TEST_F(MergeEngineTest, HourlyMergeUsesAacAndConcatenatesInOrder) {
  auto inputs = make_inputs(3);
  auto output = (root_ / "out" / "hour.mp4").string();

  MergeEngine engine(transcoder_, fast_options());
  ASSERT_TRUE(engine.merge(inputs, output, false));

  EXPECT_EQ(transcoder_.aac_calls, 1);
  EXPECT_EQ(transcoder_.copy_calls, 0);
  ASSERT_EQ(transcoder_.manifests.size(), 1u);
  EXPECT_EQ(transcoder_.manifests[0].size(), 3u);
  EXPECT_EQ(fs::file_size(output), 3u * 2048u);
  EXPECT_FALSE(fs::exists(output + ".txt"));
}

TEST_F(MergeEngineTest, HourlyMergeRetriesUntilSuccess) {
  auto inputs = make_inputs(2);
  auto output = (root_ / "out" / "hour.mp4").string();
  transcoder_.fail_aac = 2;

  MergeEngine engine(transcoder_, fast_options());
  EXPECT_TRUE(engine.merge(inputs, output, false));
  EXPECT_EQ(transcoder_.aac_calls, 3);
  EXPECT_EQ(fs::file_size(output), 2u * 2048u);
}

TEST_F(MergeEngineTest, HourlyMergeGivesUpAndLeavesNothing) {
  auto inputs = make_inputs(2);
  auto output = (root_ / "out" / "hour.mp4").string();
  transcoder_.fail_aac = -1;

  MergeEngine engine(transcoder_, fast_options());
  EXPECT_FALSE(engine.merge(inputs, output, false));
  EXPECT_EQ(transcoder_.aac_calls, 3);
  EXPECT_FALSE(fs::exists(output));
  EXPECT_FALSE(fs::exists(output + ".txt"));
}

TEST_F(MergeEngineTest, UndersizedOutputIsRejected) {
  auto inputs = make_inputs(1, 100);
  auto output = (root_ / "out" / "hour.mp4").string();

  MergeEngine engine(transcoder_, fast_options());
  EXPECT_FALSE(engine.merge(inputs, output, false));
  EXPECT_FALSE(fs::exists(output));
}

TEST_F(MergeEngineTest, DailySingleInputIsCopiedWithoutTranscoder) {
  auto inputs = make_inputs(1);
  auto output = (root_ / "merged" / "day.mp4").string();

  MergeEngine engine(transcoder_, fast_options());
  ASSERT_TRUE(engine.merge(inputs, output, true));

  EXPECT_EQ(transcoder_.concat_calls, 0);
  EXPECT_EQ(read_file(output), read_file(inputs[0]));
}

TEST_F(MergeEngineTest, DailyMergeStreamCopiesFirst) {
  auto inputs = make_inputs(3);
  auto output = (root_ / "merged" / "day.mp4").string();

  MergeEngine engine(transcoder_, fast_options());
  ASSERT_TRUE(engine.merge(inputs, output, true));
  EXPECT_EQ(transcoder_.copy_calls, 1);
  EXPECT_EQ(transcoder_.aac_calls, 0);
  EXPECT_EQ(fs::file_size(output), 3u * 2048u);
}

TEST_F(MergeEngineTest, DailyMergeFallsBackToAacOnFirstAttempt) {
  auto inputs = make_inputs(2);
  auto output = (root_ / "merged" / "day.mp4").string();
  transcoder_.fail_copy = 1;

  MergeEngine engine(transcoder_, fast_options());
  ASSERT_TRUE(engine.merge(inputs, output, true));
  EXPECT_EQ(transcoder_.copy_calls, 1);
  EXPECT_EQ(transcoder_.aac_calls, 1);
  EXPECT_EQ(fs::file_size(output), 2u * 2048u);
}

TEST_F(MergeEngineTest, DailyMergeDegradesToFirstInput) {
  auto inputs = make_inputs(3);
  auto output = (root_ / "merged" / "day.mp4").string();
  transcoder_.fail_copy = -1;
  transcoder_.fail_aac = -1;

  MergeEngine engine(transcoder_, fast_options());
  ASSERT_TRUE(engine.merge(inputs, output, true));

  /// One stream copy per attempt plus a single AAC retry on the first
  EXPECT_EQ(transcoder_.copy_calls, 3);
  EXPECT_EQ(transcoder_.aac_calls, 1);
  EXPECT_EQ(read_file(output), read_file(inputs[0]));
  EXPECT_FALSE(fs::exists(output + ".txt"));
}

TEST_F(MergeEngineTest, ManifestQuotesSingleQuotes) {
  auto odd = root_ / "in" / "it's here.mp4";
  write_file(odd, 2048);
  auto output = (root_ / "out" / "hour.mp4").string();

  MergeEngine engine(transcoder_, fast_options());
  ASSERT_TRUE(engine.merge({odd.string()}, output, false));
  ASSERT_EQ(transcoder_.manifests.size(), 1u);
  ASSERT_EQ(transcoder_.manifests[0].size(), 1u);
  EXPECT_EQ(transcoder_.manifests[0][0], odd.string());
}

TEST_F(MergeEngineTest, EmptyInputListFails) {
  MergeEngine engine(transcoder_, fast_options());
  EXPECT_FALSE(engine.merge({}, (root_ / "x.mp4").string(), false));
  EXPECT_EQ(transcoder_.concat_calls, 0);
}

TEST_F(MergeEngineTest, DeepCheckRejectsUnplayableOutput) {
  auto inputs = make_inputs(2);
  auto output = (root_ / "out" / "hour.mp4").string();

  MockTranscoder mock;
  EXPECT_CALL(mock, concat(_, output, AudioMode::Aac, _))
      .Times(2)
      .WillRepeatedly([](const std::string &, const std::string &out,
                         AudioMode, std::chrono::seconds) {
        write_file(out, 4096);
        return true;
      });
  EXPECT_CALL(mock, probe(output, _))
      .WillOnce(Return(false))
      .WillOnce(Return(true));

  MergeOptions options = fast_options();
  options.max_retries = 2;
  options.deep_check = true;
  MergeEngine engine(mock, options);
  EXPECT_TRUE(engine.merge(inputs, output, false));
}

TEST_F(MergeEngineTest, HourlyTimeoutIsDoubledForDays) {
  auto inputs = make_inputs(2);
  auto output = (root_ / "merged" / "day.mp4").string();

  MockTranscoder mock;
  EXPECT_CALL(mock, concat(_, output, AudioMode::Copy,
                           std::chrono::seconds(120)))
      .WillOnce([](const std::string &, const std::string &out, AudioMode,
                   std::chrono::seconds) {
        write_file(out, 4096);
        return true;
      });

  MergeEngine engine(mock, fast_options());
  EXPECT_TRUE(engine.merge(inputs, output, true));
}

TEST(ValidityTest, MissingAndSmallFilesAreInvalid) {
  FakeTranscoder transcoder;
  auto dir = fs::temp_directory_path() /
             ("cam_merge_validity_" + std::to_string(::getpid()));
  fs::create_directories(dir);

  EXPECT_FALSE(is_valid_output(dir / "missing.mp4", 1, false, transcoder));
  EXPECT_FALSE(is_valid_output(dir, 0, false, transcoder));

  write_file(dir / "small.mp4", 1000);
  EXPECT_FALSE(is_valid_output(dir / "small.mp4", 1, false, transcoder));

  write_file(dir / "ok.mp4", 1024);
  EXPECT_TRUE(is_valid_output(dir / "ok.mp4", 1, false, transcoder));
  EXPECT_EQ(transcoder.probe_calls, 0);

  transcoder.probe_ok = false;
  EXPECT_FALSE(is_valid_output(dir / "ok.mp4", 1, true, transcoder));
  EXPECT_EQ(transcoder.probe_calls, 1);

  fs::remove_all(dir);
}
