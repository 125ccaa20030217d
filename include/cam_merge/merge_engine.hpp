/**
 * @file merge_engine.hpp
 * @brief Multi-strategy concatenation of recordings
 *
 * @details MergeEngine turns an ordered list of recordings into one output.
 *
 * @attention STRATEGIES:
 *
 * Hourly merge (is_daily = false):
 *
 *   - video copy + AAC audio, configured timeout, up to max_retries attempts
 *
 * Daily merge (is_daily = true), timeout doubled, first success wins:
 *
 *   1. a single input is copied as-is (no transcoder)
 *
 *   2. video + audio stream copy
 *
 *   3. first attempt only: video copy + AAC audio
 *
 *   4. all attempts exhausted: copy the first input as the day video
 *      (lossy, logged)
 *
 * @note Every candidate output must pass is_valid_output() before it is
 *       accepted; rejected outputs are deleted. The concat manifest
 *       (<output>.txt) is removed on every outcome. merge() never throws.
 */

#ifndef CAM_MERGE_MERGE_ENGINE_HPP
#define CAM_MERGE_MERGE_ENGINE_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace cam_merge {

class Transcoder;

/**
 * @struct MergeOptions
 * @brief Retry and acceptance policy of a MergeEngine.
 */
struct MergeOptions {
  std::chrono::seconds timeout{1800};     //< Hourly budget; daily uses 2x
  int max_retries = 3;                    //< Attempts per merge (>= 1)
  std::chrono::seconds retry_delay{5};    //< Pause between attempts
  std::uint64_t min_valid_size_kb = 1024; //< Acceptance size threshold
  bool deep_check = false;                //< Probe outputs before accepting
};

class MergeEngine {
public:
  MergeEngine(Transcoder &transcoder, MergeOptions options);

  /**
   * @brief Merge @p inputs, in the given order, into @p output.
   *
   * @param inputs Source files, pre-sorted chronologically by the caller
   * @param output Destination file; its directory is created if needed
   * @param is_daily Select the daily strategy ladder
   * @return true if an accepted output now exists at @p output
   */
  bool merge(const std::vector<std::string> &inputs, const std::string &output,
             bool is_daily);

  const MergeOptions &options() const { return options_; }

private:
  bool merge_hourly(const std::vector<std::string> &inputs,
                    const std::string &output);
  bool merge_daily(const std::vector<std::string> &inputs,
                   const std::string &output);

  /// Run the validity gate on a candidate output
  bool accept(const std::string &output);

  /// Delete a rejected or partial output
  void discard(const std::string &output);

  /// Plain file copy, overwriting @p output
  bool copy_input(const std::string &input, const std::string &output);

  /// Sleep retry_delay before attempt @p next_attempt (1-based)
  void pause_before_retry(int next_attempt);

  Transcoder &transcoder_;
  MergeOptions options_;
};

} // namespace cam_merge

#endif // CAM_MERGE_MERGE_ENGINE_HPP
