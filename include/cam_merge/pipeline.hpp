/**
 * @file pipeline.hpp
 * @brief Per-camera hour and day merge orchestration
 *
 * @details The CameraPipeline class turns one camera's finished days into
 *          day videos:
 *
 *          1. Group hour folders by day (today excluded)
 *
 *          2. Skip days whose recorded day video is still valid
 *
 *          3. Merge every hour folder into an hour video, reusing valid
 *             recorded ones
 *
 *          4. Merge the hour videos into the day video
 *
 *          5. Record the day and its source folders, then drop the hour
 *             videos unless they are kept
 *
 * @note Every ledger change is persisted immediately through the attached
 *       LedgerStore. Without one the pipeline mutates the ledger in memory
 *       only.
 */

#ifndef CAM_MERGE_PIPELINE_HPP
#define CAM_MERGE_PIPELINE_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "layout.hpp"
#include "ledger.hpp"
#include "types.hpp"

namespace cam_merge {

class MergeEngine;
class Transcoder;

/**
 * @struct PipelineOptions
 * @brief Acceptance and housekeeping switches of a CameraPipeline.
 */
struct PipelineOptions {
  std::uint64_t min_valid_size_kb = 1024;
  bool deep_check = false;
  bool save_hourly = false; //< Keep hour videos after the day merge
};

class CameraPipeline {
public:
  CameraPipeline(const StorageLayout &layout, PipelineOptions options,
                 MergeEngine &engine, Transcoder &transcoder);

  /**
   * @brief Process every finished day of @p camera.
   * @param today YYYYMMDD of the current local day (never merged)
   * @param ledger Ledger to consult and update
   * @return Per-camera counters; success is false if the camera tree could
   *         not be accessed
   */
  CameraResult process(const CameraFolder &camera, const std::string &today,
                       Ledger &ledger);

  /**
   * @brief Set the store used to persist ledger changes.
   * @param store Ledger store (nullptr = keep changes in memory)
   */
  void set_ledger_store(LedgerStore *store) { store_ = store; }

private:
  void process_day(const CameraFolder &camera, const std::string &day,
                   const std::vector<std::string> &folders, Ledger &ledger,
                   CameraResult &result);

  /**
   * @brief Merge the day's hour videos; returns true once the day is recorded
   * @param merged_folders Hour folders whose footage is in @p hour_outputs;
   *        only these are recorded for retention
   */
  bool merge_day(const CameraFolder &camera, const std::string &day,
                 const std::vector<std::string> &merged_folders,
                 std::vector<std::string> hour_outputs, Ledger &ledger);

  bool valid(const std::filesystem::path &output);
  void persist(const Ledger &ledger);
  void log_day_video(const std::filesystem::path &output);

  const StorageLayout &layout_;
  PipelineOptions options_;
  MergeEngine &engine_;
  Transcoder &transcoder_;
  LedgerStore *store_{nullptr}; //< Optional persistence target
};

} // namespace cam_merge

#endif // CAM_MERGE_PIPELINE_HPP
