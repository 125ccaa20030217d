/**
 * @file pipeline.cpp
 * @brief Per-camera merge orchestration implementation
 *
 * @details For each finished day, in ascending order:
 *
 *          1. Skip the day if its recorded day video is valid
 *
 *          2. Merge or reuse one hour video per hour folder
 *
 *          3. Merge the hour videos into the day video and record it
 *
 *          4. Delete the hour videos unless save_hourly is set
 */

#include "cam_merge/pipeline.hpp"

#include <algorithm>
#include <chrono>

#include <fmt/core.h>

#include "cam_merge/logging.hpp"
#include "cam_merge/media_info.hpp"
#include "cam_merge/merge_engine.hpp"
#include "cam_merge/naming.hpp"
#include "cam_merge/scanner.hpp"
#include "cam_merge/system.hpp"
#include "cam_merge/validity.hpp"

namespace cam_merge {

namespace fs = std::filesystem;

// **---- Constructor ----**

CameraPipeline::CameraPipeline(const StorageLayout &layout,
                               PipelineOptions options, MergeEngine &engine,
                               Transcoder &transcoder)
    : layout_(layout), options_(options), engine_(engine),
      transcoder_(transcoder) {}

// **---- Camera ----**

CameraResult CameraPipeline::process(const CameraFolder &camera,
                                     const std::string &today, Ledger &ledger) {
  CameraResult result;
  result.label = camera.location + "/" + camera.camera_id;
  auto start = std::chrono::steady_clock::now();

  LOG_PHASE("Processing camera {}", result.label);

  try {
    auto by_day = group_hour_folders(camera, today);
    if (by_day.empty()) {
      LOG_INFO("No finished hour folders for {}", result.label);
    }

    std::size_t total_folders = 0;
    for (const auto &entry : by_day)
      total_folders += entry.second.size();
    LOG_INFO("{}: {} days, {} hour folders to check", result.label,
             by_day.size(), total_folders);

    for (const auto &entry : by_day)
      process_day(camera, entry.first, entry.second, ledger, result);
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Error processing camera {}: {}", result.label, e.what());
    result.success = false;
  }

  auto end = std::chrono::steady_clock::now();
  result.processing_time_us =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start)
          .count();

  LOG_INFO("Camera {} done in {}: {} hours merged, {} reused, {} days merged",
           result.label, format_time(result.processing_time_us / 1e6),
           result.hours_merged, result.hours_reused, result.days_merged);
  return result;
}

// **---- Day ----**

void CameraPipeline::process_day(const CameraFolder &camera,
                                 const std::string &day,
                                 const std::vector<std::string> &folders,
                                 Ledger &ledger, CameraResult &result) {
  fs::create_directories(layout_.merged_day_dir(day));

  DayKey day_key{camera.location, day};
  fs::path day_output = layout_.day_output(day_key);
  if (ledger.has_day(day_key) && valid(day_output)) {
    LOG_INFO("Day {} already merged for {}, skipping its hours", day,
             camera.location);
    ++result.days_skipped;
    return;
  }

  std::vector<std::string> hour_outputs;
  std::vector<std::string> merged_folders; //< Folders backing hour_outputs

  for (const auto &folder : folders) {
    auto hour_key = make_hour_key(camera.location, camera.camera_id, folder);
    if (!hour_key)
      continue;

    fs::path hour_output = layout_.hour_output(*hour_key);

    if (ledger.has_hour(*hour_key)) {
      if (valid(hour_output)) {
        LOG_INFO("Hour {} already merged, reusing {}", folder,
                 hour_output.filename().string());
        hour_outputs.push_back(hour_output.string());
        merged_folders.push_back(folder);
        ++result.hours_reused;
        continue;
      }
      LOG_WARN("Hour {} recorded but its output is missing or invalid, "
               "merging again",
               folder);
      ledger.forget_hour(*hour_key);
      persist(ledger);
    }

    auto videos = collect_hour_videos(camera.path / folder);
    if (videos.empty()) {
      LOG_INFO("No recordings in {}, skipping", folder);
      continue;
    }

    LOG_INFO("Merging {} recordings: {} -> {}", videos.size(), folder,
             hour_output.filename().string());
    if (engine_.merge(videos, hour_output.string(), false)) {
      ledger.record_hour(*hour_key, unix_now());
      persist(ledger);
      hour_outputs.push_back(hour_output.string());
      merged_folders.push_back(folder);
      ++result.hours_merged;
    } else {
      ++result.hours_failed;
    }
  }

  if (hour_outputs.empty()) {
    LOG_WARN("No hour videos for {} on {}, day merge skipped", camera.location,
             day);
    return;
  }

  if (merge_day(camera, day, merged_folders, std::move(hour_outputs), ledger))
    ++result.days_merged;
  else
    ++result.days_failed;
}

bool CameraPipeline::merge_day(const CameraFolder &camera,
                               const std::string &day,
                               const std::vector<std::string> &merged_folders,
                               std::vector<std::string> hour_outputs,
                               Ledger &ledger) {
  DayKey day_key{camera.location, day};
  fs::path day_output = layout_.day_output(day_key);

  std::error_code ec;
  fs::path temp = day_output;
  temp += ".temp.mp4";
  if (fs::remove(temp, ec)) {
    LOG_INFO("Removed stale temp file {}", temp.string());
  } else if (ec) {
    LOG_WARN("Failed to remove temp file {}: {}", temp.string(), ec.message());
  }

  if (ledger.has_day(day_key)) {
    if (valid(day_output)) {
      LOG_INFO("Day video already valid: {}", day_output.string());
      return true;
    }
    LOG_WARN("Day {} recorded but its output is missing or invalid, merging "
             "again",
             day);
    ledger.forget_day(day_key);
    persist(ledger);
  }

  std::sort(hour_outputs.begin(), hour_outputs.end());
  LOG_INFO("Merging day video ({} hours): {}", hour_outputs.size(), day);

  if (!engine_.merge(hour_outputs, day_output.string(), true))
    return false;

  double now = unix_now();
  ledger.record_day(day_key, now);
  /// Only folders with footage in the day video become retention candidates
  for (const auto &folder : merged_folders)
    ledger.record_original({camera.location, camera.camera_id, folder}, now);
  persist(ledger);

  log_day_video(day_output);

  if (!options_.save_hourly) {
    for (const auto &hv : hour_outputs) {
      if (fs::remove(hv, ec)) {
        LOG_INFO("Deleted hour video: {}", fs::path(hv).filename().string());
      } else if (ec) {
        LOG_ERROR("Failed to delete hour video {}: {}", hv, ec.message());
      }
    }
  }

  return true;
}

// **---- Helpers ----**

bool CameraPipeline::valid(const fs::path &output) {
  return is_valid_output(output, options_.min_valid_size_kb,
                         options_.deep_check, transcoder_);
}

void CameraPipeline::persist(const Ledger &ledger) {
  if (store_ && !store_->save(ledger))
    LOG_WARN("Ledger change kept in memory only until the next save");
}

void CameraPipeline::log_day_video(const fs::path &output) {
  auto info = probe_media(output.string());
  if (!info)
    return;

  std::error_code ec;
  auto size = fs::file_size(output, ec);
  if (info->video_codec.empty()) {
    LOG_INFO("Day video {}: {}, {}", output.filename().string(),
             format_time(info->duration_seconds),
             ec ? std::string("?") : format_size(size));
  } else {
    LOG_INFO("Day video {}: {}, {} {}x{}, {}", output.filename().string(),
             format_time(info->duration_seconds), info->video_codec,
             info->width, info->height,
             ec ? std::string("?") : format_size(size));
  }
}

} // namespace cam_merge
