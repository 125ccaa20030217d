/**
 * @file types.hpp
 * @brief Core data types and constants for cam_merge
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Fixed timing constants for subprocesses and sleeps
 *
 *          - CameraFolder for discovered camera source trees
 *
 *          - CameraResult for per-camera pass statistics
 */

#ifndef CAM_MERGE_TYPES_HPP
#define CAM_MERGE_TYPES_HPP

#include <chrono>
#include <filesystem>
#include <string>

namespace cam_merge {

// **----- CONSTANTS -----**

/**
 * @brief Longest a single blocking subprocess call may run.
 * @note A configured timeout above this ceiling is served by a second
 *       invocation for the remainder.
 */
constexpr std::chrono::seconds SUBPROCESS_SLICE_CEILING{600};

/// Hard timeout of the deep playability probe
constexpr std::chrono::seconds PROBE_TIMEOUT{30};

/// Longest uninterrupted sleep between two watchdog resets
constexpr std::chrono::seconds SLEEP_SLICE{30};

/// Seconds in one retention day
constexpr double SECONDS_PER_DAY = 86400.0;

// **----- DATA STRUCTURES -----**

/**
 * @struct CameraFolder
 * @brief One camera source tree: <root>/<location>/<source_dir>/<camera_id>.
 * @note Discovered fresh on every scan, never persisted.
 */
struct CameraFolder {
  std::string location;       //< Location directory name
  std::string camera_id;      //< Camera directory name
  std::filesystem::path path; //< Absolute camera directory
};

/**
 * @struct CameraResult
 * @brief Outcome of one camera pass.
 */
struct CameraResult {
  std::string label;       //< "location/camera_id"
  bool success = true;     //< False when the pass aborted with an error
  int hours_merged = 0;    //< Hour buckets merged in this pass
  int hours_reused = 0;    //< Hour buckets already valid on disk
  int hours_failed = 0;    //< Hour buckets whose merge failed
  int days_merged = 0;     //< Day buckets merged in this pass
  int days_skipped = 0;    //< Day buckets already complete
  int days_failed = 0;     //< Day buckets whose merge failed
  long processing_time_us = 0;
};

} // namespace cam_merge

#endif // CAM_MERGE_TYPES_HPP
