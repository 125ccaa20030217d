/**
 * @file scanner.hpp
 * @brief Camera discovery and hour-folder grouping
 *
 * @details Walks <root>/<location>/<source_dir>/<camera_id>/ to find cameras,
 *          groups their YYYYMMDDHH folders by day, and decides which
 *          locations are "ready" (the cameras are evidently recording today).
 */

#ifndef CAM_MERGE_SCANNER_HPP
#define CAM_MERGE_SCANNER_HPP

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "layout.hpp"
#include "types.hpp"

namespace cam_merge {

/**
 * @brief Discover every camera source tree under the layout root.
 *
 * @note Creates the merged-output directory if missing. Locations are the
 *       root's subdirectories except the merged directory; a location
 *       without a source directory has no cameras.
 *
 * @return Cameras sorted by (location, camera_id); empty (logged) on any
 *         filesystem error
 */
std::vector<CameraFolder> scan_cameras(const StorageLayout &layout);

/**
 * @brief Group a camera's hour folders by day.
 * @param today YYYYMMDD of the current local day, which is left out
 * @return day -> sorted hour folder names
 */
std::map<std::string, std::vector<std::string>>
group_hour_folders(const CameraFolder &camera, const std::string &today);

/**
 * @brief Recordings of one hour folder: *.mp4 and *.mp4.old, sorted by name.
 */
std::vector<std::string> collect_hour_videos(const std::filesystem::path &dir);

/**
 * @brief Locations where some camera has a today* hour folder holding at
 *        least @p min_files entries.
 */
std::set<std::string>
locations_with_current_footage(const std::vector<CameraFolder> &cameras,
                               const std::string &today, int min_files);

/// Required locations that are not in @p ready, in sorted order
std::vector<std::string> missing_locations(const std::set<std::string> &required,
                                           const std::set<std::string> &ready);

/// Distinct locations of @p cameras
std::set<std::string> camera_locations(const std::vector<CameraFolder> &cameras);

} // namespace cam_merge

#endif // CAM_MERGE_SCANNER_HPP
