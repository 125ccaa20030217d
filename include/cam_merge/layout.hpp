/**
 * @file layout.hpp
 * @brief On-disk layout of source footage and merged outputs
 *
 * @details Every path the daemon reads, writes or deletes is derived here
 *          from a typed key, so the camera pipeline, the reconciliation pass
 *          and the retention engine always agree on where an artifact lives.
 *
 * @attention TREE:
 *
 *   <root>/<location>/<source_dir>/<camera_id>/<YYYYMMDDHH>/*.mp4
 *
 *   <root>/<merged_dir>/<YYYYMMDD>/<YYYYMMDD>_<location>_<HH>.mp4
 *
 *   <root>/<merged_dir>/<YYYYMMDD>/<YYYYMMDD>_<location>.mp4
 */

#ifndef CAM_MERGE_LAYOUT_HPP
#define CAM_MERGE_LAYOUT_HPP

#include <filesystem>
#include <string>
#include <utility>

#include "naming.hpp"

namespace cam_merge {

class StorageLayout {
public:
  StorageLayout(std::filesystem::path root, std::string merged_dir,
                std::string source_dir)
      : root_(std::move(root)), merged_dir_(std::move(merged_dir)),
        source_dir_(std::move(source_dir)) {}

  const std::filesystem::path &root() const { return root_; }
  const std::string &merged_dir_name() const { return merged_dir_; }
  const std::string &source_dir_name() const { return source_dir_; }

  /// <root>/<merged_dir>
  std::filesystem::path merged_root() const { return root_ / merged_dir_; }

  /// <root>/<merged_dir>/<day>
  std::filesystem::path merged_day_dir(const std::string &day) const {
    return merged_root() / day;
  }

  /// <root>/<location>/<source_dir>/<camera_id>
  std::filesystem::path camera_dir(const std::string &location,
                                   const std::string &camera_id) const {
    return root_ / location / source_dir_ / camera_id;
  }

  std::filesystem::path hour_output(const HourKey &key) const {
    return merged_day_dir(key.day) /
           hour_output_name(key.day, key.location, key.hour);
  }

  std::filesystem::path day_output(const DayKey &key) const {
    return merged_day_dir(key.day) / day_output_name(key.day, key.location);
  }

  std::filesystem::path original_folder(const OriginalFolderKey &key) const {
    return camera_dir(key.location, key.camera_id) / key.folder;
  }

private:
  std::filesystem::path root_;
  std::string merged_dir_;
  std::string source_dir_;
};

} // namespace cam_merge

#endif // CAM_MERGE_LAYOUT_HPP
