/**
 * @file scanner.cpp
 * @brief Camera discovery implementation
 */

#include "cam_merge/scanner.hpp"

#include <algorithm>
#include <iterator>
#include <system_error>

#include "cam_merge/logging.hpp"
#include "cam_merge/naming.hpp"

namespace cam_merge {

namespace fs = std::filesystem;

namespace {

bool ends_with(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> sorted_subdirectories(const fs::path &dir) {
  std::vector<std::string> names;
  for (const auto &entry : fs::directory_iterator(dir)) {
    if (entry.is_directory())
      names.push_back(entry.path().filename().string());
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // anonymous namespace

std::vector<CameraFolder> scan_cameras(const StorageLayout &layout) {
  std::vector<CameraFolder> cameras;

  try {
    fs::create_directories(layout.merged_root());

    for (const auto &location : sorted_subdirectories(layout.root())) {
      if (location == layout.merged_dir_name())
        continue;

      if (!is_key_segment(location)) {
        LOG_WARN("Skipping location with an unusable name: {}",
                 (layout.root() / location).string());
        continue;
      }

      fs::path source = layout.root() / location / layout.source_dir_name();
      if (!fs::is_directory(source))
        continue;

      for (const auto &camera_id : sorted_subdirectories(source)) {
        if (!is_key_segment(camera_id)) {
          LOG_WARN("Skipping camera with an unusable name: {}",
                   (source / camera_id).string());
          continue;
        }
        cameras.push_back(
            {location, camera_id, layout.camera_dir(location, camera_id)});
      }
    }
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Camera scan failed under {}: {}", layout.root().string(),
              e.what());
    return {};
  }

  LOG_INFO("Found {} camera folders under {}", cameras.size(),
           layout.root().string());
  return cameras;
}

std::map<std::string, std::vector<std::string>>
group_hour_folders(const CameraFolder &camera, const std::string &today) {
  std::map<std::string, std::vector<std::string>> by_day;

  try {
    for (const auto &name : sorted_subdirectories(camera.path)) {
      if (!is_hour_folder(name))
        continue;
      std::string day = name.substr(0, 8);
      if (day == today)
        continue;
      by_day[day].push_back(name);
    }
  } catch (const fs::filesystem_error &e) {
    LOG_ERROR("Cannot list hour folders of {}: {}", camera.path.string(),
              e.what());
    return {};
  }

  return by_day;
}

std::vector<std::string> collect_hour_videos(const fs::path &dir) {
  std::vector<std::string> videos;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec))
      continue;
    std::string name = it->path().filename().string();
    if (ends_with(name, ".mp4") || ends_with(name, ".mp4.old"))
      videos.push_back(it->path().string());
  }
  if (ec)
    LOG_WARN("Error listing recordings in {}: {}", dir.string(), ec.message());

  std::sort(videos.begin(), videos.end());
  return videos;
}

std::set<std::string>
locations_with_current_footage(const std::vector<CameraFolder> &cameras,
                               const std::string &today, int min_files) {
  std::set<std::string> ready;

  for (const auto &camera : cameras) {
    if (ready.count(camera.location))
      continue;

    std::error_code ec;
    for (fs::directory_iterator it(camera.path, ec), end; !ec && it != end;
         it.increment(ec)) {
      std::string name = it->path().filename().string();
      std::error_code type_ec;
      if (!it->is_directory(type_ec) || name.compare(0, today.size(), today) != 0)
        continue;

      int count = 0;
      std::error_code count_ec;
      for (fs::directory_iterator f(it->path(), count_ec), fend;
           !count_ec && f != fend; f.increment(count_ec)) {
        ++count;
      }
      if (count >= min_files) {
        ready.insert(camera.location);
        break;
      }
    }
  }

  return ready;
}

std::vector<std::string> missing_locations(const std::set<std::string> &required,
                                           const std::set<std::string> &ready) {
  std::vector<std::string> missing;
  std::set_difference(required.begin(), required.end(), ready.begin(),
                      ready.end(), std::back_inserter(missing));
  return missing;
}

std::set<std::string> camera_locations(const std::vector<CameraFolder> &cameras) {
  std::set<std::string> locations;
  for (const auto &camera : cameras)
    locations.insert(camera.location);
  return locations;
}

} // namespace cam_merge
