/**
 * @file media_info.hpp
 * @brief In-process container inspection via libavformat
 *
 * @details Reads the container header of a finished day video to report its
 *          duration and video stream. Used for logging only; acceptance of
 *          outputs is decided by the validity gate.
 */

#ifndef CAM_MERGE_MEDIA_INFO_HPP
#define CAM_MERGE_MEDIA_INFO_HPP

#include <optional>
#include <string>

namespace cam_merge {

/**
 * @struct MediaSummary
 * @brief Container-level facts about a video file.
 */
struct MediaSummary {
  double duration_seconds = 0.0;
  std::string video_codec; //< Empty when there is no video stream
  int width = 0;
  int height = 0;
};

/**
 * @brief Restrict libav* internal logging to errors.
 * @note Call once at startup so probing does not flood stdout.
 */
void quiet_libav_logging();

/**
 * @brief Open @p path and read its container header.
 * @return nullopt if the file cannot be opened or has no known duration
 */
std::optional<MediaSummary> probe_media(const std::string &path);

} // namespace cam_merge

#endif // CAM_MERGE_MEDIA_INFO_HPP
