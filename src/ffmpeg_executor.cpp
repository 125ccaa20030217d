/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "cam_merge/ffmpeg_executor.hpp"

#include <utility>

#include <fmt/core.h>

#include "cam_merge/logging.hpp"
#include "cam_merge/subprocess.hpp"

namespace cam_merge {

FfmpegExecutor::FfmpegExecutor(std::string ffmpeg_bin, std::string ffprobe_bin)
    : ffmpeg_bin_(std::move(ffmpeg_bin)), ffprobe_bin_(std::move(ffprobe_bin)) {}

std::vector<std::string>
FfmpegExecutor::concat_command(const std::string &manifest_path,
                               const std::string &output_path,
                               AudioMode audio) const {
  std::vector<std::string> cmd = {ffmpeg_bin_, "-hide_banner", "-loglevel",
                                  "error",     "-y",           "-f",
                                  "concat",    "-safe",        "0",
                                  "-i",        manifest_path,  "-c:v",
                                  "copy"};
  if (audio == AudioMode::Copy) {
    cmd.insert(cmd.end(), {"-c:a", "copy"});
  } else {
    /// Older builds gate the native AAC encoder behind -strict
    cmd.insert(cmd.end(), {"-c:a", "aac", "-strict", "experimental"});
  }
  cmd.insert(cmd.end(), {"-movflags", "+faststart", output_path});
  return cmd;
}

bool FfmpegExecutor::concat(const std::string &manifest_path,
                            const std::string &output_path, AudioMode audio,
                            std::chrono::seconds timeout) {
  auto cmd = concat_command(manifest_path, output_path, audio);
  return run_with_timeout(cmd, timeout);
}

bool FfmpegExecutor::probe(const std::string &path,
                           std::chrono::seconds timeout) {
  ProcessResult r = run_process({ffprobe_bin_, "-v", "quiet", "-print_format",
                                 "json", "-show_format", path},
                                timeout);
  if (!r.started) {
    LOG_WARN("ffprobe could not start: {}", r.stderr_output);
    return false;
  }
  if (r.timed_out) {
    LOG_WARN("ffprobe timed out after {}s: {}", timeout.count(), path);
    return false;
  }
  return r.exit_code == 0;
}

bool FfmpegExecutor::available() const {
  ProcessResult r =
      run_process({ffmpeg_bin_, "-version"}, std::chrono::seconds(30));
  return r.ok();
}

} // namespace cam_merge
