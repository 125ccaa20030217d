/**
 * @file ffmpeg_executor.hpp
 * @brief External transcoder operations (concat, probe)
 *
 * @details The merge pipeline never decodes media itself. It asks a
 *          Transcoder to:
 *
 *          - concatenate the files listed in a concat manifest into one
 *            output, choosing stream-copy or AAC re-encode for audio
 *
 *          - probe a file for container integrity
 *
 *          FfmpegExecutor implements both with the ffmpeg/ffprobe binaries;
 *          tests substitute their own Transcoder.
 */

#ifndef CAM_MERGE_FFMPEG_EXECUTOR_HPP
#define CAM_MERGE_FFMPEG_EXECUTOR_HPP

#include <chrono>
#include <string>
#include <vector>

namespace cam_merge {

/// How the audio track is carried into a concatenated output
enum class AudioMode {
  Copy, //< Stream-copy the source audio
  Aac   //< Re-encode audio to AAC (splices heterogeneous sources)
};

/**
 * @class Transcoder
 * @brief Abstract external transcoder.
 */
class Transcoder {
public:
  virtual ~Transcoder() = default;

  /**
   * @brief Concatenate the manifest's inputs into @p output_path.
   *
   * @param manifest_path Concat manifest ("file '<path>'" lines)
   * @param output_path Output file (overwritten)
   * @param audio Audio handling; video is always stream-copied
   * @param timeout Total time budget for the operation
   * @return true if the transcoder reported success
   */
  virtual bool concat(const std::string &manifest_path,
                      const std::string &output_path, AudioMode audio,
                      std::chrono::seconds timeout) = 0;

  /**
   * @brief Probe @p path for a readable container.
   * @return false on non-zero exit, timeout, or failure to start
   */
  virtual bool probe(const std::string &path, std::chrono::seconds timeout) = 0;
};

/**
 * @class FfmpegExecutor
 * @brief Transcoder backed by the ffmpeg and ffprobe executables.
 */
class FfmpegExecutor : public Transcoder {
public:
  FfmpegExecutor(std::string ffmpeg_bin = "ffmpeg",
                 std::string ffprobe_bin = "ffprobe");

  bool concat(const std::string &manifest_path, const std::string &output_path,
              AudioMode audio, std::chrono::seconds timeout) override;

  bool probe(const std::string &path, std::chrono::seconds timeout) override;

  /**
   * @brief Check that the ffmpeg binary can be executed.
   * @return true if `ffmpeg -version` exits with status 0
   */
  bool available() const;

  /// Argument vector of a concat invocation (exposed for logging and tests)
  std::vector<std::string> concat_command(const std::string &manifest_path,
                                          const std::string &output_path,
                                          AudioMode audio) const;

private:
  std::string ffmpeg_bin_;
  std::string ffprobe_bin_;
};

} // namespace cam_merge

#endif // CAM_MERGE_FFMPEG_EXECUTOR_HPP
