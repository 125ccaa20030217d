/**
 * @file merge_engine.cpp
 * @brief Multi-strategy concatenation implementation
 */

#include "cam_merge/merge_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>
#include <utility>

#include <fmt/core.h>

#include "cam_merge/ffmpeg_executor.hpp"
#include "cam_merge/logging.hpp"
#include "cam_merge/validity.hpp"

namespace cam_merge {

namespace fs = std::filesystem;

namespace {

/**
 * @class ManifestFile
 * @brief RAII owner of a concat manifest on disk.
 * @note The file is removed on destruction, whatever the merge outcome.
 */
class ManifestFile {
public:
  explicit ManifestFile(std::string path) : path_(std::move(path)) {}
  ~ManifestFile() { remove(); }

  ManifestFile(const ManifestFile &) = delete;
  ManifestFile &operator=(const ManifestFile &) = delete;

  /// Write one "file '<path>'" line per input, in order
  bool write(const std::vector<std::string> &inputs) {
    std::ofstream out(path_, std::ios::trunc);
    if (!out)
      return false;
    for (const auto &input : inputs) {
      std::error_code ec;
      fs::path abs = fs::absolute(input, ec);
      out << "file '" << escape(ec ? input : abs.string()) << "'\n";
    }
    out.flush();
    return static_cast<bool>(out);
  }

  const std::string &path() const { return path_; }

private:
  /// Concat demuxer quoting: ' becomes '\''
  static std::string escape(const std::string &p) {
    std::string out;
    out.reserve(p.size());
    for (char c : p) {
      if (c == '\'')
        out += "'\\''";
      else
        out += c;
    }
    return out;
  }

  void remove() {
    std::error_code ec;
    fs::remove(path_, ec);
  }

  std::string path_;
};

std::string file_name(const std::string &path) {
  return fs::path(path).filename().string();
}

} // anonymous namespace

MergeEngine::MergeEngine(Transcoder &transcoder, MergeOptions options)
    : transcoder_(transcoder), options_(options) {
  options_.max_retries = std::max(1, options_.max_retries);
}

bool MergeEngine::merge(const std::vector<std::string> &inputs,
                        const std::string &output, bool is_daily) {
  if (inputs.empty()) {
    LOG_WARN("No input videos to merge into {}", output);
    return false;
  }

  try {
    std::error_code ec;
    fs::path parent = fs::path(output).parent_path();
    if (!parent.empty()) {
      fs::create_directories(parent, ec);
      if (ec) {
        LOG_ERROR("Cannot create output directory {}: {}", parent.string(),
                  ec.message());
        return false;
      }
    }

    return is_daily ? merge_daily(inputs, output) : merge_hourly(inputs, output);
  } catch (const std::exception &e) {
    LOG_ERROR("Merge aborted with exception for {}: {}", output, e.what());
    discard(output);
    return false;
  }
}

// **---- Hourly ----**

bool MergeEngine::merge_hourly(const std::vector<std::string> &inputs,
                               const std::string &output) {
  ManifestFile manifest(output + ".txt");
  if (!manifest.write(inputs)) {
    LOG_ERROR("Failed to write concat manifest: {}", manifest.path());
    return false;
  }

  for (int attempt = 0; attempt < options_.max_retries; ++attempt) {
    LOG_INFO("Merging hour video (attempt {}/{}): {} ({} files, timeout {}s)",
             attempt + 1, options_.max_retries, file_name(output),
             inputs.size(), options_.timeout.count());

    if (transcoder_.concat(manifest.path(), output, AudioMode::Aac,
                           options_.timeout) &&
        accept(output)) {
      LOG_SUCCESS("Hour video merged: {}", output);
      return true;
    }

    LOG_ERROR("Hour merge attempt {} failed: {}", attempt + 1, output);
    discard(output);

    if (attempt + 1 < options_.max_retries)
      pause_before_retry(attempt + 2);
  }

  LOG_ERROR("Hour merge gave up after {} attempts: {}", options_.max_retries,
            output);
  return false;
}

// **---- Daily ----**

bool MergeEngine::merge_daily(const std::vector<std::string> &inputs,
                              const std::string &output) {
  const auto timeout = options_.timeout * 2;
  LOG_INFO("Day merge timeout: {}s (2x the hourly timeout)", timeout.count());

  /// Stale leftovers from a killed run would be mistaken for output
  discard(output);

  std::optional<ManifestFile> manifest;
  if (inputs.size() > 1) {
    manifest.emplace(output + ".txt");
    if (!manifest->write(inputs)) {
      LOG_ERROR("Failed to write concat manifest: {}", manifest->path());
      manifest.reset();
    }
  }

  const bool can_concat = manifest.has_value();
  const bool single = inputs.size() == 1;

  if (single || can_concat) {
    for (int attempt = 0; attempt < options_.max_retries; ++attempt) {
      if (single) {
        LOG_INFO("Only one hour video, copying it as the day video: {} -> {}",
                 file_name(inputs[0]), file_name(output));
        if (copy_input(inputs[0], output) && accept(output)) {
          LOG_SUCCESS("Day video created (direct copy): {}", output);
          return true;
        }
        LOG_ERROR("Day video copy failed: {}", output);
        discard(output);
      } else {
        LOG_INFO("Merging day video (attempt {}/{}): {} ({} files)",
                 attempt + 1, options_.max_retries, file_name(output),
                 inputs.size());
        if (transcoder_.concat(manifest->path(), output, AudioMode::Copy,
                               timeout) &&
            accept(output)) {
          LOG_SUCCESS("Day video merged: {}", output);
          return true;
        }
        LOG_ERROR("Day merge failed (stream copy): {}", output);
        discard(output);

        if (attempt == 0) {
          LOG_INFO("Retrying day merge with AAC audio: {}", file_name(output));
          if (transcoder_.concat(manifest->path(), output, AudioMode::Aac,
                                 timeout) &&
              accept(output)) {
            LOG_SUCCESS("Day video merged (AAC audio): {}", output);
            return true;
          }
          LOG_ERROR("Day merge failed (AAC audio): {}", output);
          discard(output);
        }
      }

      if (attempt + 1 < options_.max_retries)
        pause_before_retry(attempt + 2);
    }
  }

  manifest.reset();
  LOG_ERROR("Day merge strategies exhausted after {} attempts: {}",
            options_.max_retries, output);

  LOG_WARN("Degraded fallback: using the first hour as the day video: {} -> {}",
           file_name(inputs[0]), file_name(output));
  if (copy_input(inputs[0], output) && accept(output)) {
    LOG_WARN("Day video created from degraded fallback, {} of {} hours "
             "missing: {}",
             inputs.size() - 1, inputs.size(), output);
    return true;
  }

  LOG_ERROR("Degraded fallback failed: {}", output);
  discard(output);
  return false;
}

// **---- Helpers ----**

bool MergeEngine::accept(const std::string &output) {
  if (is_valid_output(output, options_.min_valid_size_kb, options_.deep_check,
                      transcoder_)) {
    return true;
  }
  LOG_ERROR("Merged file missing, too small or unplayable: {}", output);
  return false;
}

void MergeEngine::discard(const std::string &output) {
  std::error_code ec;
  if (fs::remove(output, ec)) {
    LOG_INFO("Removed rejected output: {}", file_name(output));
  } else if (ec) {
    LOG_WARN("Failed to remove rejected output {}: {}", output, ec.message());
  }
}

bool MergeEngine::copy_input(const std::string &input,
                             const std::string &output) {
  std::error_code ec;
  fs::copy_file(input, output, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    LOG_ERROR("Copy failed {} -> {}: {}", input, output, ec.message());
    return false;
  }
  return true;
}

void MergeEngine::pause_before_retry(int next_attempt) {
  if (options_.retry_delay.count() <= 0)
    return;
  LOG_INFO("Waiting {}s before attempt {}", options_.retry_delay.count(),
           next_attempt);
  std::this_thread::sleep_for(options_.retry_delay);
}

} // namespace cam_merge
