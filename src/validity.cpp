/**
 * @file validity.cpp
 * @brief Merge output acceptance gate implementation
 */

#include "cam_merge/validity.hpp"

#include <system_error>

#include "cam_merge/ffmpeg_executor.hpp"
#include "cam_merge/logging.hpp"
#include "cam_merge/types.hpp"

namespace cam_merge {

namespace fs = std::filesystem;

bool is_valid_output(const fs::path &path, std::uint64_t min_size_kb, bool deep,
                     Transcoder &transcoder) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return false;

  auto size = fs::file_size(path, ec);
  if (ec) {
    LOG_WARN("Cannot read size of {}: {}", path.string(), ec.message());
    return false;
  }

  double size_kb = static_cast<double>(size) / 1024.0;
  if (size_kb < static_cast<double>(min_size_kb)) {
    LOG_WARN("File too small ({:.2f}KB < {}KB): {}", size_kb, min_size_kb,
             path.string());
    return false;
  }

  if (deep && !transcoder.probe(path.string(), PROBE_TIMEOUT)) {
    LOG_WARN("File failed playability probe: {}", path.string());
    return false;
  }

  return true;
}

} // namespace cam_merge
