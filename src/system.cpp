/**
 * @file system.cpp
 * @brief Clock and formatting utilities implementation
 */

#include "cam_merge/system.hpp"

#include <chrono>

#include <fmt/core.h>

namespace cam_merge {

// **---- Clock ----**

double unix_now() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

std::string local_day_string(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  return fmt::format("{:04d}{:02d}{:02d}", tm.tm_year + 1900, tm.tm_mon + 1,
                     tm.tm_mday);
}

std::string local_timestamp(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_size(std::uintmax_t bytes) {
  double value = static_cast<double>(bytes);
  if (value >= 1024.0 * 1024.0 * 1024.0)
    return fmt::format("{:.2f}GB", value / (1024.0 * 1024.0 * 1024.0));
  if (value >= 1024.0 * 1024.0)
    return fmt::format("{:.1f}MB", value / (1024.0 * 1024.0));
  return fmt::format("{:.1f}KB", value / 1024.0);
}

} // namespace cam_merge
