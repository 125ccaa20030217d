/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides:
 *          - Global log mutex and the log line writer
 *
 *          - Log file mirroring
 *
 *          - TimingCollector static members and methods
 */

#include "cam_merge/logging.hpp"

#include <cstdio>
#include <ctime>

#include <fmt/color.h>
#include <fmt/core.h>

#include "cam_merge/system.hpp"

namespace cam_merge {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

namespace {

/// Mirror file, guarded by log_mutex
std::FILE *log_file_handle = nullptr;

const char *level_tag(LogLevel level) {
  switch (level) {
  case LogLevel::Warn:
    return "[WARN]";
  case LogLevel::Error:
    return "[ERROR]";
  case LogLevel::Phase:
  case LogLevel::Success:
  case LogLevel::Info:
  default:
    return "[INFO]";
  }
}

fmt::text_style level_style(LogLevel level) {
  switch (level) {
  case LogLevel::Warn:
    return fg(fmt::color::yellow);
  case LogLevel::Error:
    return fg(fmt::color::red);
  case LogLevel::Phase:
    return fg(fmt::color::cyan);
  case LogLevel::Success:
    return fg(fmt::color::green);
  case LogLevel::Info:
  default:
    return fmt::text_style();
  }
}

} // anonymous namespace

void log_write(LogLevel level, const std::string &message) {
  std::string stamp = local_timestamp(std::time(nullptr));

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(level_style(level), "{} {} {}\n", stamp, level_tag(level),
             message);
  std::fflush(stdout);

  if (log_file_handle) {
    fmt::print(log_file_handle, "{} {} {}\n", stamp, level_tag(level),
               message);
    std::fflush(log_file_handle);
  }
}

bool set_log_file(const std::string &path) {
  std::lock_guard<std::mutex> lock(log_mutex);
  if (log_file_handle) {
    std::fclose(log_file_handle);
    log_file_handle = nullptr;
  }
  if (path.empty())
    return true;

  log_file_handle = std::fopen(path.c_str(), "a");
  return log_file_handle != nullptr;
}

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Camera / phase", "Time [hh:mm:ss]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>20}\n", e.name, format_time(seconds));
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

size_t TimingCollector::size() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

} // namespace cam_merge
