/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Optional mirroring of every log line into a log file
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating pass durations
 *
 * @note All logs use fmt for type-safe formatting and are flushed
 *       immediately so they survive a watchdog-forced exit.
 */

#ifndef CAM_MERGE_LOGGING_HPP
#define CAM_MERGE_LOGGING_HPP

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace cam_merge {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Severity of a log line
enum class LogLevel { Info, Warn, Error, Phase, Success };

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Write one formatted line to stdout and the mirror file.
 * @note Prefixes a local timestamp and the level tag. Stdout gets color,
 *       the mirror file gets plain text.
 */
void log_write(LogLevel level, const std::string &message);

/**
 * @brief Mirror all subsequent log lines into a file (append mode).
 * @param path Log file path; empty disables mirroring
 * @return false if the file could not be opened
 */
bool set_log_file(const std::string &path);

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  cam_merge::log_write(cam_merge::LogLevel::Info,                              \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_WARN(format_str, ...)                                              \
  cam_merge::log_write(cam_merge::LogLevel::Warn,                              \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_ERROR(format_str, ...)                                             \
  cam_merge::log_write(cam_merge::LogLevel::Error,                             \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_PHASE(format_str, ...)                                             \
  cam_merge::log_write(cam_merge::LogLevel::Phase,                             \
                       fmt::format(format_str, ##__VA_ARGS__))

#define LOG_SUCCESS(format_str, ...)                                           \
  cam_merge::log_write(cam_merge::LogLevel::Success,                           \
                       fmt::format(format_str, ##__VA_ARGS__))
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the phase name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Camera or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting timing measurements.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  /**
   * @brief Record a timing measurement.
   * @param name Camera or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   *        Called at the end of every processing pass.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   * @note Called between passes.
   */
  static void clear();

  /// Number of recorded entries
  static size_t size();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    cam_merge::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace cam_merge

#endif // CAM_MERGE_LOGGING_HPP
