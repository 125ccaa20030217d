/**
 * @file system.hpp
 * @brief Clock and formatting utilities
 *
 * @details Provides:
 *
 *          - Wall-clock helpers (Unix time, local calendar day)
 *
 *          - Time and size formatting for log output
 *
 * @note Calendar days are computed in local time, matching the camera
 *       firmware which names its hour folders in local time.
 */

#ifndef CAM_MERGE_SYSTEM_HPP
#define CAM_MERGE_SYSTEM_HPP

#include <cstdint>
#include <ctime>
#include <string>

namespace cam_merge {

// **---- Clock ----**

/**
 * @brief Current Unix time in seconds, with sub-second precision.
 */
double unix_now();

/**
 * @brief Local calendar day of a Unix time as YYYYMMDD.
 * @param t Unix time in seconds
 * @return 8-digit day string
 */
std::string local_day_string(std::time_t t);

/**
 * @brief Local timestamp "YYYY-MM-DD HH:MM:SS" for log prefixes.
 */
std::string local_timestamp(std::time_t t);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

/**
 * @brief Format a byte count as a human-readable size (KB/MB/GB).
 */
std::string format_size(std::uintmax_t bytes);

} // namespace cam_merge

#endif // CAM_MERGE_SYSTEM_HPP
