/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with typed environment readers and a
 *          MergerConfig value assembled from them. An optional env file
 *          (KEY=VALUE lines) can pre-seed variables that are not already set.
 *          See config/cam_merge.env for detailed documentation of each
 *          parameter.
 */

#ifndef CAM_MERGE_CONFIG_HPP
#define CAM_MERGE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <set>
#include <string>

namespace cam_merge {

/**
 * @struct MergerConfig
 * @brief Every tunable of the merge daemon.
 */
struct MergerConfig {
  std::string video_root = "/data/videos";
  std::string merged_dir = "merged_videos";
  std::string camera_source_dir = "xiaomi_camera_videos";
  std::string ledger_path = "processed.json";

  int max_timeout = 1800;   //< Per-merge timeout (s); daily merges use 2x
  int max_retries = 3;      //< Attempts per merge
  int retry_delay = 5;      //< Pause between attempts (s)
  int scan_interval = 600;  //< Pause between passes (s)
  int error_cooldown = 60;  //< Pause after an unexpected error (s)
  std::uint64_t min_valid_size_kb = 1024;

  bool save_hourly = false; //< Keep hour outputs after the day merge
  bool deep_check = false;  //< Probe outputs with ffprobe

  int delete_original_after_days = 1; //< <= 0 disables
  int delete_merged_after_days = 1;   //< <= 0 disables

  /// Locations that must show current-day footage; empty = all discovered
  std::set<std::string> required_locations;
  int min_current_day_files = 5;

  std::string ffmpeg_bin = "ffmpeg";
  std::string ffprobe_bin = "ffprobe";
  std::string log_file; //< Empty = stdout only
};

namespace Config {

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 * @throws std::invalid_argument naming the variable if it is not a number
 */
int get_env_int(const char *name, int default_val);

/**
 * @brief Get a boolean value from environment variable.
 * @note Accepts 1/0, true/false, yes/no, on/off (case-insensitive).
 */
bool get_env_bool(const char *name, bool default_val);

/// Get a string value from environment variable (empty counts as unset)
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Parse a comma-separated list, trimming blanks around items.
 */
std::set<std::string> parse_list(const std::string &csv);

/**
 * @brief Seed the environment from a KEY=VALUE file.
 *
 * @note Blank lines and lines starting with '#' are ignored. Surrounding
 *       quotes on values are stripped. Variables already present in the
 *       environment are left untouched.
 *
 * @param path Path to the env file
 * @return Number of variables applied, or -1 if the file cannot be read
 */
int load_env_file(const std::string &path);

/**
 * @brief Build a MergerConfig from the current environment.
 * @throws std::invalid_argument on malformed numeric values
 */
MergerConfig load();

/**
 * @brief Log the effective configuration, one key per line.
 */
void log_config(const MergerConfig &config);

} // namespace Config
} // namespace cam_merge

#endif // CAM_MERGE_CONFIG_HPP
