/**
 * @file config.cpp
 * @brief Environment-variable configuration implementation
 */

#include "cam_merge/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>

#include "cam_merge/logging.hpp"

namespace cam_merge {
namespace Config {

namespace {

std::string trim(const std::string &s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return (begin < end) ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

} // anonymous namespace

int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(val, &consumed);
  } catch (const std::exception &) {
    consumed = 0;
  }
  if (consumed == 0 || !trim(std::string(val).substr(consumed)).empty()) {
    throw std::invalid_argument(
        fmt::format("{} must be an integer, got '{}'", name, val));
  }
  return parsed;
}

bool get_env_bool(const char *name, bool default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;

  std::string v = to_lower(trim(val));
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  throw std::invalid_argument(
      fmt::format("{} must be a boolean, got '{}'", name, val));
}

std::set<std::string> parse_list(const std::string &csv) {
  std::set<std::string> items;
  size_t pos = 0;
  while (pos <= csv.size()) {
    size_t end = csv.find(',', pos);
    if (end == std::string::npos)
      end = csv.size();
    std::string item = trim(csv.substr(pos, end - pos));
    if (!item.empty())
      items.insert(item);
    pos = end + 1;
  }
  return items;
}

int load_env_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    return -1;

  int applied = 0;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#')
      continue;
    if (line.rfind("export ", 0) == 0)
      line = trim(line.substr(7));

    size_t eq = line.find('=');
    if (eq == std::string::npos || eq == 0) {
      LOG_WARN("Ignoring malformed line in {}: {}", path, line);
      continue;
    }

    std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }

    /// The real environment wins over the file
    if (std::getenv(key.c_str()))
      continue;
    if (setenv(key.c_str(), value.c_str(), 1) == 0)
      ++applied;
    else
      LOG_WARN("Cannot set {} from {}", key, path);
  }
  return applied;
}

MergerConfig load() {
  MergerConfig c;

  c.video_root = get_env_string("VIDEO_ROOT", c.video_root);
  c.merged_dir = get_env_string("MERGED_DIR", c.merged_dir);
  c.camera_source_dir = get_env_string("CAMERA_SOURCE_DIR", c.camera_source_dir);
  c.ledger_path = get_env_string("LEDGER_PATH", c.ledger_path);

  c.max_timeout = get_env_int("MAX_TIMEOUT", c.max_timeout);
  c.max_retries = std::max(1, get_env_int("MAX_RETRIES", c.max_retries));
  c.retry_delay = std::max(0, get_env_int("RETRY_DELAY", c.retry_delay));
  c.scan_interval = std::max(0, get_env_int("SCAN_INTERVAL", c.scan_interval));
  c.error_cooldown =
      std::max(0, get_env_int("ERROR_COOLDOWN", c.error_cooldown));
  c.min_valid_size_kb = static_cast<std::uint64_t>(std::max(
      0, get_env_int("MIN_VALID_SIZE",
                     static_cast<int>(c.min_valid_size_kb))));

  c.save_hourly = get_env_bool("SAVE_HOURLY", c.save_hourly);
  c.deep_check = get_env_bool("DEEP_CHECK", c.deep_check);

  c.delete_original_after_days =
      get_env_int("DELETE_ORIGINAL_AFTER_DAYS", c.delete_original_after_days);
  c.delete_merged_after_days =
      get_env_int("DELETE_MERGED_AFTER_DAYS", c.delete_merged_after_days);

  c.required_locations = parse_list(get_env_string("REQUIRED_LOCATIONS", ""));
  c.min_current_day_files =
      std::max(0, get_env_int("MIN_CURRENT_DAY_FILES", c.min_current_day_files));

  c.ffmpeg_bin = get_env_string("FFMPEG_BIN", c.ffmpeg_bin);
  c.ffprobe_bin = get_env_string("FFPROBE_BIN", c.ffprobe_bin);
  c.log_file = get_env_string("LOG_FILE", c.log_file);

  if (c.max_timeout <= 0) {
    throw std::invalid_argument(
        fmt::format("MAX_TIMEOUT must be positive, got {}", c.max_timeout));
  }
  return c;
}

void log_config(const MergerConfig &c) {
  std::string required;
  for (const auto &loc : c.required_locations) {
    if (!required.empty())
      required += ",";
    required += loc;
  }

  LOG_INFO("Configuration:");
  LOG_INFO("  video_root                 = {}", c.video_root);
  LOG_INFO("  merged_dir                 = {}", c.merged_dir);
  LOG_INFO("  camera_source_dir          = {}", c.camera_source_dir);
  LOG_INFO("  ledger_path                = {}", c.ledger_path);
  LOG_INFO("  max_timeout                = {}s", c.max_timeout);
  LOG_INFO("  max_retries                = {}", c.max_retries);
  LOG_INFO("  retry_delay                = {}s", c.retry_delay);
  LOG_INFO("  scan_interval              = {}s", c.scan_interval);
  LOG_INFO("  min_valid_size             = {}KB", c.min_valid_size_kb);
  LOG_INFO("  save_hourly                = {}", c.save_hourly);
  LOG_INFO("  deep_check                 = {}", c.deep_check);
  LOG_INFO("  delete_original_after_days = {}", c.delete_original_after_days);
  LOG_INFO("  delete_merged_after_days   = {}", c.delete_merged_after_days);
  LOG_INFO("  required_locations         = {}",
           required.empty() ? "(all discovered)" : required);
  LOG_INFO("  min_current_day_files      = {}", c.min_current_day_files);
}

} // namespace Config
} // namespace cam_merge
