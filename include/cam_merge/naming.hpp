/**
 * @file naming.hpp
 * @brief Folder-name parsing and ledger key codec
 *
 * @details Camera firmware names its recording folders YYYYMMDDHH (one per
 *          hour); merged outputs are grouped per YYYYMMDD day. This module
 *          is the single definition of:
 *
 *          - parsing those names into typed bucket times
 *
 *          - the structured ledger keys and their canonical strings
 *
 *          - the output file names of hour and day merges
 *
 * @attention KEY GRAMMAR:
 *
 *   - HourKey:           <location>/<camera_id>/<YYYYMMDDHH>
 *
 *   - DayKey:            <location>_<YYYYMMDD>
 *
 *   - OriginalFolderKey: original/<location>/<camera_id>/<YYYYMMDDHH>
 *
 *   Location and camera ids are directory names and can never contain '/'.
 *   They must be valid UTF-8.
 *   A day key is split at its last '_', so locations may contain '_'.
 *   Anything that does not match exactly is rejected.
 */

#ifndef CAM_MERGE_NAMING_HPP
#define CAM_MERGE_NAMING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cam_merge {

/**
 * @struct BucketTime
 * @brief Calendar time encoded by a folder name.
 */
struct BucketTime {
  int year = 0;
  int month = 0;
  int day = 0;
  std::optional<int> hour; //< Present for YYYYMMDDHH names only
};

/**
 * @brief Parse an 8-digit (YYYYMMDD) or 10-digit (YYYYMMDDHH) name.
 * @return The bucket time, or nullopt if the name is not exactly 8 or 10
 *         digits or does not denote a real calendar date and hour.
 */
std::optional<BucketTime> parse_folder_date(std::string_view name);

/// True for a valid 10-digit hour folder name
bool is_hour_folder(std::string_view name);

/// True for a valid 8-digit day name
bool is_day_name(std::string_view name);

/**
 * @brief True for a location or camera name that can appear in a key.
 * @note Rejects empty names, "." and "..", '/' and NUL, and anything that is
 *       not well-formed UTF-8 (the ledger file is JSON).
 */
bool is_key_segment(std::string_view name);

// **----- LEDGER KEYS -----**

/// Completed hour merge of one camera
struct HourKey {
  std::string location;
  std::string camera_id;
  std::string day;  //< YYYYMMDD
  std::string hour; //< HH

  /// Source folder name YYYYMMDDHH
  std::string folder() const { return day + hour; }

  bool operator==(const HourKey &o) const {
    return location == o.location && camera_id == o.camera_id &&
           day == o.day && hour == o.hour;
  }
};

/// Completed day merge of one location
struct DayKey {
  std::string location;
  std::string day; //< YYYYMMDD

  bool operator==(const DayKey &o) const {
    return location == o.location && day == o.day;
  }
};

/// Original hour folder whose footage is covered by a day merge
struct OriginalFolderKey {
  std::string location;
  std::string camera_id;
  std::string folder; //< YYYYMMDDHH

  bool operator==(const OriginalFolderKey &o) const {
    return location == o.location && camera_id == o.camera_id &&
           folder == o.folder;
  }
};

using LedgerKey = std::variant<HourKey, DayKey, OriginalFolderKey>;

/**
 * @brief Build an HourKey from a camera and its hour folder name.
 * @return nullopt if the folder name is not a valid hour folder
 */
std::optional<HourKey> make_hour_key(const std::string &location,
                                     const std::string &camera_id,
                                     const std::string &hour_folder);

/// Canonical string of a key
std::string to_string(const HourKey &key);
std::string to_string(const DayKey &key);
std::string to_string(const OriginalFolderKey &key);
std::string to_string(const LedgerKey &key);

/**
 * @brief Parse a canonical key string.
 * @return The typed key, or nullopt for malformed or ambiguous strings
 */
std::optional<LedgerKey> parse_ledger_key(std::string_view text);

/// Parse helpers that also require the expected kind
std::optional<HourKey> parse_hour_key(std::string_view text);
std::optional<DayKey> parse_day_key(std::string_view text);
std::optional<OriginalFolderKey> parse_original_key(std::string_view text);

// **----- OUTPUT NAMES -----**

/// "<day>_<location>_<hour>.mp4"
std::string hour_output_name(const std::string &day,
                             const std::string &location,
                             const std::string &hour);

/// "<day>_<location>.mp4"
std::string day_output_name(const std::string &day,
                            const std::string &location);

} // namespace cam_merge

#endif // CAM_MERGE_NAMING_HPP
