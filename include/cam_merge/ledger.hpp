/**
 * @file ledger.hpp
 * @brief Idempotency ledger and its JSON persistence
 *
 * @details The ledger records which hour and day merges completed and when
 *          each artifact was produced. It is a cache over the filesystem:
 *          a recorded key only counts once its output passes the validity
 *          gate again (see reconciler.hpp).
 *
 * @attention FILE FORMAT:
 *
 *   {"hours": [...], "days": [...], "merge_timestamps": {"<key>": <unix s>}}
 *
 *   Saved to <path>.tmp and renamed over <path>, so readers never see a
 *   partial file.
 */

#ifndef CAM_MERGE_LEDGER_HPP
#define CAM_MERGE_LEDGER_HPP

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

#include "naming.hpp"

namespace cam_merge {

/**
 * @struct Ledger
 * @brief In-memory ledger state, passed by reference to its mutators.
 */
struct Ledger {
  std::set<std::string> hours;                     //< Serialized HourKeys
  std::set<std::string> days;                      //< Serialized DayKeys
  std::map<std::string, double> merge_timestamps; //< Key -> Unix seconds

  bool has_hour(const HourKey &key) const {
    return hours.count(to_string(key)) > 0;
  }
  bool has_day(const DayKey &key) const {
    return days.count(to_string(key)) > 0;
  }

  void record_hour(const HourKey &key, double now) {
    auto s = to_string(key);
    hours.insert(s);
    merge_timestamps[s] = now;
  }
  void record_day(const DayKey &key, double now) {
    auto s = to_string(key);
    days.insert(s);
    merge_timestamps[s] = now;
  }
  void record_original(const OriginalFolderKey &key, double now) {
    merge_timestamps[to_string(key)] = now;
  }

  /// Drop a completion entry; its timestamp is kept for retention
  void forget_hour(const HourKey &key) { hours.erase(to_string(key)); }
  void forget_day(const DayKey &key) { days.erase(to_string(key)); }

  /// Timestamp of @p key, nullopt when unknown
  std::optional<double> timestamp(const std::string &key) const {
    auto it = merge_timestamps.find(key);
    if (it == merge_timestamps.end())
      return std::nullopt;
    return it->second;
  }
};

class LedgerStore {
public:
  explicit LedgerStore(std::string path) : path_(std::move(path)) {}

  /**
   * @brief Read the ledger file.
   * @note A missing file yields an empty ledger. Unreadable or malformed
   *       content is logged at error level and also yields an empty ledger.
   */
  Ledger load() const;

  /**
   * @brief Atomically replace the ledger file with @p ledger.
   * @return false (logged) if writing or renaming failed
   */
  bool save(const Ledger &ledger) const;

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // namespace cam_merge

#endif // CAM_MERGE_LEDGER_HPP
