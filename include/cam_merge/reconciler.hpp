/**
 * @file reconciler.hpp
 * @brief Ledger reconciliation against the filesystem
 *
 * @details Re-derives the expected output path of every recorded key and
 *          re-runs the validity gate on it. Keys whose artifact is gone,
 *          truncated or unplayable are reported so they can be purged and
 *          their buckets merged again.
 */

#ifndef CAM_MERGE_RECONCILER_HPP
#define CAM_MERGE_RECONCILER_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "layout.hpp"
#include "ledger.hpp"

namespace cam_merge {

class Transcoder;

/**
 * @struct VerifyReport
 * @brief Ledger entries that no longer match a valid artifact.
 */
struct VerifyReport {
  std::vector<std::string> invalid_hours;
  std::vector<std::string> invalid_days;

  bool empty() const { return invalid_hours.empty() && invalid_days.empty(); }
  std::size_t size() const { return invalid_hours.size() + invalid_days.size(); }
};

/**
 * @struct OutputListing
 * @brief Recorded outputs that currently exist on disk.
 */
struct OutputListing {
  std::vector<std::string> hours;
  std::vector<std::string> days;
};

class Reconciler {
public:
  Reconciler(const StorageLayout &layout, Transcoder &transcoder,
             std::uint64_t min_valid_size_kb)
      : layout_(layout), transcoder_(transcoder),
        min_valid_size_kb_(min_valid_size_kb) {}

  /**
   * @brief Check every hour and day key of @p ledger.
   *
   * @note An hour key is invalid when it does not parse as an hour key, when
   *       its camera directory is gone, or when its output fails the
   *       validity gate. A day key is invalid when it does not parse as a
   *       day key or its output fails the gate.
   *
   * @param deep Run the playability probe on each output
   */
  VerifyReport verify(const Ledger &ledger, bool deep);

  /// Outputs of recorded keys that exist on disk, sorted by path
  OutputListing valid_outputs(const Ledger &ledger) const;

private:
  const StorageLayout &layout_;
  Transcoder &transcoder_;
  std::uint64_t min_valid_size_kb_;
};

/**
 * @brief Remove every reported key and its timestamp from @p ledger.
 * @return Number of keys removed
 * @note The caller persists the ledger.
 */
int clean_records(Ledger &ledger, const VerifyReport &report);

} // namespace cam_merge

#endif // CAM_MERGE_RECONCILER_HPP
