/**
 * @file retention.hpp
 * @brief Age-based deletion of source footage and merged outputs
 *
 * @details Two independent sweeps driven by ledger timestamps:
 *
 *          - originals: hour folders whose footage went into a day video
 *
 *          - merged: hour and day videos older than the merged window
 *
 * @note A key without a timestamp has unknown age and is never touched.
 *       Deletion failures are warnings and leave the key for the next sweep.
 */

#ifndef CAM_MERGE_RETENTION_HPP
#define CAM_MERGE_RETENTION_HPP

#include "layout.hpp"
#include "ledger.hpp"

namespace cam_merge {

/**
 * @struct RetentionPolicy
 * @brief Retention windows in days; a value <= 0 disables the sweep.
 */
struct RetentionPolicy {
  int original_days = 1;
  int merged_days = 1;
};

class RetentionEngine {
public:
  RetentionEngine(const StorageLayout &layout, RetentionPolicy policy,
                  LedgerStore *store = nullptr)
      : layout_(layout), policy_(policy), store_(store) {}

  /**
   * @brief Delete source hour folders recorded longer ago than the window.
   * @param now Current Unix time in seconds
   * @return Number of folders retired
   */
  int sweep_originals(Ledger &ledger, double now);

  /**
   * @brief Delete hour and day videos recorded longer ago than the window.
   * @note Empty day directories under the merged root are removed afterwards.
   * @param now Current Unix time in seconds
   * @return Number of outputs retired
   */
  int sweep_merged(Ledger &ledger, double now);

private:
  /// Empty an original hour folder; true when the folder is gone afterwards
  bool clear_original_folder(const std::filesystem::path &folder);

  /// Delete an output file; true when it no longer exists
  bool delete_output(const std::filesystem::path &output);

  void remove_empty_day_dirs();
  void persist(const Ledger &ledger);

  const StorageLayout &layout_;
  RetentionPolicy policy_;
  LedgerStore *store_;
};

} // namespace cam_merge

#endif // CAM_MERGE_RETENTION_HPP
