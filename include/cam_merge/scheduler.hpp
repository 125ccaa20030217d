/**
 * @file scheduler.hpp
 * @brief Daemon main loop
 *
 * @details The Scheduler drives the pass cycle:
 *
 *          Idle -> Scanning -> Processing -> Idle, plus Backoff on error
 *
 * @attention STATES:
 *
 *   - Idle: reset the watchdog, reconcile the ledger with the filesystem
 *
 *   - Scanning: discover cameras and wait until every required location
 *     shows current-day footage
 *
 *   - Processing: run the camera pipeline on each required camera, then both
 *     retention sweeps, then print the pass summary
 *
 *   - Backoff: an exception escaped the pass; log it and cool down
 *
 * @note Every sleep is cut into slices of at most sleep_slice with a
 *       watchdog reset between slices.
 */

#ifndef CAM_MERGE_SCHEDULER_HPP
#define CAM_MERGE_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "layout.hpp"
#include "ledger.hpp"
#include "types.hpp"

namespace cam_merge {

class CameraPipeline;
class Reconciler;
class RetentionEngine;
class Watchdog;

enum class SchedulerState { Idle, Scanning, Processing, Backoff };

const char *to_string(SchedulerState state);

/**
 * @struct SchedulerOptions
 * @brief Loop timing and readiness policy.
 */
struct SchedulerOptions {
  bool run_forever = true; //< false = one pass (or one wait) then return
  std::chrono::milliseconds scan_interval{std::chrono::seconds(600)};
  std::chrono::milliseconds error_cooldown{std::chrono::seconds(60)};
  std::chrono::milliseconds sleep_slice{SLEEP_SLICE};
  std::set<std::string> required_locations; //< Empty = every discovered one
  int min_current_day_files = 5;
  bool deep_check = false; //< Deep probe during reconciliation
};

class Scheduler {
public:
  Scheduler(const StorageLayout &layout, SchedulerOptions options,
            Ledger &ledger, CameraPipeline &pipeline, Reconciler &reconciler,
            RetentionEngine &retention);

  /**
   * @brief Run passes until stopped.
   * @return 0 on a clean exit; 1 when a single pass aborted with an error
   */
  int run();

  /**
   * @brief Set the store used to persist reconciliation results.
   * @param store Ledger store (nullptr = keep changes in memory)
   */
  void set_ledger_store(LedgerStore *store) { store_ = store; }

  /**
   * @brief Set the watchdog reset at every point of progress.
   * @param watchdog Watchdog (nullptr = no watchdog)
   */
  void set_watchdog(Watchdog *watchdog) { watchdog_ = watchdog; }

  /**
   * @brief Set a flag that ends the loop at the next check.
   * @note Checked between passes and between sleep slices; typically set
   *       from a SIGINT/SIGTERM handler.
   */
  void set_stop_flag(const std::atomic<bool> *flag) { stop_flag_ = flag; }

  /// Override how the current local day (YYYYMMDD) is obtained
  void set_today_provider(std::function<std::string()> today) {
    today_ = std::move(today);
  }

  SchedulerState state() const { return state_; }
  int passes() const { return passes_; }
  int errors() const { return errors_; }

private:
  void reconcile();
  void run_pass(const std::vector<CameraFolder> &cameras,
                const std::set<std::string> &required, const std::string &today);
  void print_pass_summary(const std::vector<CameraResult> &results,
                          double wall_clock_sec) const;

  /// Sleep @p total in watchdog-reset slices
  void sleep_sliced(std::chrono::milliseconds total);
  void kick();
  bool stop_requested() const { return stop_flag_ && stop_flag_->load(); }
  void enter(SchedulerState state);

  const StorageLayout &layout_;
  SchedulerOptions options_;
  Ledger &ledger_;
  CameraPipeline &pipeline_;
  Reconciler &reconciler_;
  RetentionEngine &retention_;

  LedgerStore *store_{nullptr};
  Watchdog *watchdog_{nullptr};
  const std::atomic<bool> *stop_flag_{nullptr};
  std::function<std::string()> today_;

  SchedulerState state_ = SchedulerState::Idle;
  bool processing_ = false;
  int passes_ = 0;
  int errors_ = 0;
};

} // namespace cam_merge

#endif // CAM_MERGE_SCHEDULER_HPP
