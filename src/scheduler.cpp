/**
 * @file scheduler.cpp
 * @brief Daemon main loop implementation
 */

#include "cam_merge/scheduler.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>
#include <fmt/format.h>

#include "cam_merge/logging.hpp"
#include "cam_merge/pipeline.hpp"
#include "cam_merge/reconciler.hpp"
#include "cam_merge/retention.hpp"
#include "cam_merge/scanner.hpp"
#include "cam_merge/system.hpp"
#include "cam_merge/watchdog.hpp"

namespace cam_merge {

const char *to_string(SchedulerState state) {
  switch (state) {
  case SchedulerState::Idle:
    return "idle";
  case SchedulerState::Scanning:
    return "scanning";
  case SchedulerState::Processing:
    return "processing";
  case SchedulerState::Backoff:
    return "backoff";
  }
  return "unknown";
}

Scheduler::Scheduler(const StorageLayout &layout, SchedulerOptions options,
                     Ledger &ledger, CameraPipeline &pipeline,
                     Reconciler &reconciler, RetentionEngine &retention)
    : layout_(layout), options_(std::move(options)), ledger_(ledger),
      pipeline_(pipeline), reconciler_(reconciler), retention_(retention),
      today_([] { return local_day_string(std::time(nullptr)); }) {}

// **---- Loop ----**

int Scheduler::run() {
  LOG_PHASE("Starting merge loop ({})",
            options_.run_forever ? "continuous" : "single pass");

  while (!stop_requested()) {
    try {
      enter(SchedulerState::Idle);
      kick();
      if (!processing_)
        reconcile();

      enter(SchedulerState::Scanning);
      const std::string today = today_();
      auto cameras = scan_cameras(layout_);

      if (cameras.empty()) {
        LOG_WARN("No camera folders found under {}", layout_.root().string());
        if (!options_.run_forever)
          break;
        sleep_sliced(options_.scan_interval);
        continue;
      }

      std::set<std::string> required = options_.required_locations.empty()
                                            ? camera_locations(cameras)
                                            : options_.required_locations;
      auto ready = locations_with_current_footage(
          cameras, today, options_.min_current_day_files);
      auto missing = missing_locations(required, ready);

      if (!missing.empty()) {
        LOG_WARN("Waiting for current footage ({} files in a {} folder) at: {}",
                 options_.min_current_day_files, today,
                 fmt::join(missing, ", "));
        if (!options_.run_forever)
          break;
        sleep_sliced(options_.scan_interval);
        continue;
      }

      enter(SchedulerState::Processing);
      processing_ = true;
      run_pass(cameras, required, today);
      processing_ = false;
      ++passes_;

      enter(SchedulerState::Idle);
      if (!options_.run_forever)
        break;

      LOG_INFO("Pass {} complete, next scan in {}s", passes_,
               std::chrono::duration_cast<std::chrono::seconds>(
                   options_.scan_interval)
                   .count());
      sleep_sliced(options_.scan_interval);
    } catch (const std::exception &e) {
      enter(SchedulerState::Backoff);
      processing_ = false;
      ++errors_;
      LOG_ERROR("Pass aborted: {}", e.what());

      if (!options_.run_forever)
        return 1;

      LOG_INFO("Cooling down for {}s",
               std::chrono::duration_cast<std::chrono::seconds>(
                   options_.error_cooldown)
                   .count());
      sleep_sliced(options_.error_cooldown);
    }
  }

  if (stop_requested())
    LOG_INFO("Stop requested, leaving merge loop");
  enter(SchedulerState::Idle);
  return 0;
}

void Scheduler::reconcile() {
  VerifyReport report = reconciler_.verify(ledger_, options_.deep_check);
  if (report.empty())
    return;

  clean_records(ledger_, report);
  if (store_ && !store_->save(ledger_))
    LOG_WARN("Reconciled ledger kept in memory only until the next save");
}

void Scheduler::run_pass(const std::vector<CameraFolder> &cameras,
                         const std::set<std::string> &required,
                         const std::string &today) {
  TimingCollector::clear();
  auto pass_start = std::chrono::steady_clock::now();

  std::vector<CameraResult> results;
  for (const auto &camera : cameras) {
    if (!required.count(camera.location)) {
      LOG_INFO("Skipping {}/{}: location not required", camera.location,
               camera.camera_id);
      continue;
    }
    kick();
    CameraResult result = pipeline_.process(camera, today, ledger_);
    TimingCollector::record(result.label, result.processing_time_us);
    results.push_back(std::move(result));
  }

  kick();
  TIMER_START(retention);
  retention_.sweep_originals(ledger_, unix_now());
  retention_.sweep_merged(ledger_, unix_now());
  TIMER_END(retention);

  double wall_clock_sec = std::chrono::duration<double>(
                              std::chrono::steady_clock::now() - pass_start)
                              .count();
  print_pass_summary(results, wall_clock_sec);
  TimingCollector::print_summary();
}

void Scheduler::print_pass_summary(const std::vector<CameraResult> &results,
                                   double wall_clock_sec) const {
  int hours_merged = 0, hours_reused = 0, hours_failed = 0;
  int days_merged = 0, days_skipped = 0, days_failed = 0, cameras_failed = 0;
  for (const auto &r : results) {
    hours_merged += r.hours_merged;
    hours_reused += r.hours_reused;
    hours_failed += r.hours_failed;
    days_merged += r.days_merged;
    days_skipped += r.days_skipped;
    days_failed += r.days_failed;
    if (!r.success)
      ++cameras_failed;
  }

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================= MERGE PASS SUMMARY =================\n");
  fmt::print("{:<25} {:>25}\n", "Cameras:", results.size());
  fmt::print("{:<25} {:>25}\n", "Cameras failed:", cameras_failed);
  fmt::print("{:<25} {:>25}\n", "Hours merged:", hours_merged);
  fmt::print("{:<25} {:>25}\n", "Hours reused:", hours_reused);
  fmt::print("{:<25} {:>25}\n", "Hours failed:", hours_failed);
  fmt::print("{:<25} {:>25}\n", "Days merged:", days_merged);
  fmt::print("{:<25} {:>25}\n", "Days already done:", days_skipped);
  fmt::print("{:<25} {:>25}\n", "Days failed:", days_failed);
  fmt::print("{:<25} {:>25}\n", "Wall-clock time:", format_time(wall_clock_sec));
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (cameras_failed > 0 || hours_failed > 0 || days_failed > 0) {
    fmt::print(fg(fmt::color::red), "\nCameras with failures:\n");
    for (const auto &r : results) {
      if (!r.success || r.hours_failed > 0 || r.days_failed > 0)
        fmt::print(fg(fmt::color::red), "  - {}\n", r.label);
    }
  }
  std::fflush(stdout);
}

// **---- Helpers ----**

void Scheduler::sleep_sliced(std::chrono::milliseconds total) {
  auto slice = std::max(options_.sleep_slice, std::chrono::milliseconds(1));
  while (total.count() > 0 && !stop_requested()) {
    kick();
    auto step = std::min(total, slice);
    std::this_thread::sleep_for(step);
    total -= step;
  }
  kick();
}

void Scheduler::kick() {
  if (watchdog_)
    watchdog_->reset();
}

void Scheduler::enter(SchedulerState state) { state_ = state; }

} // namespace cam_merge
