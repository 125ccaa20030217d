/**
 * @file main.cpp
 * @brief Entry point for the cam_merge daemon
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Maintenance modes: cleanup-only and verify-only runs
 *
 *          - Daemon mode: startup checks, then the scheduler loop
 *
 * @note Configuration comes from environment variables, optionally seeded
 *       from an env file given with --config. See config/cam_merge.env.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <mutex>
#include <stdexcept>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "cam_merge/config.hpp"
#include "cam_merge/ffmpeg_executor.hpp"
#include "cam_merge/layout.hpp"
#include "cam_merge/ledger.hpp"
#include "cam_merge/logging.hpp"
#include "cam_merge/media_info.hpp"
#include "cam_merge/merge_engine.hpp"
#include "cam_merge/pipeline.hpp"
#include "cam_merge/reconciler.hpp"
#include "cam_merge/retention.hpp"
#include "cam_merge/scheduler.hpp"
#include "cam_merge/system.hpp"
#include "cam_merge/watchdog.hpp"

using namespace cam_merge;

namespace {

std::atomic<bool> stop_requested{false};

extern "C" void handle_stop_signal(int) { stop_requested.store(true); }

struct CliOptions {
  std::string config_path;
  bool single_run = false;
  bool ignore_processed = false;
  bool deep_check = false;
  bool verify_only = false;
  bool clean_records = false;
  bool cleanup_original = false;
  bool cleanup_merged = false;
  int watchdog_timeout = 3600; //< Seconds; 0 disables
};

void print_usage(const char *prog) {
  fmt::print("Usage: {} [options]\n\n", prog);
  fmt::print("Merges per-hour camera recordings into daily videos.\n\n");
  fmt::print("Options:\n");
  fmt::print("  --config FILE           Load KEY=VALUE settings (environment "
             "wins)\n");
  fmt::print("  --single-run            Run one pass, then exit\n");
  fmt::print("  --ignore-processed      Forget completed merges (keeps "
             "timestamps)\n");
  fmt::print("  --deep-check            Probe outputs with ffprobe\n");
  fmt::print("  --verify-only           Verify the ledger, list outputs, "
             "exit\n");
  fmt::print("  --clean-records         Purge invalid records (with "
             "--verify-only)\n");
  fmt::print("  --cleanup-original      Only delete expired source footage\n");
  fmt::print("  --cleanup-merged        Only delete expired merged videos\n");
  fmt::print("  --watchdog-timeout N    Exit after N seconds without progress "
             "(default 3600, 0 = off)\n");
  fmt::print("  --help                  Show this help\n");
}

/// @return 0 to continue, 1 on a usage error, 2 after --help
int parse_args(int argc, char *argv[], CliOptions &cli) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 2;
    } else if (arg == "--config" && i + 1 < argc) {
      cli.config_path = argv[++i];
    } else if (arg == "--single-run") {
      cli.single_run = true;
    } else if (arg == "--ignore-processed") {
      cli.ignore_processed = true;
    } else if (arg == "--deep-check") {
      cli.deep_check = true;
    } else if (arg == "--verify-only") {
      cli.verify_only = true;
    } else if (arg == "--clean-records") {
      cli.clean_records = true;
    } else if (arg == "--cleanup-original") {
      cli.cleanup_original = true;
    } else if (arg == "--cleanup-merged") {
      cli.cleanup_merged = true;
    } else if (arg == "--watchdog-timeout" && i + 1 < argc) {
      std::string value = argv[++i];
      try {
        size_t pos = 0;
        cli.watchdog_timeout = std::stoi(value, &pos);
        if (pos != value.size())
          throw std::invalid_argument(value);
      } catch (const std::exception &) {
        LOG_ERROR("--watchdog-timeout expects a number of seconds, got '{}'",
                  value);
        return 1;
      }
    } else {
      LOG_ERROR("Unknown or incomplete option: {}", arg);
      print_usage(argv[0]);
      return 1;
    }
  }
  return 0;
}

void print_outputs(const OutputListing &listing) {
  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print(fg(fmt::color::cyan), "\n[Valid merged hour videos]\n");
  for (const auto &p : listing.hours)
    fmt::print("{}\n", p);
  fmt::print(fg(fmt::color::cyan), "\n[Valid merged day videos]\n");
  for (const auto &p : listing.days)
    fmt::print("{}\n", p);
  fmt::print("\n");
  std::fflush(stdout);
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  CliOptions cli;
  int parsed = parse_args(argc, argv, cli);
  if (parsed != 0)
    return parsed == 2 ? 0 : 1;

  if (!cli.config_path.empty()) {
    int applied = Config::load_env_file(cli.config_path);
    if (applied < 0) {
      LOG_ERROR("Cannot read config file: {}", cli.config_path);
      return 1;
    }
    LOG_INFO("Loaded {} settings from {}", applied, cli.config_path);
  }

  MergerConfig config;
  try {
    config = Config::load();
  } catch (const std::invalid_argument &e) {
    LOG_ERROR("Configuration error: {}", e.what());
    return 1;
  }

  if (cli.deep_check) {
    config.deep_check = true;
    LOG_INFO("Deep check enabled from the command line");
  }

  if (!config.log_file.empty() && !set_log_file(config.log_file))
    LOG_WARN("Cannot open log file {}, logging to stdout only",
             config.log_file);

  quiet_libav_logging();
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  Watchdog watchdog{std::chrono::seconds(cli.watchdog_timeout)};
  watchdog.start();

  LOG_PHASE("cam_merge starting");
  Config::log_config(config);

  FfmpegExecutor ffmpeg(config.ffmpeg_bin, config.ffprobe_bin);
  if (!ffmpeg.available()) {
    LOG_ERROR("ffmpeg is not installed or not runnable: {}", config.ffmpeg_bin);
    return 1;
  }

  StorageLayout layout(config.video_root, config.merged_dir,
                       config.camera_source_dir);
  LedgerStore store(config.ledger_path);
  Ledger ledger = store.load();

  if (cli.ignore_processed) {
    LOG_WARN("Ignoring completed merges; timestamps are kept for cleanup");
    ledger.hours.clear();
    ledger.days.clear();
  }

  RetentionEngine retention(
      layout,
      RetentionPolicy{config.delete_original_after_days,
                      config.delete_merged_after_days},
      &store);

  // **---- CLEANUP-ONLY MODES ----**

  if (cli.cleanup_original || cli.cleanup_merged) {
    if (cli.cleanup_original)
      retention.sweep_originals(ledger, unix_now());
    if (cli.cleanup_merged)
      retention.sweep_merged(ledger, unix_now());
    return 0;
  }

  // **---- VERIFICATION ----**

  Reconciler reconciler(layout, ffmpeg, config.min_valid_size_kb);
  watchdog.reset();
  VerifyReport report = reconciler.verify(ledger, config.deep_check);

  if (!report.empty() && (!cli.verify_only || cli.clean_records)) {
    clean_records(ledger, report);
    if (!store.save(ledger))
      LOG_WARN("Cleaned ledger could not be saved");
  }

  print_outputs(reconciler.valid_outputs(ledger));

  if (cli.verify_only) {
    LOG_INFO("Verification complete");
    return 0;
  }

  // **---- DAEMON MODE ----**

  watchdog.reset();
  retention.sweep_originals(ledger, unix_now());
  retention.sweep_merged(ledger, unix_now());

  MergeOptions merge_options;
  merge_options.timeout = std::chrono::seconds(config.max_timeout);
  merge_options.max_retries = config.max_retries;
  merge_options.retry_delay = std::chrono::seconds(config.retry_delay);
  merge_options.min_valid_size_kb = config.min_valid_size_kb;
  merge_options.deep_check = config.deep_check;
  MergeEngine engine(ffmpeg, merge_options);

  PipelineOptions pipeline_options;
  pipeline_options.min_valid_size_kb = config.min_valid_size_kb;
  pipeline_options.deep_check = config.deep_check;
  pipeline_options.save_hourly = config.save_hourly;
  CameraPipeline pipeline(layout, pipeline_options, engine, ffmpeg);
  pipeline.set_ledger_store(&store);

  SchedulerOptions scheduler_options;
  scheduler_options.run_forever = !cli.single_run;
  scheduler_options.scan_interval = std::chrono::seconds(config.scan_interval);
  scheduler_options.error_cooldown = std::chrono::seconds(config.error_cooldown);
  scheduler_options.required_locations = config.required_locations;
  scheduler_options.min_current_day_files = config.min_current_day_files;
  scheduler_options.deep_check = config.deep_check;

  Scheduler scheduler(layout, scheduler_options, ledger, pipeline, reconciler,
                      retention);
  scheduler.set_ledger_store(&store);
  scheduler.set_watchdog(&watchdog);
  scheduler.set_stop_flag(&stop_requested);

  int rc = scheduler.run();
  watchdog.stop();
  LOG_INFO("cam_merge exiting ({} passes, {} errors)", scheduler.passes(),
           scheduler.errors());
  return rc;
}
