/**
 * @file watchdog.hpp
 * @brief Progress deadline guarding the scheduler loop
 *
 * @details A background thread watches a monotonic deadline. The main loop
 *          pushes the deadline forward with reset() whenever it makes
 *          progress; if the deadline passes, the handler runs once.
 *
 * @note The default handler logs and terminates the process with status 1,
 *       so a supervisor can restart a daemon stuck in a hung subprocess or
 *       filesystem call. A timeout <= 0 disables the watchdog.
 */

#ifndef CAM_MERGE_WATCHDOG_HPP
#define CAM_MERGE_WATCHDOG_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace cam_merge {

class Watchdog {
  std::chrono::milliseconds timeout_;
  std::function<void()> handler_;

  /// steady_clock deadline in nanoseconds since the clock's epoch
  std::atomic<std::int64_t> deadline_ns_{0};
  std::atomic<bool> fired_{false};

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stopping_ = false;
  std::thread thread_;

  void run();

public:
  /**
   * @param timeout Allowed time between two reset() calls (<= 0 disables)
   * @param handler Expiry action; empty selects log-and-exit(1)
   */
  explicit Watchdog(std::chrono::milliseconds timeout,
                    std::function<void()> handler = {});
  ~Watchdog();

  Watchdog(const Watchdog &) = delete;
  Watchdog &operator=(const Watchdog &) = delete;

  /// Arm the deadline and launch the monitor thread
  void start();

  /// Move the deadline to now + timeout; safe from any thread
  void reset();

  /// Stop the monitor thread without firing
  void stop();

  bool enabled() const { return timeout_.count() > 0; }
  bool fired() const { return fired_.load(); }
};

} // namespace cam_merge

#endif // CAM_MERGE_WATCHDOG_HPP
