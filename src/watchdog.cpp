/**
 * @file watchdog.cpp
 * @brief Progress deadline implementation
 */

#include "cam_merge/watchdog.hpp"

#include <algorithm>
#include <cstdio>

#include <unistd.h>

#include "cam_merge/logging.hpp"

namespace cam_merge {

namespace {

std::int64_t steady_now_ns() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

} // anonymous namespace

Watchdog::Watchdog(std::chrono::milliseconds timeout,
                   std::function<void()> handler)
    : timeout_(timeout), handler_(std::move(handler)) {
  if (!handler_) {
    handler_ = [this] {
      LOG_ERROR("Watchdog: no progress for {}s, terminating",
                std::chrono::duration_cast<std::chrono::seconds>(timeout_)
                    .count());
      std::fflush(nullptr);
      _exit(1);
    };
  }
}

Watchdog::~Watchdog() { stop(); }

void Watchdog::start() {
  if (!enabled()) {
    LOG_INFO("Watchdog disabled");
    return;
  }
  if (thread_.joinable())
    return;

  reset();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&Watchdog::run, this);
  LOG_INFO("Watchdog armed: {}s without progress terminates the process",
           std::chrono::duration_cast<std::chrono::seconds>(timeout_).count());
}

void Watchdog::reset() {
  auto timeout_ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(timeout_).count();
  deadline_ns_.store(steady_now_ns() + timeout_ns);
}

void Watchdog::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void Watchdog::run() {
  /// Poll often enough to fire within ~10% of the timeout, at most once a second
  auto poll = std::clamp(timeout_ / 10, std::chrono::milliseconds(10),
                         std::chrono::milliseconds(1000));

  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (cv_.wait_for(lock, poll, [this] { return stopping_; }))
      break;

    if (steady_now_ns() > deadline_ns_.load()) {
      fired_.store(true);
      lock.unlock();
      handler_();
      return;
    }
  }
}

} // namespace cam_merge
