/**
 * @file subprocess.cpp
 * @brief Bounded subprocess execution implementation
 *
 * @details fork/execvp with two pipes:
 *
 *          - stderr pipe: child's fd 2, read by the parent with poll()
 *
 *          - status pipe (CLOEXEC): closed by a successful exec, or carries
 *            errno when exec fails, so "cannot start" is distinguishable
 *            from "exited non-zero"
 */

#include "cam_merge/subprocess.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "cam_merge/logging.hpp"

namespace cam_merge {

namespace {

/// Keep only the tail of stderr; ffmpeg repeats itself
constexpr size_t STDERR_CAP = 64 * 1024;

/// Poll granularity while waiting on the child
constexpr int POLL_INTERVAL_MS = 100;

void append_capped(std::string &out, const char *data, size_t n) {
  out.append(data, n);
  if (out.size() > STDERR_CAP)
    out.erase(0, out.size() - STDERR_CAP);
}

int decode_status(int status) {
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return -WTERMSIG(status);
  return -1;
}

void wait_blocking(pid_t pid, int &status) {
  while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

} // anonymous namespace

std::string format_command(const std::vector<std::string> &argv) {
  std::string cmd;
  for (const auto &arg : argv) {
    if (!cmd.empty())
      cmd += ' ';
    if (arg.find_first_of(" \t'\"") != std::string::npos) {
      cmd += fmt::format("\"{}\"", arg);
    } else {
      cmd += arg;
    }
  }
  return cmd;
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout) {
  ProcessResult result;
  if (argv.empty()) {
    result.stderr_output = "empty command";
    return result;
  }

  int err_pipe[2];
  int status_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    result.stderr_output = fmt::format("pipe: {}", std::strerror(errno));
    return result;
  }
  if (pipe2(status_pipe, O_CLOEXEC) == -1) {
    result.stderr_output = fmt::format("pipe: {}", std::strerror(errno));
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  /// Build argv before fork: no allocation in the child
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv)
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    result.stderr_output = fmt::format("fork: {}", std::strerror(errno));
    close(err_pipe[0]);
    close(err_pipe[1]);
    close(status_pipe[0]);
    close(status_pipe[1]);
    return result;
  }

  if (pid == 0) {
    /// Child
    int devnull = open("/dev/null", O_RDWR);
    if (devnull != -1) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);

    execvp(c_argv[0], c_argv.data());

    int err = errno;
    ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  /// Parent
  close(err_pipe[1]);
  close(status_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n == -1 && errno == EINTR);
  close(status_pipe[0]);

  if (n > 0) {
    int status = 0;
    wait_blocking(pid, status);
    close(err_pipe[0]);
    result.stderr_output =
        fmt::format("cannot execute {}: {}", argv[0], std::strerror(exec_errno));
    return result;
  }
  result.started = true;

  const int err_fd = err_pipe[0];
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  bool pipe_open = true;
  int status = 0;
  char buf[4096];

  while (true) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      result.exit_code = decode_status(status);
      break;
    }
    if (r == -1 && errno != EINTR) {
      result.stderr_output += fmt::format("waitpid: {}", std::strerror(errno));
      break;
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      kill(pid, SIGKILL);
      wait_blocking(pid, status);
      result.timed_out = true;
      result.exit_code = decode_status(status);
      break;
    }

    int wait_ms = static_cast<int>(std::min<long long>(
        POLL_INTERVAL_MS,
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
                .count() +
            1));

    if (pipe_open) {
      pollfd pfd{err_fd, POLLIN, 0};
      int pr = poll(&pfd, 1, wait_ms);
      if (pr > 0) {
        ssize_t got = read(err_fd, buf, sizeof(buf));
        if (got > 0) {
          append_capped(result.stderr_output, buf, static_cast<size_t>(got));
        } else if (got == 0) {
          pipe_open = false;
        }
      }
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
    }
  }

  /// Drain what is left without blocking on inherited pipe ends
  if (pipe_open) {
    fcntl(err_fd, F_SETFL, fcntl(err_fd, F_GETFL) | O_NONBLOCK);
    ssize_t got;
    while ((got = read(err_fd, buf, sizeof(buf))) > 0)
      append_capped(result.stderr_output, buf, static_cast<size_t>(got));
  }
  close(err_fd);

  return result;
}

bool run_with_timeout(const std::vector<std::string> &argv,
                      std::chrono::milliseconds timeout,
                      std::chrono::milliseconds slice_ceiling) {
  auto effective = std::min(timeout, slice_ceiling);
  auto as_sec = [](std::chrono::milliseconds ms) { return ms.count() / 1000.0; };

  LOG_INFO("Running command with initial timeout {:.0f}s", as_sec(effective));
  ProcessResult r = run_process(argv, effective);
  if (r.ok())
    return true;

  if (!r.started) {
    LOG_ERROR("Command could not start: {}", r.stderr_output);
    return false;
  }
  if (!r.timed_out) {
    LOG_ERROR("Command failed (exit {}): {}", r.exit_code, r.stderr_output);
    return false;
  }

  LOG_WARN("Command hit the {:.0f}s limit without finishing", as_sec(effective));
  if (effective >= timeout) {
    LOG_ERROR("Command timed out with no budget left (timeout={:.0f}s): {}",
              as_sec(timeout), format_command(argv));
    return false;
  }

  auto remaining = timeout - effective;
  LOG_INFO("Restarting command with remaining timeout {:.0f}s: {}",
           as_sec(remaining), format_command(argv));
  r = run_process(argv, remaining);
  if (r.ok()) {
    LOG_INFO("Command succeeded on restart");
    return true;
  }
  if (r.timed_out) {
    LOG_ERROR("Command timed out again: {}", format_command(argv));
  } else if (!r.started) {
    LOG_ERROR("Command could not start on restart: {}", r.stderr_output);
  } else {
    LOG_ERROR("Command failed on restart (exit {}): {}", r.exit_code,
              r.stderr_output);
  }
  return false;
}

} // namespace cam_merge
