/**
 * @file subprocess.hpp
 * @brief Bounded subprocess execution
 *
 * @details Runs an external command via fork/execvp with:
 *
 *          - stdout discarded, stderr captured (tail-truncated)
 *
 *          - a hard wall-clock timeout; on expiry the child is SIGKILLed
 *
 *          - exec failures reported as "not started" rather than as an exit
 *            code
 *
 *          run_with_timeout() layers the two-phase timeout policy on top:
 *          no single blocking call lasts longer than the slice ceiling.
 */

#ifndef CAM_MERGE_SUBPROCESS_HPP
#define CAM_MERGE_SUBPROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

#include "types.hpp"

namespace cam_merge {

/**
 * @struct ProcessResult
 * @brief Outcome of one subprocess invocation.
 */
struct ProcessResult {
  bool started = false;   //< False if fork/exec failed
  bool timed_out = false; //< True if the child was killed at the deadline
  int exit_code = -1;     //< Exit status, or -signal if killed by a signal
  std::string stderr_output;

  bool ok() const { return started && !timed_out && exit_code == 0; }
};

/**
 * @brief Run a command and wait for it, at most @p timeout.
 *
 * @param argv Program and arguments; argv[0] is resolved through PATH
 * @param timeout Hard limit; the child is killed when it expires
 * @return Result describing start, timeout, exit status and stderr
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout);

/**
 * @brief Run a command under the two-phase timeout policy.
 *
 * @note The first invocation is capped at min(timeout, slice_ceiling). If it
 *       is killed at that cap and time remains, the command is started again
 *       for the remainder. A timeout in either phase is a plain failure.
 *
 * @param argv Program and arguments
 * @param timeout Total time budget for the command
 * @param slice_ceiling Longest a single invocation may block
 * @return true if an invocation exited with status 0
 */
bool run_with_timeout(
    const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
    std::chrono::milliseconds slice_ceiling = SUBPROCESS_SLICE_CEILING);

/// Join argv into a printable command line for logs
std::string format_command(const std::vector<std::string> &argv);

} // namespace cam_merge

#endif // CAM_MERGE_SUBPROCESS_HPP
