/**
 * @file process.hpp
 * @brief Subprocess execution for external tools
 *
 * @details Runs ffmpeg / probe commands with fork + execvp instead of a shell,
 *          so paths containing spaces or quotes need no escaping. Standard
 *          error is captured for diagnostics; standard output is discarded.
 */

#ifndef MULTICAM_PROCESS_HPP
#define MULTICAM_PROCESS_HPP

#include <chrono>
#include <string>
#include <vector>

namespace multicam {

/**
 * @struct ProcessResult
 * @brief Outcome of one subprocess run.
 */
struct ProcessResult {
  bool started = false;   //< fork/exec succeeded
  bool timed_out = false; //< Killed after the deadline
  int exit_code = -1;     //< Exit status, or -1 if killed / not started
  std::string stderr_tail; //< Last few KB of stderr

  bool ok() const { return started && !timed_out && exit_code == 0; }
};

/**
 * @brief Run a command and wait for it.
 *
 * @param argv Program followed by arguments (argv[0] resolved via PATH)
 * @param timeout Kill the process after this long (zero = no deadline)
 * @return ProcessResult describing how the process ended
 */
ProcessResult run_process(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout =
                              std::chrono::milliseconds::zero());

/// Join argv for log output
std::string join_command(const std::vector<std::string> &argv);

} // namespace multicam

#endif // MULTICAM_PROCESS_HPP
