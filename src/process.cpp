/**
 * @file process.cpp
 * @brief Subprocess execution implementation
 *
 * @note Linux / POSIX only: fork, execvp, poll, waitpid.
 */

#include "multicam/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "multicam/logging.hpp"

namespace multicam {

namespace {

/// Keep only the end of stderr; ffmpeg prints the real error last
constexpr size_t STDERR_TAIL_BYTES = 4096;

void append_tail(std::string &tail, const char *data, size_t n) {
  tail.append(data, n);
  if (tail.size() > STDERR_TAIL_BYTES) {
    tail.erase(0, tail.size() - STDERR_TAIL_BYTES);
  }
}

} // anonymous namespace

std::string join_command(const std::vector<std::string> &argv) {
  std::string cmd;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      cmd += " ";
    if (argv[i].find(' ') != std::string::npos) {
      cmd += fmt::format("\"{}\"", argv[i]);
    } else {
      cmd += argv[i];
    }
  }
  return cmd;
}

ProcessResult run_process(const std::vector<std::string> &argv,
                          std::chrono::milliseconds timeout) {
  ProcessResult result;
  if (argv.empty())
    return result;

  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) != 0) {
    LOG_ERROR("pipe2 failed: {}", std::strerror(errno));
    return result;
  }

  /// Build argv before fork; only async-signal-safe calls in the child
  std::vector<char *> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    c_argv.push_back(const_cast<char *>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    LOG_ERROR("fork failed: {}", std::strerror(errno));
    close(err_pipe[0]);
    close(err_pipe[1]);
    return result;
  }

  if (pid == 0) {
    /// Child: stderr -> pipe, stdout/stdin -> /dev/null
    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
      dup2(devnull, STDOUT_FILENO);
    }
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(c_argv[0], c_argv.data());
    _exit(127);
  }

  close(err_pipe[1]);
  result.started = true;

  const bool has_deadline = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  char buf[1024];
  bool pipe_open = true;
  while (pipe_open) {
    int wait_ms = -1;
    if (has_deadline) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(left.count());
    }

    struct pollfd pfd = {err_pipe[0], POLLIN, 0};
    int rc = poll(&pfd, 1, wait_ms);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (rc == 0)
      continue; //< Deadline re-checked at loop top

    ssize_t n = read(err_pipe[0], buf, sizeof(buf));
    if (n > 0) {
      append_tail(result.stderr_tail, buf, static_cast<size_t>(n));
    } else if (n == 0 || errno != EINTR) {
      pipe_open = false;
    }
  }
  close(err_pipe[0]);

  if (result.timed_out) {
    kill(pid, SIGKILL);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      LOG_ERROR("waitpid failed: {}", std::strerror(errno));
      return result;
    }
  }

  if (!result.timed_out && WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
    /// 127 from the child means execvp failed
    if (result.exit_code == 127 && result.stderr_tail.empty()) {
      result.stderr_tail = fmt::format("{}: command not found", argv[0]);
    }
  }
  return result;
}

} // namespace multicam
