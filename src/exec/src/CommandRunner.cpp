/**
 * @file CommandRunner.cpp
 * @brief fork/execvp implementation of CommandRunner.
 */

#include "src/exec/inc/CommandRunner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fmt/core.h>

namespace opssetup {

namespace exec {

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::size_t OUTPUT_CHUNK_SIZE = 4096;

/// Exit status reported by the child when execvp fails.
constexpr int EXEC_FAILED_STATUS = 127;

/* ----------------------------- Pipe Helpers ----------------------------- */

inline void closeFd(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

/**
 * Write all of data to fd. Returns false on error (e.g. EPIPE when the child
 * exits without reading its input).
 */
inline bool writeAll(int fd, std::string_view data) noexcept {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t N = ::write(fd, data.data() + written, data.size() - written);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(N);
  }
  return true;
}

/**
 * Read fd until EOF. Returns false if the deadline passed first; a
 * non-positive timeout disables the deadline.
 */
inline bool readAll(int fd, std::string& out, std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;
  const Clock::time_point DEADLINE = Clock::now() + timeout;
  char buf[OUTPUT_CHUNK_SIZE];
  for (;;) {
    if (timeout.count() > 0) {
      const auto REMAINING =
          std::chrono::duration_cast<std::chrono::milliseconds>(DEADLINE - Clock::now());
      if (REMAINING.count() <= 0) {
        return false;
      }
      struct pollfd pfd{};
      pfd.fd = fd;
      pfd.events = POLLIN;
      const int READY =
          ::poll(&pfd, 1, static_cast<int>(std::min<long long>(REMAINING.count(), 60000)));
      if (READY < 0 && errno != EINTR) {
        break;
      }
      if (READY <= 0) {
        continue;
      }
    }
    const ssize_t N = ::read(fd, buf, sizeof(buf));
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (N == 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(N));
  }
  return true;
}

} // namespace

/* ----------------------------- CommandResult Methods ----------------------------- */

bool CommandResult::ok() const noexcept { return launched && exitCode == 0; }

std::string CommandResult::toString() const {
  if (!launched) {
    return fmt::format("not launched: {}", output);
  }
  if (timedOut) {
    return fmt::format("timed out (killed) output={}", output);
  }
  return fmt::format("exit={} output={}", exitCode, output);
}

std::string formatArgv(const Argv& argv) {
  std::string out;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i > 0) {
      out += ' ';
    }
    out += argv[i];
  }
  return out;
}

/* ----------------------------- SystemCommandRunner ----------------------------- */

CommandResult SystemCommandRunner::run(const Argv& argv, std::string_view input) {
  CommandResult result{};

  if (argv.empty()) {
    result.output = "empty command";
    return result;
  }

  int inPipe[2] = {-1, -1};
  int outPipe[2] = {-1, -1};
  if (::pipe2(inPipe, O_CLOEXEC) != 0) {
    result.output = fmt::format("pipe: {}", std::strerror(errno));
    return result;
  }
  if (::pipe2(outPipe, O_CLOEXEC) != 0) {
    result.output = fmt::format("pipe: {}", std::strerror(errno));
    closeFd(inPipe[0]);
    closeFd(inPipe[1]);
    return result;
  }

  // Build the C argv before forking; only async-signal-safe calls in the child.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const std::string& arg : argv) {
    cargv.push_back(const_cast<char*>(arg.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t PID = ::fork();
  if (PID < 0) {
    result.output = fmt::format("fork: {}", std::strerror(errno));
    closeFd(inPipe[0]);
    closeFd(inPipe[1]);
    closeFd(outPipe[0]);
    closeFd(outPipe[1]);
    return result;
  }

  if (PID == 0) {
    ::dup2(inPipe[0], STDIN_FILENO);
    ::dup2(outPipe[1], STDOUT_FILENO);
    ::dup2(outPipe[1], STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    ::_exit(EXEC_FAILED_STATUS);
  }

  closeFd(inPipe[0]);
  closeFd(outPipe[1]);

  result.launched = true;

  if (!input.empty() && !writeAll(inPipe[1], input)) {
    result.output = fmt::format("write to stdin failed: {}\n", std::strerror(errno));
  }
  closeFd(inPipe[1]);

  if (!readAll(outPipe[0], result.output, timeout_)) {
    result.timedOut = true;
    ::kill(PID, SIGKILL);
  }
  closeFd(outPipe[0]);

  int status = 0;
  pid_t waited = -1;
  do {
    waited = ::waitpid(PID, &status, 0);
  } while (waited < 0 && errno == EINTR);

  if (waited < 0) {
    result.exitCode = -1;
  } else if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exitCode = 128 + WTERMSIG(status);
  }

  return result;
}

} // namespace exec

} // namespace opssetup
