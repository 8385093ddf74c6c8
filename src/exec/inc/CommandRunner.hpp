#ifndef OPSSETUP_EXEC_COMMAND_RUNNER_HPP
#define OPSSETUP_EXEC_COMMAND_RUNNER_HPP
/**
 * @file CommandRunner.hpp
 * @brief Structured-argv execution of external commands with captured output.
 * @note Linux-only. Uses fork/execvp with pipes.
 *
 * Commands are always passed as argument vectors; nothing goes through a
 * shell, so interface names never need quoting.
 */

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace opssetup {

namespace exec {

/* ----------------------------- Constants ----------------------------- */

/// Wall-clock limit on one command; the child is killed when it expires.
inline constexpr std::chrono::milliseconds DEFAULT_COMMAND_TIMEOUT{30000};

/* ----------------------------- Types ----------------------------- */

/// Program followed by its arguments.
using Argv = std::vector<std::string>;

/**
 * @brief Result of running one command.
 */
struct CommandResult {
  bool launched{false}; ///< True if the process was started
  int exitCode{-1};     ///< Exit status (128 + signal if killed)
  bool timedOut{false}; ///< True if the child was killed at the deadline
  std::string output;   ///< Combined stdout and stderr

  /// @brief Process started and exited with status 0.
  [[nodiscard]] bool ok() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Render argv as a single space-separated line for diagnostics.
 */
[[nodiscard]] std::string formatArgv(const Argv& argv);

/* ----------------------------- CommandRunner ----------------------------- */

/**
 * @brief Executes commands. Replaceable so callers can be exercised without
 *        touching the host network configuration.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Run a command to completion.
   * @param argv Program and arguments; argv[0] is looked up in PATH.
   * @param input Bytes written to the child's stdin before it is closed.
   * @return Exit status and captured output.
   */
  [[nodiscard]] virtual CommandResult run(const Argv& argv, std::string_view input = {}) = 0;
};

/**
 * @brief CommandRunner backed by fork/execvp.
 *
 * A child still running when the timeout expires is sent SIGKILL and reported
 * with timedOut set. A non-positive timeout waits indefinitely.
 */
class SystemCommandRunner final : public CommandRunner {
public:
  explicit SystemCommandRunner(std::chrono::milliseconds timeout = DEFAULT_COMMAND_TIMEOUT)
      : timeout_(timeout) {}

  [[nodiscard]] CommandResult run(const Argv& argv, std::string_view input = {}) override;

  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept { return timeout_; }

private:
  std::chrono::milliseconds timeout_;
};

} // namespace exec

} // namespace opssetup

#endif // OPSSETUP_EXEC_COMMAND_RUNNER_HPP
