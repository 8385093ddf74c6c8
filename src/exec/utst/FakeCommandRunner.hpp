#ifndef OPSSETUP_EXEC_FAKE_COMMAND_RUNNER_HPP
#define OPSSETUP_EXEC_FAKE_COMMAND_RUNNER_HPP
/**
 * @file FakeCommandRunner.hpp
 * @brief Scripted CommandRunner for unit tests.
 *
 * Responses are keyed by the space-joined command line. Each key holds a
 * queue; the last response of a queue repeats. Unscripted commands succeed
 * with empty output. Every call is recorded.
 */

#include "src/exec/inc/CommandRunner.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace opssetup {

namespace exec {

class FakeCommandRunner final : public CommandRunner {
public:
  struct Call {
    Argv argv;
    std::string input;
  };

  static CommandResult success(std::string output = {}) {
    CommandResult res{};
    res.launched = true;
    res.exitCode = 0;
    res.output = std::move(output);
    return res;
  }

  static CommandResult failure(int exitCode, std::string output = {}) {
    CommandResult res{};
    res.launched = true;
    res.exitCode = exitCode;
    res.output = std::move(output);
    return res;
  }

  /// Queue a response for a command line.
  void on(const std::string& line, CommandResult result) {
    scripted_[line].push_back(std::move(result));
  }

  [[nodiscard]] CommandResult run(const Argv& argv, std::string_view input = {}) override {
    calls.push_back(Call{argv, std::string(input)});

    auto it = scripted_.find(formatArgv(argv));
    if (it == scripted_.end() || it->second.empty()) {
      return success();
    }
    std::deque<CommandResult>& queue = it->second;
    CommandResult res = queue.front();
    if (queue.size() > 1) {
      queue.pop_front();
    }
    return res;
  }

  /// Command lines in call order.
  [[nodiscard]] std::vector<std::string> lines() const {
    std::vector<std::string> out;
    out.reserve(calls.size());
    for (const Call& c : calls) {
      out.push_back(formatArgv(c.argv));
    }
    return out;
  }

  [[nodiscard]] std::size_t count(const std::string& line) const {
    const std::vector<std::string> ALL = lines();
    return static_cast<std::size_t>(std::count(ALL.begin(), ALL.end(), line));
  }

  std::vector<Call> calls;

private:
  std::map<std::string, std::deque<CommandResult>> scripted_;
};

} // namespace exec

} // namespace opssetup

#endif // OPSSETUP_EXEC_FAKE_COMMAND_RUNNER_HPP
