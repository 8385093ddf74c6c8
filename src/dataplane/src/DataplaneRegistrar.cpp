/**
 * @file DataplaneRegistrar.cpp
 * @brief Implementation of runtime CLI port registration.
 */

#include "src/dataplane/inc/DataplaneRegistrar.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <charconv>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace opssetup {

namespace dataplane {

using helpers::strings::splitLines;
using helpers::strings::startsWith;
using helpers::strings::trimRight;

/* ----------------------------- RegistrationResult Methods ----------------------------- */

bool RegistrationResult::ok() const noexcept { return status == SetupStatus::OK; }

std::string RegistrationResult::toString() const {
  if (ok()) {
    return fmt::format("registered port id {} ({})", portId, command);
  }
  return fmt::format("{}: {}", opssetup::toString(status), message);
}

/* ----------------------------- API ----------------------------- */

int dataplanePortId(std::string_view hwPort) noexcept {
  if (hwPort.empty()) {
    return -1;
  }

  int value = 0;
  const char* const END = hwPort.data() + hwPort.size();
  const auto [ptr, ec] = std::from_chars(hwPort.data(), END, value);
  if (ec != std::errc{} || ptr != END || value < 1) {
    return -1;
  }
  return value - 1;
}

bool isRegistrationReplyValid(std::string_view reply) {
  std::vector<std::string_view> lines = splitLines(reply);
  for (std::string_view& line : lines) {
    line = trimRight(line);
  }
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  return lines.size() == 2 && lines[0] == RUNTIME_BANNER && startsWith(lines[1], RUNTIME_PROMPT);
}

exec::Argv runtimeCliArgv(const DataplaneConfig& config) {
  return {"ip",           "netns",    "exec",           config.netns,
          config.cliPath, "--json",   config.programJson, "--thrift-port",
          std::to_string(config.thriftPort)};
}

RegistrationResult registerPort(const DataplaneConfig& config, std::string_view device,
                                std::string_view hwPort, exec::CommandRunner& runner) {
  RegistrationResult result{};

  result.portId = dataplanePortId(hwPort);
  if (result.portId < 0) {
    result.status = SetupStatus::REGISTRATION_ERROR;
    result.message = fmt::format("port name '{}' has no numeric dataplane id", hwPort);
    return result;
  }

  result.command = fmt::format("port_add {} {}", device, result.portId);

  const exec::Argv ARGV = runtimeCliArgv(config);
  const exec::CommandResult RES = runner.run(ARGV, result.command + "\n");
  result.reply = RES.output;

  if (!RES.ok()) {
    result.status = SetupStatus::REGISTRATION_ERROR;
    result.message =
        fmt::format("'{}' failed for {}: {}", exec::formatArgv(ARGV), result.command, RES.toString());
    return result;
  }

  if (!isRegistrationReplyValid(RES.output)) {
    result.status = SetupStatus::REGISTRATION_ERROR;
    result.message = fmt::format("unexpected dataplane reply to '{}': {}", result.command, RES.output);
    return result;
  }

  spdlog::info("  - Dataplane port {} added for {}", result.portId, device);
  return result;
}

} // namespace dataplane

} // namespace opssetup
