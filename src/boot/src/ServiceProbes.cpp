/**
 * @file ServiceProbes.cpp
 * @brief systemctl queries and hostname lookup.
 */

#include "src/boot/inc/ServiceProbes.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <limits.h>
#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace opssetup {

namespace boot {

exec::Argv isActiveArgv(const std::string& name) { return {"systemctl", "is-active", name}; }

exec::Argv startArgv(const std::string& name) { return {"systemctl", "start", name}; }

bool isServiceActive(exec::CommandRunner& runner, const std::string& name) {
  const exec::CommandResult RES = runner.run(isActiveArgv(name));
  return RES.launched && helpers::strings::trim(RES.output) == "active";
}

exec::CommandResult startService(exec::CommandRunner& runner, const std::string& name) {
  return runner.run(startArgv(name));
}

std::string currentHostname() {
  char buf[HOST_NAME_MAX + 1] = {};
  if (::gethostname(buf, sizeof(buf)) != 0) {
    return {};
  }
  buf[HOST_NAME_MAX] = '\0';
  return std::string(buf);
}

readiness::PollResult ensureServiceActive(exec::CommandRunner& runner, const std::string& name,
                                          const readiness::PollPolicy& policy) {
  readiness::PollResult result{};
  if (isServiceActive(runner, name)) {
    result.probes = 1;
    return result;
  }

  spdlog::info("{} is not active, starting it", name);
  const exec::CommandResult START = startService(runner, name);
  if (!START.ok()) {
    result.status = SetupStatus::SERVICE_START_ERROR;
    result.probes = 1;
    result.message = fmt::format("'{}' failed: {}", exec::formatArgv(startArgv(name)),
                                 START.toString());
    return result;
  }

  result = readiness::pollUntil(
      fmt::format("{} active", name), [&runner, &name]() { return isServiceActive(runner, name); },
      fmt::format("{} did not become active after start", name), policy);
  if (!result.ok()) {
    result.status = SetupStatus::SERVICE_START_ERROR;
  }
  return result;
}

} // namespace boot

} // namespace opssetup
