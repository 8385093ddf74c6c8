/**
 * @file PortBinder.cpp
 * @brief Implementation of interface binding, migration and registration.
 */

#include "src/binder/inc/PortBinder.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/hwdesc/inc/HardwareDescriptor.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace opssetup {

namespace binder {

using netns::NamespaceMode;

namespace {

/**
 * Run one provisioning command; on failure record it in result.
 * Returns true if the command succeeded.
 */
bool runStep(exec::CommandRunner& runner, const exec::Argv& argv, BindResult& result) {
  const exec::CommandResult RES = runner.run(argv);
  if (RES.ok()) {
    return true;
  }

  result.status = SetupStatus::PROVISIONING_ERROR;
  result.failedCommand = exec::formatArgv(argv);
  result.commandOutput = RES.output;
  result.message = fmt::format("'{}' failed: {}", result.failedCommand, RES.toString());
  spdlog::error("{}", result.message);
  return false;
}

/// Wait for the device to report UP inside the dataplane namespace.
bool waitLinkUp(const BinderConfig& config, const std::string& port,
                exec::CommandRunner& runner, BindResult& result) {
  const exec::Argv SHOW = {"ip", "netns", "exec", config.layout.secondary,
                           "ip", "link",  "show", port};

  const readiness::PollResult POLL = readiness::pollUntil(
      fmt::format("link {}", port),
      [&runner, &SHOW]() {
        const exec::CommandResult RES = runner.run(SHOW);
        return RES.ok() && isLinkUp(RES.output);
      },
      fmt::format("{} interface did not come up", config.layout.secondary), config.linkPoll);

  if (POLL.ok()) {
    return true;
  }

  result.status = SetupStatus::LINK_NOT_UP;
  result.failedCommand = exec::formatArgv(SHOW);
  result.message = POLL.message;
  spdlog::error("{}", result.message);
  return false;
}

} // namespace

/* ----------------------------- BindResult Methods ----------------------------- */

bool BindResult::ok() const noexcept { return status == SetupStatus::OK; }

bool BindResult::isBound(std::string_view label) const noexcept {
  return std::find(bound.begin(), bound.end(), label) != bound.end();
}

std::string BindResult::toString() const {
  std::string out = fmt::format("bind: {} mode={} mapping={{{}}}", opssetup::toString(status),
                                netns::toString(mode), mapping.toString());
  std::vector<std::string> reservedOnly;
  for (const auto& [label, port] : mapping.entries()) {
    if (!isBound(label)) {
      reservedOnly.push_back(label);
    }
  }
  if (!reservedOnly.empty()) {
    out += fmt::format(" not-moved=[{}]", helpers::strings::join(reservedOnly, ","));
  }
  if (!remaining.empty()) {
    out += fmt::format(" remaining=[{}]", helpers::strings::join(remaining, ","));
  }
  if (!created.empty()) {
    out += fmt::format(" created=[{}]", helpers::strings::join(created, ","));
  }
  if (!message.empty()) {
    out += fmt::format(" ({})", message);
  }
  return out;
}

/* ----------------------------- API ----------------------------- */

bool isExcludedLabel(std::string_view label, const std::vector<std::string>& excluded) noexcept {
  return std::find(excluded.begin(), excluded.end(), label) != excluded.end();
}

AllocationPlan planAllocation(const std::vector<std::string>& unbound,
                              const std::vector<std::string>& excluded,
                              const std::vector<std::string>& descriptors) {
  AllocationPlan plan{};
  std::size_t next = 0;

  for (const std::string& label : unbound) {
    if (isExcludedLabel(label, excluded)) {
      plan.excluded.push_back(label);
      continue;
    }
    if (next >= descriptors.size()) {
      plan.exhausted = true;
      plan.unassignedLabel = label;
      break;
    }
    plan.assignments.emplace_back(label, descriptors[next]);
    ++next;
  }

  plan.remaining.assign(descriptors.begin() + static_cast<std::ptrdiff_t>(next),
                        descriptors.end());
  return plan;
}

bool isLinkUp(std::string_view ipLinkOutput) {
  const std::size_t OPEN = ipLinkOutput.find('<');
  if (OPEN == std::string_view::npos) {
    return false;
  }
  const std::size_t CLOSE = ipLinkOutput.find('>', OPEN);
  if (CLOSE == std::string_view::npos) {
    return false;
  }

  std::string_view flags = ipLinkOutput.substr(OPEN + 1, CLOSE - OPEN - 1);
  while (!flags.empty()) {
    const std::size_t COMMA = flags.find(',');
    const std::string_view FLAG = flags.substr(0, COMMA);
    if (FLAG == "UP") {
      return true;
    }
    if (COMMA == std::string_view::npos) {
      break;
    }
    flags.remove_prefix(COMMA + 1);
  }
  return false;
}

BindResult bindPorts(const BinderConfig& config, const netns::Discovery& discovery,
                     const std::vector<std::string>& descriptors, exec::CommandRunner& runner) {
  BindResult result{};
  result.mode = discovery.mode;

  if (!discovery.ok()) {
    result.status = discovery.status;
    result.message = discovery.message;
    return result;
  }

  const AllocationPlan PLAN = planAllocation(discovery.unbound, config.excludedLabels, descriptors);

  for (const std::string& label : PLAN.excluded) {
    spdlog::debug("  - Skipping excluded device {}", label);
  }

  if (PLAN.exhausted) {
    for (const auto& [label, port] : PLAN.assignments) {
      result.mapping.insert(label, port);
    }
    result.status = SetupStatus::EXHAUSTED_PORTS;
    result.message =
        fmt::format("no hardware port left for device '{}' ({} descriptor entries)",
                    PLAN.unassignedLabel, descriptors.size());
    spdlog::error("{}", result.message);
    return result;
  }

  result.remaining = PLAN.remaining;

  const std::string& PRIMARY = config.layout.primary;
  const std::string& SECONDARY = config.layout.secondary;

  for (const auto& [label, port] : PLAN.assignments) {
    result.mapping.insert(label, port);

    if (!runStep(runner, {"ip", "link", "set", label, "name", port}, result)) {
      return result;
    }
    if (!runStep(runner, {"ip", "link", "set", port, "netns", PRIMARY}, result)) {
      return result;
    }

    if (discovery.mode == NamespaceMode::SINGLE) {
      result.bound.push_back(label);
      spdlog::info("  - Port {} moved to {} netns as {}.", label, PRIMARY, port);
      continue;
    }

    if (!runStep(runner,
                 {"ip", "netns", "exec", PRIMARY, "ip", "link", "set", port, "netns", SECONDARY},
                 result)) {
      return result;
    }
    if (!runStep(runner, {"ip", "netns", "exec", SECONDARY, "ip", "link", "set", "dev", port, "up"},
                 result)) {
      return result;
    }
    if (!waitLinkUp(config, port, runner, result)) {
      return result;
    }
    result.bound.push_back(label);
    spdlog::info("  - Port {} moved to {} netns as {}.", label, SECONDARY, port);

    const dataplane::RegistrationResult REG =
        dataplane::registerPort(config.dataplane, port, port, runner);
    if (!REG.ok()) {
      result.status = REG.status;
      result.failedCommand = REG.command;
      result.commandOutput = REG.reply;
      result.message = REG.message;
      spdlog::error("{}", result.message);
      return result;
    }
    result.registered.push_back(port);
  }

  return result;
}

void materializeRemaining(const BinderConfig& config, const netns::Discovery& discovery,
                          exec::CommandRunner& runner, BindResult& result) {
  const std::string& PRIMARY = config.layout.primary;

  for (const std::string& port : result.remaining) {
    if (discovery.isBound(port)) {
      continue;
    }

    if (result.mode == NamespaceMode::DUAL) {
      spdlog::info("  - Port {} expected to be created by the host", port);
      continue;
    }

    if (!runStep(runner, {"ip", "tuntap", "add", "dev", port, "mode", "tap"}, result)) {
      return;
    }
    if (!runStep(runner, {"ip", "link", "set", port, "netns", PRIMARY}, result)) {
      return;
    }
    result.created.push_back(port);
    spdlog::info("  - Port {} created in {} netns.", port, PRIMARY);
  }
}

BindResult runPortBinder(const BinderConfig& config, exec::CommandRunner& runner) {
  const hwdesc::HardwareDescriptor DESC = hwdesc::loadHardwareDescriptor(config.descriptorPath);
  if (!DESC.ok()) {
    BindResult result{};
    result.status = DESC.status;
    result.message = DESC.message;
    spdlog::error("{}", DESC.toString());
    return result;
  }
  spdlog::debug("{}", DESC.toString());

  const netns::Discovery DISC = netns::discoverNamespaces(config.layout, runner);
  if (!DISC.ok()) {
    BindResult result{};
    result.status = DISC.status;
    result.message = DISC.message;
    spdlog::error("{}", DISC.toString());
    return result;
  }
  spdlog::info("Binding interfaces ({} namespace mode)", netns::toString(DISC.mode));

  BindResult result = bindPorts(config, DISC, DESC.ports, runner);
  if (!result.ok()) {
    return result;
  }

  const std::string MAPPING_PATH =
      config.mappingPath.empty()
          ? fmt::format("{}/{}", helpers::files::executableDirectory(), PORT_MAPPING_FILE_NAME)
          : config.mappingPath;
  if (savePortMapping(MAPPING_PATH, result.mapping) != SetupStatus::OK) {
    result.status = SetupStatus::IO_ERROR;
    result.message = fmt::format("cannot write port mapping to {}", MAPPING_PATH);
    spdlog::error("{}", result.message);
    return result;
  }
  spdlog::debug("Port mapping written to {}: {}", MAPPING_PATH, result.mapping.toJson());

  materializeRemaining(config, DISC, runner, result);
  if (!result.ok()) {
    return result;
  }

  if (!helpers::files::touchFile(config.readyMarkerPath)) {
    result.status = SetupStatus::IO_ERROR;
    result.message = fmt::format("cannot create {}", config.readyMarkerPath);
    spdlog::error("{}", result.message);
    return result;
  }

  spdlog::info("Interfaces ready: {}", result.mapping.toString());
  return result;
}

} // namespace binder

} // namespace opssetup
