/**
 * @file BootOrchestrator.cpp
 * @brief Boot step construction and sequencing.
 */

#include "src/boot/inc/BootOrchestrator.hpp"
#include "src/boot/inc/ServiceProbes.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace opssetup {

namespace boot {

namespace {

StepOutcome fromPoll(const readiness::PollResult& poll) {
  StepOutcome out{};
  out.status = poll.status;
  out.message = poll.message;
  return out;
}

} // namespace

/* ----------------------------- Steps ----------------------------- */

BootStep makeGate(std::string name, readiness::Predicate predicate, std::string errorMessage,
                  const readiness::PollPolicy& policy) {
  BootStep step{};
  step.name = name;
  step.run = [name = std::move(name), predicate = std::move(predicate),
              errorMessage = std::move(errorMessage), policy]() {
    return fromPoll(readiness::pollUntil(name, predicate, errorMessage, policy));
  };
  return step;
}

std::string BootReport::toString() const {
  if (ok()) {
    return fmt::format("boot: OK ({} steps)", completedSteps.size());
  }
  return fmt::format("boot: {} at '{}' after {} steps: {}", opssetup::toString(status), failedStep,
                     completedSteps.size(), message);
}

BootReport runSteps(const std::vector<BootStep>& steps) {
  BootReport report{};

  for (std::size_t i = 0; i < steps.size(); ++i) {
    const BootStep& STEP = steps[i];
    spdlog::info("[{}/{}] Waiting for {}", i + 1, steps.size(), STEP.name);

    const StepOutcome OUT = STEP.run();
    if (!OUT.ok()) {
      report.status = OUT.status;
      report.failedStep = STEP.name;
      report.message = OUT.message;
      spdlog::error("{} failed: {} ({})", STEP.name, opssetup::toString(OUT.status), OUT.message);
      return report;
    }

    spdlog::info("[{}/{}] {} ready", i + 1, steps.size(), STEP.name);
    report.completedSteps.push_back(STEP.name);
  }

  return report;
}

/* ----------------------------- BootOrchestrator ----------------------------- */

BootOrchestrator::BootOrchestrator(const SetupConfig& config, exec::CommandRunner& runner,
                                   ovsdb::DbClient& db, HostnameSource hostname)
    : config_(config), runner_(runner), db_(db), hostname_(std::move(hostname)) {}

BootOrchestrator::HostnameSource BootOrchestrator::currentHostnameSource() {
  return []() { return currentHostname(); };
}

bool BootOrchestrator::flagSet(const std::string& flag) {
  const ovsdb::FlagResult RES = db_.queryFlag(flag);
  if (!RES.ok()) {
    spdlog::debug("{} query: {}", flag, RES.toString());
    return false;
  }
  return RES.value;
}

std::vector<BootStep> BootOrchestrator::buildSteps() {
  const readiness::PollPolicy& POLICY = config_.poll;
  std::vector<BootStep> steps;
  steps.reserve(10);

  const std::string NETNS_PATH = config_.primaryNetnsPath();
  steps.push_back(makeGate(
      fmt::format("{} netns", config_.binder.layout.primary),
      [NETNS_PATH]() { return helpers::files::pathExists(NETNS_PATH); },
      fmt::format("{} not found", NETNS_PATH), POLICY));

  const std::string HWDESC_DIR = config_.hwdescDir;
  steps.push_back(makeGate(
      "hardware descriptor", [HWDESC_DIR]() { return helpers::files::isDirectory(HWDESC_DIR); },
      fmt::format("{} not found", HWDESC_DIR), POLICY));

  steps.push_back(BootStep{"interface binding", [this]() {
                             binding_ = binder::runPortBinder(config_.binder, runner_);
                             StepOutcome out{};
                             out.status = binding_.status;
                             out.message = binding_.message;
                             return out;
                           }});

  const std::string DB_SOCKET = config_.dbSocketPath;
  steps.push_back(makeGate(
      "database socket", [DB_SOCKET]() { return helpers::files::pathExists(DB_SOCKET); },
      fmt::format("{} not found", DB_SOCKET), POLICY));

  for (const std::string& flag : {config_.hwReadyFlag, config_.cfgReadyFlag}) {
    steps.push_back(makeGate(
        fmt::format("{} flag", flag), [this, flag]() { return flagSet(flag); },
        fmt::format("{} not set in {} table", flag, ovsdb::SYSTEM_TABLE), POLICY));
  }

  const std::string PID_PATH = config_.switchdPidPath;
  steps.push_back(makeGate(
      fmt::format("{} pid", config_.switchdService),
      [PID_PATH]() { return helpers::files::pathExists(PID_PATH); },
      fmt::format("{} not found", PID_PATH), POLICY));

  const std::string SWITCHD = config_.switchdService;
  steps.push_back(makeGate(
      fmt::format("{} active", SWITCHD), [this, SWITCHD]() { return isServiceActive(runner_, SWITCHD); },
      fmt::format("{} is not active", SWITCHD), POLICY));

  const std::string HOSTNAME = config_.expectedHostname;
  steps.push_back(makeGate(
      "hostname", [this, HOSTNAME]() { return hostname_() == HOSTNAME; },
      fmt::format("hostname was never set to '{}'", HOSTNAME), POLICY));

  const std::string RESTD = config_.restdService;
  steps.push_back(BootStep{fmt::format("{} active", RESTD), [this, RESTD, POLICY]() {
                             return fromPoll(ensureServiceActive(runner_, RESTD, POLICY));
                           }});

  return steps;
}

BootReport BootOrchestrator::run() {
  binding_ = binder::BindResult{};
  BootReport report = runSteps(buildSteps());
  report.binding = binding_;
  if (report.ok()) {
    spdlog::info("Boot complete: {}", binding_.mapping.toString());
  }
  return report;
}

} // namespace boot

} // namespace opssetup
