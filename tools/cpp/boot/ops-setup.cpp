/**
 * @file ops-setup.cpp
 * @brief Boot-time interface provisioning and readiness sequence.
 *
 * Binds the interfaces handed to the container to hardware port names, moves
 * them into the switch namespaces and waits for the switch daemons to come
 * up. Exits 0 when every step completed, 1 on usage errors, 2 otherwise.
 */

#include "src/boot/inc/BootOrchestrator.hpp"
#include "src/boot/inc/SetupConfig.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/ovsdb/inc/DbClient.hpp"

#include <csignal>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace boot = opssetup::boot;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_VERBOSE = 1,
  ARG_CONFIG = 2,
  ARG_JSON = 3,
};

/// Exit codes.
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_BOOT_FAILED = 2;

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Bind container interfaces to hardware ports and wait for the switch to boot.";

/// Build argument definitions.
opssetup::helpers::args::ArgMap buildArgMap() {
  opssetup::helpers::args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Log debug output"};
  map[ARG_CONFIG] = {"--config", 1, false, "YAML file overriding paths, names and timeouts"};
  map[ARG_JSON] = {"--json", 0, false, "Print the boot summary as JSON on stdout"};
  return map;
}

/* ----------------------------- Output ----------------------------- */

void printJson(const boot::BootReport& report) {
  fmt::print("{{\n");
  fmt::print("  \"status\": \"{}\",\n", opssetup::toString(report.status));
  fmt::print("  \"failedStep\": \"{}\",\n", report.failedStep);
  fmt::print("  \"completedSteps\": {},\n", report.completedSteps.size());
  fmt::print("  \"mode\": \"{}\",\n", opssetup::netns::toString(report.binding.mode));
  fmt::print("  \"mapping\": {},\n", report.binding.mapping.toJson());
  std::string bound;
  for (const std::string& label : report.binding.bound) {
    bound += fmt::format("{}\"{}\"", bound.empty() ? "" : ", ", label);
  }
  fmt::print("  \"bound\": [{}]\n", bound);
  fmt::print("}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const opssetup::helpers::args::ArgMap ARG_MAP = buildArgMap();
  opssetup::helpers::args::ParsedArgs pargs;
  bool verbose = false;
  bool jsonOutput = false;
  std::string configPath;

  if (argc > 1) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) {
      args.emplace_back(argv[i]);
    }

    std::string error;
    if (!opssetup::helpers::args::parseArgs(args, ARG_MAP, pargs, error)) {
      fmt::print(stderr, "Error: {}\n\n", error);
      opssetup::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return EXIT_USAGE;
    }

    if (pargs.count(ARG_HELP) != 0) {
      opssetup::helpers::args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
      return EXIT_OK;
    }

    verbose = (pargs.count(ARG_VERBOSE) != 0);
    jsonOutput = (pargs.count(ARG_JSON) != 0);
    if (pargs.count(ARG_CONFIG) != 0) {
      configPath = std::string(pargs[ARG_CONFIG][0]);
    }
  }

  opssetup::helpers::log::configureLogging(verbose);

  // A closed database socket must surface as a send error.
  std::signal(SIGPIPE, SIG_IGN);

  boot::SetupConfig config{};
  if (!configPath.empty()) {
    std::string error;
    const opssetup::SetupStatus ST = boot::loadSetupConfig(configPath, config, error);
    if (ST != opssetup::SetupStatus::OK) {
      spdlog::error("Configuration: {} ({})", opssetup::toString(ST), error);
      return EXIT_USAGE;
    }
  }
  spdlog::debug("Configuration:\n{}", config.toString());

  opssetup::exec::SystemCommandRunner runner(config.commandTimeout);
  opssetup::ovsdb::DbClient db(config.dbSocketPath, config.dbName, config.dbRecvTimeout());
  boot::BootOrchestrator orchestrator(config, runner, db);

  const boot::BootReport REPORT = orchestrator.run();

  if (jsonOutput) {
    printJson(REPORT);
  }

  if (!REPORT.ok()) {
    spdlog::error("{}", REPORT.toString());
    if (!REPORT.binding.failedCommand.empty()) {
      spdlog::error("Command: {}", REPORT.binding.failedCommand);
      spdlog::error("Output: {}", REPORT.binding.commandOutput);
    }
    return EXIT_BOOT_FAILED;
  }

  spdlog::info("{}", REPORT.toString());
  return EXIT_OK;
}
