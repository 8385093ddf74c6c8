/**
 * @file SetupConfig.cpp
 * @brief SetupConfig defaults dump and YAML overrides.
 */

#include "src/boot/inc/SetupConfig.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace opssetup {

namespace boot {

namespace {

/* ----------------------------- Field Readers ----------------------------- */

void readString(const YAML::Node& root, const char* key, std::string& field) {
  const YAML::Node NODE = root[key];
  if (!NODE) {
    return;
  }
  if (!NODE.IsScalar() || NODE.Scalar().empty()) {
    throw std::runtime_error(fmt::format("'{}' must be a non-empty string", key));
  }
  field = NODE.Scalar();
}

/// Returns false when key is absent.
bool readPositive(const YAML::Node& root, const char* key, long long max, long long& value) {
  const YAML::Node NODE = root[key];
  if (!NODE) {
    return false;
  }
  try {
    value = NODE.as<long long>();
  } catch (const YAML::Exception&) {
    throw std::runtime_error(fmt::format("'{}' must be an integer", key));
  }
  if (value <= 0) {
    throw std::runtime_error(fmt::format("'{}' must be positive", key));
  }
  if (value > max) {
    throw std::runtime_error(fmt::format("'{}' must not exceed {}", key, max));
  }
  return true;
}

void readLabels(const YAML::Node& root, const char* key, std::vector<std::string>& field) {
  const YAML::Node NODE = root[key];
  if (!NODE) {
    return;
  }
  if (!NODE.IsSequence()) {
    throw std::runtime_error(fmt::format("'{}' must be a list", key));
  }
  std::vector<std::string> labels;
  for (const auto& ITEM : NODE) {
    if (!ITEM.IsScalar()) {
      throw std::runtime_error(fmt::format("'{}' entries must be strings", key));
    }
    labels.push_back(ITEM.Scalar());
  }
  field = std::move(labels);
}

} // namespace

/* ----------------------------- SetupConfig Methods ----------------------------- */

std::string SetupConfig::primaryNetnsPath() const {
  return fmt::format("{}/{}", binder.layout.netnsDir, binder.layout.primary);
}

std::chrono::milliseconds SetupConfig::dbRecvTimeout() const noexcept {
  return std::clamp(poll.interval, std::chrono::milliseconds{1}, ovsdb::DEFAULT_RECV_TIMEOUT);
}

std::string SetupConfig::toString() const {
  std::string out;
  out += fmt::format("  poll:            every {} ms, timeout {} ms\n", poll.interval.count(),
                     poll.timeout.count());
  out += fmt::format("  commands:        timeout {} ms, db reply {} ms\n", commandTimeout.count(),
                     dbRecvTimeout().count());
  out += fmt::format("  link poll:       every {} ms, timeout {} ms\n",
                     binder.linkPoll.interval.count(), binder.linkPoll.timeout.count());
  out += fmt::format("  namespaces:      {} / {} (in {})\n", binder.layout.primary,
                     binder.layout.secondary, binder.layout.netnsDir);
  out += fmt::format("  descriptor:      {}\n", binder.descriptorPath);
  out += fmt::format("  mapping:         {}\n",
                     binder.mappingPath.empty() ? "(next to executable)" : binder.mappingPath);
  out += fmt::format("  ready marker:    {}\n", binder.readyMarkerPath);
  out += fmt::format("  excluded:        {}\n", helpers::strings::join(binder.excludedLabels, ","));
  out += fmt::format("  database:        {} at {} (flags {}, {})\n", dbName, dbSocketPath,
                     hwReadyFlag, cfgReadyFlag);
  out += fmt::format("  services:        {} ({}), {}\n", switchdService, switchdPidPath,
                     restdService);
  out += fmt::format("  hostname:        {}\n", expectedHostname);
  out += fmt::format("  dataplane:       {} --json {} --thrift-port {}\n",
                     binder.dataplane.cliPath, binder.dataplane.programJson,
                     binder.dataplane.thriftPort);
  return out;
}

/* ----------------------------- API ----------------------------- */

SetupStatus applySetupConfig(std::string_view document, SetupConfig& config,
                             std::string& error) noexcept {
  try {
    const YAML::Node ROOT = YAML::Load(std::string(document));
    if (ROOT.IsNull()) {
      return SetupStatus::OK; // Empty file: keep defaults
    }
    if (!ROOT.IsMap()) {
      error = "config document is not a mapping";
      return SetupStatus::PARSE_ERROR;
    }

    SetupConfig next = config;
    long long value = 0;

    if (readPositive(ROOT, "timeout_seconds", MAX_CONFIG_SECONDS, value)) {
      next.poll.timeout = std::chrono::seconds(value);
      next.binder.linkPoll.timeout = std::chrono::seconds(value);
    }
    if (readPositive(ROOT, "interval_ms", MAX_CONFIG_SECONDS * 1000, value)) {
      next.poll.interval = std::chrono::milliseconds(value);
      next.binder.linkPoll.interval = std::chrono::milliseconds(value);
    }
    if (readPositive(ROOT, "link_timeout_seconds", MAX_CONFIG_SECONDS, value)) {
      next.binder.linkPoll.timeout = std::chrono::seconds(value);
    }
    if (readPositive(ROOT, "command_timeout_seconds", MAX_CONFIG_SECONDS, value)) {
      next.commandTimeout = std::chrono::seconds(value);
    }
    if (readPositive(ROOT, "thrift_port", 65535, value)) {
      next.binder.dataplane.thriftPort = static_cast<int>(value);
    }

    readString(ROOT, "descriptor_path", next.binder.descriptorPath);
    readString(ROOT, "mapping_path", next.binder.mappingPath);
    readString(ROOT, "ready_marker_path", next.binder.readyMarkerPath);
    readString(ROOT, "netns_dir", next.binder.layout.netnsDir);
    readString(ROOT, "sys_class_net", next.binder.layout.sysClassNet);
    readString(ROOT, "primary_netns", next.binder.layout.primary);
    readString(ROOT, "secondary_netns", next.binder.layout.secondary);
    readString(ROOT, "runtime_cli", next.binder.dataplane.cliPath);
    readString(ROOT, "program_json", next.binder.dataplane.programJson);
    readLabels(ROOT, "excluded_labels", next.binder.excludedLabels);

    readString(ROOT, "hwdesc_dir", next.hwdescDir);
    readString(ROOT, "db_socket", next.dbSocketPath);
    readString(ROOT, "db_name", next.dbName);
    readString(ROOT, "hw_flag", next.hwReadyFlag);
    readString(ROOT, "cfg_flag", next.cfgReadyFlag);
    readString(ROOT, "switchd_pid", next.switchdPidPath);
    readString(ROOT, "switchd_service", next.switchdService);
    readString(ROOT, "restd_service", next.restdService);
    readString(ROOT, "hostname", next.expectedHostname);

    // The runtime CLI always runs in the dataplane namespace.
    next.binder.dataplane.netns = next.binder.layout.secondary;

    config = std::move(next);
    return SetupStatus::OK;
  } catch (const std::exception& e) {
    error = e.what();
    return SetupStatus::PARSE_ERROR;
  }
}

SetupStatus loadSetupConfig(const std::string& path, SetupConfig& config,
                            std::string& error) noexcept {
  try {
    std::string document;
    if (!helpers::files::readFileToString(path, document)) {
      error = fmt::format("cannot read {}", path);
      return SetupStatus::IO_ERROR;
    }
    const SetupStatus ST = applySetupConfig(document, config, error);
    if (ST != SetupStatus::OK) {
      error = fmt::format("{}: {}", path, error);
    }
    return ST;
  } catch (const std::exception& e) {
    error = e.what();
    return SetupStatus::IO_ERROR;
  }
}

} // namespace boot

} // namespace opssetup
