/**
 * @file HardwareDescriptor.cpp
 * @brief ports.yaml loading via yaml-cpp.
 */

#include "src/hwdesc/inc/HardwareDescriptor.hpp"
#include "src/helpers/inc/Files.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace opssetup {

namespace hwdesc {

namespace {

inline HardwareDescriptor fail(SetupStatus status, std::string message) {
  HardwareDescriptor desc{};
  desc.status = status;
  desc.message = std::move(message);
  return desc;
}

} // namespace

/* ----------------------------- HardwareDescriptor Methods ----------------------------- */

bool HardwareDescriptor::ok() const noexcept { return status == SetupStatus::OK; }

std::string HardwareDescriptor::toString() const {
  if (!ok()) {
    return fmt::format("hardware descriptor: {} ({})", opssetup::toString(status), message);
  }

  std::string out = fmt::format("hardware descriptor: {} ports [", ports.size());
  for (std::size_t i = 0; i < ports.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    out += ports[i];
  }
  out += ']';
  return out;
}

/* ----------------------------- API ----------------------------- */

HardwareDescriptor parseHardwareDescriptor(std::string_view document) noexcept {
  try {
    const YAML::Node ROOT = YAML::Load(std::string(document));
    if (!ROOT.IsMap()) {
      return fail(SetupStatus::PARSE_ERROR, "document is not a mapping");
    }

    const YAML::Node PORTS = ROOT["ports"];
    if (!PORTS || !PORTS.IsSequence()) {
      return fail(SetupStatus::PARSE_ERROR, "missing 'ports' sequence");
    }

    HardwareDescriptor desc{};
    desc.ports.reserve(PORTS.size());

    for (std::size_t i = 0; i < PORTS.size(); ++i) {
      const YAML::Node NAME = PORTS[i]["name"];
      if (!NAME || !NAME.IsScalar() || NAME.Scalar().empty()) {
        return fail(SetupStatus::PARSE_ERROR, fmt::format("port entry {} has no name", i));
      }

      std::string name = NAME.Scalar();
      if (std::find(desc.ports.begin(), desc.ports.end(), name) != desc.ports.end()) {
        return fail(SetupStatus::PARSE_ERROR, fmt::format("duplicate port name '{}'", name));
      }
      desc.ports.push_back(std::move(name));
    }

    return desc;
  } catch (const YAML::Exception& e) {
    return fail(SetupStatus::PARSE_ERROR, e.what());
  } catch (const std::exception& e) {
    return fail(SetupStatus::PARSE_ERROR, e.what());
  }
}

HardwareDescriptor loadHardwareDescriptor(const std::string& path) noexcept {
  try {
    std::string document;
    if (!helpers::files::readFileToString(path, document)) {
      return fail(SetupStatus::IO_ERROR, fmt::format("cannot read {}", path));
    }

    HardwareDescriptor desc = parseHardwareDescriptor(document);
    if (!desc.ok()) {
      desc.message = fmt::format("{}: {}", path, desc.message);
    }
    return desc;
  } catch (const std::exception& e) {
    return fail(SetupStatus::IO_ERROR, e.what());
  }
}

} // namespace hwdesc

} // namespace opssetup
