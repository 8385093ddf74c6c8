/**
 * @file NamespaceDiscovery.cpp
 * @brief Implementation of namespace mode detection and device classification.
 */

#include "src/netns/inc/NamespaceDiscovery.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace opssetup {

namespace netns {

using helpers::files::listDirectory;
using helpers::strings::join;
using helpers::strings::splitWhitespace;

/* ----------------------------- Mode Helpers ----------------------------- */

const char* toString(NamespaceMode mode) noexcept {
  switch (mode) {
  case NamespaceMode::SINGLE:
    return "single";
  case NamespaceMode::DUAL:
    return "dual";
  }
  return "unknown";
}

const std::string& NamespaceLayout::activeNamespace(NamespaceMode mode) const noexcept {
  return mode == NamespaceMode::DUAL ? secondary : primary;
}

/* ----------------------------- Discovery Methods ----------------------------- */

bool Discovery::ok() const noexcept { return status == SetupStatus::OK; }

bool Discovery::isBound(const std::string& name) const noexcept {
  return std::find(bound.begin(), bound.end(), name) != bound.end();
}

std::string Discovery::toString() const {
  if (!ok()) {
    return fmt::format("discovery: {} ({})", opssetup::toString(status), message);
  }
  return fmt::format("discovery: mode={} unbound=[{}] bound=[{}]", netns::toString(mode),
                     join(unbound, ","), join(bound, ","));
}

/* ----------------------------- API ----------------------------- */

NamespaceMode detectNamespaceMode(const std::vector<std::string>& namespaces,
                                  const NamespaceLayout& layout) noexcept {
  const bool HAS_SECONDARY =
      std::find(namespaces.begin(), namespaces.end(), layout.secondary) != namespaces.end();
  return HAS_SECONDARY ? NamespaceMode::DUAL : NamespaceMode::SINGLE;
}

exec::Argv listDevicesArgv(const NamespaceLayout& layout, const std::string& netns) {
  return {"ip", "netns", "exec", netns, "ls", layout.sysClassNet};
}

Discovery discoverNamespaces(const NamespaceLayout& layout, exec::CommandRunner& runner) {
  Discovery disc{};

  std::vector<std::string> namespaces;
  if (!listDirectory(layout.netnsDir, namespaces)) {
    disc.status = SetupStatus::PROVISIONING_ERROR;
    disc.message = fmt::format("cannot list namespaces in {}", layout.netnsDir);
    return disc;
  }
  disc.mode = detectNamespaceMode(namespaces, layout);

  if (!listDirectory(layout.sysClassNet, disc.unbound)) {
    disc.status = SetupStatus::PROVISIONING_ERROR;
    disc.message = fmt::format("cannot list devices in {}", layout.sysClassNet);
    return disc;
  }

  const exec::Argv ARGV = listDevicesArgv(layout, layout.activeNamespace(disc.mode));
  const exec::CommandResult RES = runner.run(ARGV);
  if (!RES.ok()) {
    disc.status = SetupStatus::PROVISIONING_ERROR;
    disc.message = fmt::format("'{}' failed: {}", exec::formatArgv(ARGV), RES.toString());
    return disc;
  }
  disc.bound = splitWhitespace(RES.output);

  spdlog::debug("{}", disc.toString());
  return disc;
}

} // namespace netns

} // namespace opssetup
