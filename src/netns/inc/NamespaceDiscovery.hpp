#ifndef OPSSETUP_NETNS_NAMESPACE_DISCOVERY_HPP
#define OPSSETUP_NETNS_NAMESPACE_DISCOVERY_HPP
/**
 * @file NamespaceDiscovery.hpp
 * @brief Deployment mode detection and device classification.
 * @note Linux-only. Reads /var/run/netns and /sys/class/net; lists devices
 *       inside a namespace with `ip netns exec`.
 *
 * One-shot classification: failures are fatal and never retried.
 */

#include "src/exec/inc/CommandRunner.hpp"
#include "src/helpers/inc/Status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace opssetup {

namespace netns {

/* ----------------------------- NamespaceMode ----------------------------- */

/**
 * @brief Where bound devices end up.
 */
enum class NamespaceMode : std::uint8_t {
  SINGLE = 0, ///< Devices live in the switch namespace
  DUAL,       ///< Devices pass through the switch namespace into the emulation namespace
};

/**
 * @brief Human-readable mode string.
 * @return Static string.
 */
[[nodiscard]] const char* toString(NamespaceMode mode) noexcept;

/* ----------------------------- NamespaceLayout ----------------------------- */

/**
 * @brief Namespace names and the paths used to inspect them.
 */
struct NamespaceLayout {
  std::string netnsDir{"/var/run/netns"};      ///< Runtime files of named namespaces
  std::string sysClassNet{"/sys/class/net"};   ///< Device directory in the root namespace
  std::string primary{"swns"};                 ///< Switch namespace
  std::string secondary{"emulns"};             ///< Emulation (dataplane) namespace

  /// @brief Namespace devices are finally bound into for the given mode.
  [[nodiscard]] const std::string& activeNamespace(NamespaceMode mode) const noexcept;
};

/* ----------------------------- Discovery ----------------------------- */

/**
 * @brief Result of classifying the current devices.
 */
struct Discovery {
  NamespaceMode mode{NamespaceMode::SINGLE};
  std::vector<std::string> unbound; ///< Devices in the root namespace, sorted
  std::vector<std::string> bound;   ///< Devices already in the active namespace

  SetupStatus status{SetupStatus::OK};
  std::string message; ///< Failure detail, including command output

  /// @brief True if classification succeeded.
  [[nodiscard]] bool ok() const noexcept;

  /// @brief True if name is present in the active namespace.
  [[nodiscard]] bool isBound(const std::string& name) const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Decide the mode from the list of existing namespaces.
 * @param namespaces Names found in the namespace runtime directory.
 * @param layout Namespace names.
 * @return DUAL iff the secondary namespace is present.
 */
[[nodiscard]] NamespaceMode detectNamespaceMode(const std::vector<std::string>& namespaces,
                                                const NamespaceLayout& layout) noexcept;

/**
 * @brief Argv listing the devices visible inside a namespace.
 */
[[nodiscard]] exec::Argv listDevicesArgv(const NamespaceLayout& layout,
                                         const std::string& netns);

/**
 * @brief Determine mode and classify unbound and bound devices.
 * @param layout Namespace names and inspection paths.
 * @param runner Executes `ip netns exec <ns> ls <sysClassNet>`.
 * @return Populated Discovery, or PROVISIONING_ERROR if any inspection fails.
 */
[[nodiscard]] Discovery discoverNamespaces(const NamespaceLayout& layout,
                                           exec::CommandRunner& runner);

} // namespace netns

} // namespace opssetup

#endif // OPSSETUP_NETNS_NAMESPACE_DISCOVERY_HPP
