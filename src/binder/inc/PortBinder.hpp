#ifndef OPSSETUP_BINDER_PORT_BINDER_HPP
#define OPSSETUP_BINDER_PORT_BINDER_HPP
/**
 * @file PortBinder.hpp
 * @brief Binds host-provided interfaces to hardware port names.
 * @note Linux-only. Issues `ip link` / `ip netns` / `ip tuntap` commands.
 *
 * Phases of one run:
 *  1. Discover  - namespace mode, unbound and bound devices.
 *  2. Reserve   - pop one descriptor entry per non-excluded unbound device;
 *                 fail before touching the OS if the entries run out.
 *  3. Allocate  - rename, migrate and (dual mode) bring up and register.
 *  4. Persist   - write port_mapping.json.
 *  5. Materialize remaining ports (single mode creates tap devices).
 *  6. Signal    - create the ports-ready marker file.
 *
 * Nothing is rolled back on failure; partial namespace state is recovered by
 * restarting the container.
 */

#include "src/binder/inc/PortMapping.hpp"
#include "src/dataplane/inc/DataplaneRegistrar.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/netns/inc/NamespaceDiscovery.hpp"
#include "src/readiness/inc/ReadinessPoller.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace opssetup {

namespace binder {

/* ----------------------------- BinderConfig ----------------------------- */

/**
 * @brief Everything one binder run needs to know.
 */
struct BinderConfig {
  netns::NamespaceLayout layout;
  dataplane::DataplaneConfig dataplane;
  readiness::PollPolicy linkPoll; ///< Budget for a device to report UP (dual mode)

  /// Devices never bound: loopback, management, primary NIC, bonding aggregate.
  std::vector<std::string> excludedLabels{"lo", "oobm", "eth0", "bonding_masters"};

  std::string descriptorPath{"/etc/openswitch/hwdesc/ports.yaml"};
  std::string mappingPath;                                ///< Defaults next to the executable
  std::string readyMarkerPath{"/tmp/ops-virt-ports-ready"};
};

/* ----------------------------- AllocationPlan ----------------------------- */

/**
 * @brief Output of the reserve phase.
 */
struct AllocationPlan {
  std::vector<std::pair<std::string, std::string>> assignments; ///< (label, port) in order
  std::vector<std::string> remaining; ///< Descriptor entries left unassigned
  std::vector<std::string> excluded;  ///< Labels skipped by the exclusion set
  bool exhausted{false};              ///< Ran out of descriptor entries
  std::string unassignedLabel;        ///< First label that found no entry
};

/* ----------------------------- BindResult ----------------------------- */

/**
 * @brief Outcome of a binder run.
 */
struct BindResult {
  SetupStatus status{SetupStatus::OK};
  netns::NamespaceMode mode{netns::NamespaceMode::SINGLE};
  PortMapping mapping;                  ///< Ports assigned so far, moved or only reserved
  std::vector<std::string> bound;       ///< Labels whose device was renamed and moved
  std::vector<std::string> remaining;   ///< Ports not bound to a host device
  std::vector<std::string> created;     ///< Ports materialized as new tap devices
  std::vector<std::string> registered;  ///< Ports added to the dataplane
  std::string failedCommand;            ///< Command that failed, if any
  std::string commandOutput;            ///< Its captured output
  std::string message;                  ///< Failure detail (empty on success)

  /// @brief True if every phase completed.
  [[nodiscard]] bool ok() const noexcept;

  /// @brief True if label's device was actually migrated, not just reserved.
  [[nodiscard]] bool isBound(std::string_view label) const noexcept;

  /// @brief Human-readable summary; lists reserved-only labels separately.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Check a label against the exclusion set.
 */
[[nodiscard]] bool isExcludedLabel(std::string_view label,
                                   const std::vector<std::string>& excluded) noexcept;

/**
 * @brief Reserve phase: assign descriptor entries FIFO to unbound labels.
 * @param unbound Labels in discovery order.
 * @param excluded Labels to skip; they consume no entry.
 * @param descriptors Hardware port names in descriptor order.
 * @return Plan; exhausted is set when a label found no entry, in which case
 *         assignments hold exactly the reservations made before it.
 */
[[nodiscard]] AllocationPlan planAllocation(const std::vector<std::string>& unbound,
                                            const std::vector<std::string>& excluded,
                                            const std::vector<std::string>& descriptors);

/**
 * @brief Check `ip link show` output for the UP interface flag.
 * @param ipLinkOutput Output such as "3: 1: <BROADCAST,MULTICAST,UP,LOWER_UP> ...".
 */
[[nodiscard]] bool isLinkUp(std::string_view ipLinkOutput);

/**
 * @brief Reserve and allocate phases for an already discovered system.
 * @param config Namespace layout, exclusions, dataplane and link budget.
 * @param discovery Mode and device classification.
 * @param descriptors Hardware port names in descriptor order.
 * @param runner Executes the interface commands.
 * @return OK with the mapping and remaining ports; EXHAUSTED_PORTS (no command
 *         issued), PROVISIONING_ERROR, LINK_NOT_UP or REGISTRATION_ERROR with
 *         the mapping built so far.
 */
[[nodiscard]] BindResult bindPorts(const BinderConfig& config, const netns::Discovery& discovery,
                                   const std::vector<std::string>& descriptors,
                                   exec::CommandRunner& runner);

/**
 * @brief Materialize phase for ports left after allocation.
 *
 * Single mode creates a tap device per port that is not already in the
 * active namespace and moves it there. Dual mode only logs: the host
 * materializes those ports itself.
 *
 * @param result In/out: reads mode and remaining, fills created; status set on failure.
 */
void materializeRemaining(const BinderConfig& config, const netns::Discovery& discovery,
                          exec::CommandRunner& runner, BindResult& result);

/**
 * @brief Full binder run: load descriptor, discover, bind, persist,
 *        materialize and signal.
 * @param config Binder configuration.
 * @param runner Executes the interface commands.
 * @return Outcome of the first failing phase, or OK.
 */
[[nodiscard]] BindResult runPortBinder(const BinderConfig& config, exec::CommandRunner& runner);

} // namespace binder

} // namespace opssetup

#endif // OPSSETUP_BINDER_PORT_BINDER_HPP
