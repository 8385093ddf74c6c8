#ifndef OPSSETUP_BOOT_SERVICE_PROBES_HPP
#define OPSSETUP_BOOT_SERVICE_PROBES_HPP
/**
 * @file ServiceProbes.hpp
 * @brief Process-manager and hostname checks used by the boot gates.
 * @note Linux-only. Talks to systemd through `systemctl`.
 */

#include "src/exec/inc/CommandRunner.hpp"
#include "src/readiness/inc/ReadinessPoller.hpp"

#include <string>

namespace opssetup {

namespace boot {

/// @brief Argv for `systemctl is-active <name>`.
[[nodiscard]] exec::Argv isActiveArgv(const std::string& name);

/// @brief Argv for `systemctl start <name>`.
[[nodiscard]] exec::Argv startArgv(const std::string& name);

/**
 * @brief True if the process manager reports the unit as "active".
 * @note `systemctl is-active` exits non-zero for inactive units; only the
 *       printed state is checked.
 */
[[nodiscard]] bool isServiceActive(exec::CommandRunner& runner, const std::string& name);

/**
 * @brief Ask the process manager to start a unit.
 * @return Result of `systemctl start`.
 */
[[nodiscard]] exec::CommandResult startService(exec::CommandRunner& runner,
                                               const std::string& name);

/**
 * @brief Current host name via gethostname(2).
 * @return Host name, or empty string on failure.
 */
[[nodiscard]] std::string currentHostname();

/**
 * @brief Make sure a unit is active, starting it if needed.
 *
 * Returns at once if the unit is already active. Otherwise issues a start and
 * polls for "active" within policy.
 *
 * @return OK, or SERVICE_START_ERROR if the start fails or the unit never
 *         becomes active.
 */
[[nodiscard]] readiness::PollResult ensureServiceActive(exec::CommandRunner& runner,
                                                        const std::string& name,
                                                        const readiness::PollPolicy& policy);

} // namespace boot

} // namespace opssetup

#endif // OPSSETUP_BOOT_SERVICE_PROBES_HPP
