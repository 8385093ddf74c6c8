#ifndef OPSSETUP_BOOT_BOOT_ORCHESTRATOR_HPP
#define OPSSETUP_BOOT_BOOT_ORCHESTRATOR_HPP
/**
 * @file BootOrchestrator.hpp
 * @brief Ordered readiness gates that bring the switch image up.
 *
 * Sequence (each step must succeed before the next starts):
 *   1. switch namespace exists
 *   2. hardware descriptor directory exists
 *   3. interfaces bound (PortBinder)
 *   4. database socket exists
 *   5. hardware-ready flag set
 *   6. configuration-ready flag set
 *   7. switch daemon pid file exists
 *   8. switch daemon active
 *   9. hostname applied
 *  10. REST daemon active (started if needed)
 */

#include "src/binder/inc/PortBinder.hpp"
#include "src/boot/inc/SetupConfig.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/ovsdb/inc/DbClient.hpp"
#include "src/readiness/inc/ReadinessPoller.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace opssetup {

namespace boot {

/* ----------------------------- Steps ----------------------------- */

/**
 * @brief Outcome of one step.
 */
struct StepOutcome {
  SetupStatus status{SetupStatus::OK};
  std::string message;

  [[nodiscard]] bool ok() const noexcept { return status == SetupStatus::OK; }
};

/**
 * @brief Named boot step.
 */
struct BootStep {
  std::string name;
  std::function<StepOutcome()> run;
};

/**
 * @brief Step that polls a predicate under policy.
 * @return Step reporting BOOT_TIMEOUT with errorMessage on exhaustion.
 */
[[nodiscard]] BootStep makeGate(std::string name, readiness::Predicate predicate,
                                std::string errorMessage, const readiness::PollPolicy& policy);

/* ----------------------------- BootReport ----------------------------- */

/**
 * @brief Outcome of a boot sequence.
 */
struct BootReport {
  SetupStatus status{SetupStatus::OK};
  std::string failedStep;                  ///< Name of the failing step (empty on success)
  std::string message;                     ///< Failure detail
  std::vector<std::string> completedSteps; ///< Steps that succeeded, in order
  binder::BindResult binding;              ///< Binder outcome, if it ran

  [[nodiscard]] bool ok() const noexcept { return status == SetupStatus::OK; }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Run steps in order, stopping at the first failure.
 */
[[nodiscard]] BootReport runSteps(const std::vector<BootStep>& steps);

/* ----------------------------- BootOrchestrator ----------------------------- */

/**
 * @brief Builds and runs the boot sequence.
 *
 * Holds references to config, runner and database client; all three must
 * outlive the orchestrator.
 */
class BootOrchestrator {
public:
  using HostnameSource = std::function<std::string()>;

  BootOrchestrator(const SetupConfig& config, exec::CommandRunner& runner, ovsdb::DbClient& db,
                   HostnameSource hostname = currentHostnameSource());

  /// @brief The ten steps, in boot order.
  [[nodiscard]] std::vector<BootStep> buildSteps();

  /// @brief Run every step; the report carries the binder outcome.
  [[nodiscard]] BootReport run();

  /// @brief Default hostname source (gethostname).
  [[nodiscard]] static HostnameSource currentHostnameSource();

private:
  bool flagSet(const std::string& flag);

  const SetupConfig& config_;
  exec::CommandRunner& runner_;
  ovsdb::DbClient& db_;
  HostnameSource hostname_;
  binder::BindResult binding_;
};

} // namespace boot

} // namespace opssetup

#endif // OPSSETUP_BOOT_BOOT_ORCHESTRATOR_HPP
