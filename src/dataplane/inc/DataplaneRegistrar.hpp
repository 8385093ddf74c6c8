#ifndef OPSSETUP_DATAPLANE_DATAPLANE_REGISTRAR_HPP
#define OPSSETUP_DATAPLANE_DATAPLANE_REGISTRAR_HPP
/**
 * @file DataplaneRegistrar.hpp
 * @brief Port registration with the behavioral-model dataplane runtime.
 *
 * A port is added by piping `port_add <device> <id>` into the runtime CLI,
 * which answers with a fixed banner and prompt:
 * @code
 * Control utility for runtime P4 table manipulation
 * RuntimeCmd:
 * @endcode
 * Registration is never retried: a second port_add for the same device would
 * register it twice.
 */

#include "src/exec/inc/CommandRunner.hpp"
#include "src/helpers/inc/Status.hpp"

#include <string>
#include <string_view>

namespace opssetup {

namespace dataplane {

/* ----------------------------- Constants ----------------------------- */

/// First line of a successful runtime CLI reply.
inline constexpr std::string_view RUNTIME_BANNER =
    "Control utility for runtime P4 table manipulation";

/// Prefix of the second (prompt) line of a successful reply.
inline constexpr std::string_view RUNTIME_PROMPT = "RuntimeCmd:";

/// Default runtime control (thrift) port.
inline constexpr int DEFAULT_THRIFT_PORT = 10001;

/* ----------------------------- DataplaneConfig ----------------------------- */

/**
 * @brief How to reach the runtime CLI.
 */
struct DataplaneConfig {
  std::string netns{"emulns"};                                       ///< Namespace the CLI runs in
  std::string cliPath{"/usr/bin/bm_tools/runtime_CLI.py"};           ///< Runtime CLI executable
  std::string programJson{"/usr/share/ovs_p4_plugin/switch_bmv2.json"}; ///< Loaded P4 program
  int thriftPort{DEFAULT_THRIFT_PORT};                               ///< Runtime control port
};

/* ----------------------------- RegistrationResult ----------------------------- */

/**
 * @brief Outcome of one port_add.
 */
struct RegistrationResult {
  SetupStatus status{SetupStatus::OK};
  int portId{-1};      ///< Dataplane port id used
  std::string command; ///< Command line sent to the CLI
  std::string reply;   ///< Raw CLI output
  std::string message; ///< Failure detail (empty on success)

  /// @brief True if the dataplane acknowledged the port.
  [[nodiscard]] bool ok() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Dataplane port id for a hardware port name: integer(name) - 1.
 * @param hwPort Hardware port name (decimal, >= 1).
 * @return Port id, or -1 if the name is not a positive decimal integer.
 */
[[nodiscard]] int dataplanePortId(std::string_view hwPort) noexcept;

/**
 * @brief Check a runtime CLI reply against the banner/prompt pattern.
 *
 * Trailing whitespace is ignored per line and trailing empty lines are
 * dropped; what remains must be exactly the banner followed by a line that
 * starts with the prompt.
 */
[[nodiscard]] bool isRegistrationReplyValid(std::string_view reply);

/**
 * @brief Argv that starts the runtime CLI inside the dataplane namespace.
 */
[[nodiscard]] exec::Argv runtimeCliArgv(const DataplaneConfig& config);

/**
 * @brief Register a device as dataplane port integer(hwPort) - 1.
 * @param config CLI location.
 * @param device Device name inside the dataplane namespace.
 * @param hwPort Hardware port name the id is derived from.
 * @param runner Executes the CLI.
 * @return OK, or REGISTRATION_ERROR for a bad port name, a failed CLI or a
 *         reply that does not match the banner/prompt pattern.
 */
[[nodiscard]] RegistrationResult registerPort(const DataplaneConfig& config,
                                              std::string_view device, std::string_view hwPort,
                                              exec::CommandRunner& runner);

} // namespace dataplane

} // namespace opssetup

#endif // OPSSETUP_DATAPLANE_DATAPLANE_REGISTRAR_HPP
