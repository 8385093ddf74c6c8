#ifndef OPSSETUP_BOOT_SETUP_CONFIG_HPP
#define OPSSETUP_BOOT_SETUP_CONFIG_HPP
/**
 * @file SetupConfig.hpp
 * @brief Paths, names and timeouts used by one boot run.
 *
 * Defaults match the switch image layout. An optional YAML file can override
 * individual values; keys are flat:
 *
 *   timeout_seconds: 120
 *   interval_ms: 100
 *   link_timeout_seconds: 120
 *   command_timeout_seconds: 30
 *   descriptor_path: /etc/openswitch/hwdesc/ports.yaml
 *   mapping_path: /opt/ops/port_mapping.json
 *   ready_marker_path: /tmp/ops-virt-ports-ready
 *   netns_dir: /var/run/netns
 *   sys_class_net: /sys/class/net
 *   hwdesc_dir: /etc/openswitch/hwdesc
 *   db_socket: /var/run/openvswitch/db.sock
 *   db_name: OpenSwitch
 *   hw_flag: cur_hw
 *   cfg_flag: cur_cfg
 *   switchd_pid: /var/run/openvswitch/ops-switchd.pid
 *   switchd_service: switchd
 *   restd_service: restd
 *   hostname: switch
 *   primary_netns: swns
 *   secondary_netns: emulns
 *   runtime_cli: /usr/bin/bm_tools/runtime_CLI.py
 *   program_json: /usr/share/ovs_p4_plugin/switch_bmv2.json
 *   thrift_port: 10001
 *   excluded_labels: [lo, oobm, eth0, bonding_masters]
 *
 * Unknown keys are ignored. Durations are capped at one day
 * (MAX_CONFIG_SECONDS).
 */

#include "src/binder/inc/PortBinder.hpp"
#include "src/exec/inc/CommandRunner.hpp"
#include "src/helpers/inc/Status.hpp"
#include "src/ovsdb/inc/DbClient.hpp"
#include "src/readiness/inc/ReadinessPoller.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace opssetup {

namespace boot {

/* ----------------------------- Constants ----------------------------- */

/// Largest accepted duration override, in seconds.
inline constexpr long long MAX_CONFIG_SECONDS = 86400;

/* ----------------------------- SetupConfig ----------------------------- */

/**
 * @brief Aggregated configuration of the boot sequence.
 */
struct SetupConfig {
  binder::BinderConfig binder;  ///< Descriptor, namespaces, exclusions, dataplane
  readiness::PollPolicy poll;   ///< Budget applied to every boot gate
  std::chrono::milliseconds commandTimeout{exec::DEFAULT_COMMAND_TIMEOUT};

  std::string hwdescDir{"/etc/openswitch/hwdesc"};
  std::string dbSocketPath{ovsdb::DEFAULT_DB_SOCKET};
  std::string dbName{ovsdb::DEFAULT_DB_NAME};
  std::string hwReadyFlag{"cur_hw"};
  std::string cfgReadyFlag{"cur_cfg"};
  std::string switchdPidPath{"/var/run/openvswitch/ops-switchd.pid"};
  std::string switchdService{"switchd"};
  std::string restdService{"restd"};
  std::string expectedHostname{"switch"};

  /// @brief Runtime file of the switch namespace, e.g. /var/run/netns/swns.
  [[nodiscard]] std::string primaryNetnsPath() const;

  /// @brief Reply wait for one database query: the poll interval, capped at
  ///        ovsdb::DEFAULT_RECV_TIMEOUT, never below 1 ms.
  [[nodiscard]] std::chrono::milliseconds dbRecvTimeout() const noexcept;

  /// @brief Multi-line human-readable dump.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Apply overrides from a YAML document.
 * @param document YAML mapping of overrides.
 * @param config In/out: fields named in document are replaced.
 * @param error Set to a description on failure.
 * @return OK, or PARSE_ERROR if the document is malformed or a value has the
 *         wrong type. config is left unchanged on failure.
 */
[[nodiscard]] SetupStatus applySetupConfig(std::string_view document, SetupConfig& config,
                                           std::string& error) noexcept;

/**
 * @brief Read and apply an override file.
 * @return IO_ERROR if the file cannot be read, otherwise as applySetupConfig().
 */
[[nodiscard]] SetupStatus loadSetupConfig(const std::string& path, SetupConfig& config,
                                          std::string& error) noexcept;

} // namespace boot

} // namespace opssetup

#endif // OPSSETUP_BOOT_SETUP_CONFIG_HPP
