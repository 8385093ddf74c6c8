#ifndef OPSSETUP_HELPERS_STATUS_HPP
#define OPSSETUP_HELPERS_STATUS_HPP
/**
 * @file Status.hpp
 * @brief Status codes shared by every provisioning and boot stage.
 *
 * Every status other than OK is fatal for the boot sequence. The bounded
 * readiness poll is the only retry mechanism.
 */

#include <cstdint>

namespace opssetup {

/* ----------------------------- SetupStatus ----------------------------- */

/**
 * @brief Outcome of a setup operation.
 */
enum class SetupStatus : std::uint8_t {
  OK = 0,
  IO_ERROR,            ///< Descriptor or config file unreadable
  PARSE_ERROR,         ///< Descriptor or config file malformed
  PROVISIONING_ERROR,  ///< Interface or namespace command failed
  EXHAUSTED_PORTS,     ///< Fewer descriptor entries than devices to bind
  LINK_NOT_UP,         ///< Device never reported UP inside the dataplane namespace
  REGISTRATION_ERROR,  ///< Dataplane rejected or garbled a port_add
  BOOT_TIMEOUT,        ///< Readiness gate never became true
  SERVICE_START_ERROR, ///< Dependent daemon not active after explicit start
};

/**
 * @brief Human-readable status string.
 * @return Static string.
 */
[[nodiscard]] inline const char* toString(SetupStatus status) noexcept {
  switch (status) {
  case SetupStatus::OK:
    return "OK";
  case SetupStatus::IO_ERROR:
    return "IO_ERROR";
  case SetupStatus::PARSE_ERROR:
    return "PARSE_ERROR";
  case SetupStatus::PROVISIONING_ERROR:
    return "PROVISIONING_ERROR";
  case SetupStatus::EXHAUSTED_PORTS:
    return "EXHAUSTED_PORTS";
  case SetupStatus::LINK_NOT_UP:
    return "LINK_NOT_UP";
  case SetupStatus::REGISTRATION_ERROR:
    return "REGISTRATION_ERROR";
  case SetupStatus::BOOT_TIMEOUT:
    return "BOOT_TIMEOUT";
  case SetupStatus::SERVICE_START_ERROR:
    return "SERVICE_START_ERROR";
  }
  return "UNKNOWN";
}

} // namespace opssetup

#endif // OPSSETUP_HELPERS_STATUS_HPP
