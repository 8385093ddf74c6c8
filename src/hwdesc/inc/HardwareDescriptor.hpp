#ifndef OPSSETUP_HWDESC_HARDWARE_DESCRIPTOR_HPP
#define OPSSETUP_HWDESC_HARDWARE_DESCRIPTOR_HPP
/**
 * @file HardwareDescriptor.hpp
 * @brief Canonical hardware port names from the image's ports.yaml.
 *
 * Expected document shape:
 * @code
 * ports:
 *   - name: 1
 *     pluggable: False
 *   - name: 2
 * @endcode
 * Only the name of each entry is consumed; order is preserved.
 */

#include "src/helpers/inc/Status.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace opssetup {

namespace hwdesc {

/* ----------------------------- Constants ----------------------------- */

/// Descriptor file name inside the hardware description directory.
inline constexpr const char* PORTS_FILE_NAME = "ports.yaml";

/* ----------------------------- HardwareDescriptor ----------------------------- */

/**
 * @brief Ordered hardware port names plus load status.
 */
struct HardwareDescriptor {
  std::vector<std::string> ports; ///< Port names in document order
  SetupStatus status{SetupStatus::OK};
  std::string message; ///< Failure detail (empty on success)

  /// @brief True if the descriptor loaded.
  [[nodiscard]] bool ok() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse descriptor document text.
 * @param document YAML text.
 * @return Ports on success; PARSE_ERROR when the document is malformed, has no
 *         `ports` sequence, an entry lacks a scalar `name`, or a name repeats.
 */
[[nodiscard]] HardwareDescriptor parseHardwareDescriptor(std::string_view document) noexcept;

/**
 * @brief Read and parse a descriptor file.
 * @param path Path to ports.yaml.
 * @return IO_ERROR if unreadable, otherwise as parseHardwareDescriptor().
 */
[[nodiscard]] HardwareDescriptor loadHardwareDescriptor(const std::string& path) noexcept;

} // namespace hwdesc

} // namespace opssetup

#endif // OPSSETUP_HWDESC_HARDWARE_DESCRIPTOR_HPP
