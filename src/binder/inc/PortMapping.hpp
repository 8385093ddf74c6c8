#ifndef OPSSETUP_BINDER_PORT_MAPPING_HPP
#define OPSSETUP_BINDER_PORT_MAPPING_HPP
/**
 * @file PortMapping.hpp
 * @brief Device label to hardware port name mapping and its JSON file.
 *
 * Built append-only during one binder run; insertion order is kept so the
 * persisted document lists bindings in the order they were made.
 */

#include "src/helpers/inc/Status.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace opssetup {

namespace binder {

/* ----------------------------- Constants ----------------------------- */

/// File name of the persisted mapping.
inline constexpr const char* PORT_MAPPING_FILE_NAME = "port_mapping.json";

/* ----------------------------- PortMapping ----------------------------- */

/**
 * @brief Ordered label to port mapping with unique labels.
 */
class PortMapping {
public:
  using Entry = std::pair<std::string, std::string>;

  /// @brief Append a binding.
  /// @return false if label is already mapped (mapping unchanged).
  bool insert(std::string label, std::string port);

  /// @brief Port bound to label, or nullptr.
  [[nodiscard]] const std::string* find(std::string_view label) const noexcept;

  [[nodiscard]] bool contains(std::string_view label) const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;
  [[nodiscard]] const std::vector<Entry>& entries() const noexcept;

  /// @brief Same label set with the same ports, regardless of order.
  [[nodiscard]] bool sameBindings(const PortMapping& other) const noexcept;

  /// @brief Compact JSON object, e.g. {"1": "49", "2": "50"}.
  [[nodiscard]] std::string toJson() const;

  /// @brief Human-readable summary, e.g. "1->49, 2->50".
  [[nodiscard]] std::string toString() const;

private:
  std::vector<Entry> entries_;
};

/* ----------------------------- Persistence ----------------------------- */

/**
 * @brief Result of loading a mapping document.
 */
struct PortMappingLoad {
  PortMapping mapping;
  SetupStatus status{SetupStatus::OK};
  std::string message;

  [[nodiscard]] bool ok() const noexcept;
};

/**
 * @brief Parse a mapping document (a flat JSON object of strings).
 * @return PARSE_ERROR unless the document is a mapping of scalars with
 *         unique keys.
 */
[[nodiscard]] PortMappingLoad parsePortMapping(std::string_view document) noexcept;

/**
 * @brief Read a persisted mapping.
 * @return IO_ERROR if unreadable, otherwise as parsePortMapping().
 */
[[nodiscard]] PortMappingLoad loadPortMapping(const std::string& path) noexcept;

/**
 * @brief Write the mapping as JSON.
 * @return OK, or IO_ERROR if the file cannot be written.
 */
[[nodiscard]] SetupStatus savePortMapping(const std::string& path, const PortMapping& mapping);

} // namespace binder

} // namespace opssetup

#endif // OPSSETUP_BINDER_PORT_MAPPING_HPP
