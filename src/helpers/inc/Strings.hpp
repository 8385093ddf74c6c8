#ifndef OPSSETUP_HELPERS_STRINGS_HPP
#define OPSSETUP_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for command output and document handling.
 *
 * Cold-path utilities: all functions that return containers allocate.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace opssetup {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/// @brief True for space, tab, carriage return and newline.
[[nodiscard]] inline constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

/**
 * @brief Check if string starts with prefix.
 * @param str String to check.
 * @param prefix Prefix to look for.
 * @return true if str starts with prefix.
 */
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

/* ----------------------------- Trimming ----------------------------- */

/**
 * @brief View of str without trailing whitespace.
 */
[[nodiscard]] inline std::string_view trimRight(std::string_view str) noexcept {
  while (!str.empty() && isSpace(str.back())) {
    str.remove_suffix(1);
  }
  return str;
}

/**
 * @brief View of str without leading or trailing whitespace.
 */
[[nodiscard]] inline std::string_view trim(std::string_view str) noexcept {
  while (!str.empty() && isSpace(str.front())) {
    str.remove_prefix(1);
  }
  return trimRight(str);
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split on any run of whitespace, dropping empty tokens.
 * @note Allocates.
 *
 * Used for `ls`-style command output where names are separated by spaces or
 * newlines depending on whether stdout is a terminal.
 */
[[nodiscard]] inline std::vector<std::string> splitWhitespace(std::string_view str) {
  std::vector<std::string> out;
  std::size_t i = 0;
  while (i < str.size()) {
    while (i < str.size() && isSpace(str[i])) {
      ++i;
    }
    const std::size_t START = i;
    while (i < str.size() && !isSpace(str[i])) {
      ++i;
    }
    if (i > START) {
      out.emplace_back(str.substr(START, i - START));
    }
  }
  return out;
}

/**
 * @brief Split into lines on '\n'.
 * @note Allocates. A trailing newline does not produce an extra empty line.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view str) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start < str.size()) {
    const std::size_t END = str.find('\n', start);
    if (END == std::string_view::npos) {
      out.push_back(str.substr(start));
      break;
    }
    out.push_back(str.substr(start, END - start));
    start = END + 1;
  }
  return out;
}

/**
 * @brief Join items with a separator.
 * @note Allocates.
 */
[[nodiscard]] inline std::string join(const std::vector<std::string>& items,
                                      std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out.append(items[i]);
  }
  return out;
}

} // namespace strings
} // namespace helpers
} // namespace opssetup

#endif // OPSSETUP_HELPERS_STRINGS_HPP
