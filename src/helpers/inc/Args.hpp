#ifndef OPSSETUP_HELPERS_ARGS_HPP
#define OPSSETUP_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing utilities.
 *
 * Fixed-arity flag parsing for the setup tool. Cold-path only.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace opssetup {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--config"
  std::uint8_t nargs;      ///< Number of values required after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output (optional)
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse user-provided arguments according to a flag map.
 *
 * When a flag is matched, the next nargs tokens are consumed literally as its
 * values. Tokens that match no flag are rejected.
 *
 * @param args   Argument list (non-owning views; must outlive the call).
 * @param map    Definitions of accepted flags and their requirements.
 * @param pargs  Output map of parsed values (entries are overwritten per key).
 * @param error  Optional error message target (set on failure when provided).
 * @return true on success; false on error.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  std::bitset<256> seen;
  const std::size_t N = args.size();

  for (std::size_t i = 0; i < N; ++i) {
    auto it = lut.find(args[i]);
    if (it == lut.end()) {
      if (error) {
        error->get() = fmt::format("Unknown argument '{}'", args[i]);
      }
      return false;
    }

    const std::uint8_t KEY = it->second.first;
    const ArgDef& DEF = *it->second.second;

    // Need tokens in [i+1, i+nargs]
    if (i + static_cast<std::size_t>(DEF.nargs) >= N) {
      if (error) {
        error->get() =
            fmt::format("Argument out of bounds: expected {} values for flag '{}'", DEF.nargs,
                        DEF.flag);
      }
      return false;
    }

    auto& out = pargs[KEY];
    out.clear();
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.emplace_back(args[i + 1 + k]);
    }

    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      if (error) {
        error->get() = fmt::format("Missing required argument '{}'", KV.second.flag);
      }
      return false;
    }
  }

  return true;
}

/**
 * @brief Print usage information for a CLI tool.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool's purpose.
 * @param map         Argument definitions to document.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);

  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }

  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs > 0) {
      flagStr.append(" <value>");
    }

    fmt::print("  {:<20}  {}", flagStr, def->desc);
    if (def->required) {
      fmt::print(" (required)");
    }
    fmt::print("\n");
  }
}

} // namespace args
} // namespace helpers
} // namespace opssetup

#endif // OPSSETUP_HELPERS_ARGS_HPP
