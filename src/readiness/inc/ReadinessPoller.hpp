#ifndef OPSSETUP_READINESS_READINESS_POLLER_HPP
#define OPSSETUP_READINESS_READINESS_POLLER_HPP
/**
 * @file ReadinessPoller.hpp
 * @brief Bounded fixed-interval polling of a boolean predicate.
 *
 * Every "wait for X" in the boot sequence goes through pollUntil(): file
 * existence, database flags, service state, hostname and link state.
 *
 * @warning Blocks the calling thread with sleep_for between probes.
 */

#include "src/helpers/inc/Status.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace opssetup {

namespace readiness {

/* ----------------------------- Constants ----------------------------- */

/// Default interval between probes.
inline constexpr std::chrono::milliseconds DEFAULT_POLL_INTERVAL{100};

/// Default timeout budget (1200 probes at the default interval).
inline constexpr std::chrono::milliseconds DEFAULT_POLL_TIMEOUT{120000};

/* ----------------------------- PollPolicy ----------------------------- */

/**
 * @brief Interval and timeout budget for one poll.
 */
struct PollPolicy {
  std::chrono::milliseconds interval{DEFAULT_POLL_INTERVAL};
  std::chrono::milliseconds timeout{DEFAULT_POLL_TIMEOUT};

  /// @brief Number of probes the budget allows: floor(timeout / interval).
  /// @note A non-positive interval is treated as 1 ms.
  [[nodiscard]] std::size_t maxProbes() const noexcept;
};

/* ----------------------------- PollResult ----------------------------- */

/**
 * @brief Outcome of pollUntil().
 */
struct PollResult {
  SetupStatus status{SetupStatus::OK};
  std::size_t probes{0};               ///< Predicate evaluations performed
  std::chrono::milliseconds elapsed{}; ///< Wall time spent polling
  std::string message;                 ///< Failure detail (empty on success)

  /// @brief True if the predicate became true within budget.
  [[nodiscard]] bool ok() const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/// Zero-argument readiness check.
using Predicate = std::function<bool()>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Evaluate predicate until it returns true or the budget runs out.
 * @param name Predicate name used in diagnostics.
 * @param predicate Side-effect-free check.
 * @param errorMessage Message reported on timeout.
 * @param policy Interval and timeout.
 * @return OK with the probe count, or BOOT_TIMEOUT after policy.maxProbes()
 *         evaluations or once policy.timeout has elapsed, whichever is first.
 *
 * Returns immediately when the predicate holds; sleeps one interval after
 * every failed probe except the last. A single probe is never interrupted,
 * so the overrun past the timeout is bounded by the slowest probe.
 */
[[nodiscard]] PollResult pollUntil(std::string_view name, const Predicate& predicate,
                                   std::string_view errorMessage, const PollPolicy& policy);

} // namespace readiness

} // namespace opssetup

#endif // OPSSETUP_READINESS_READINESS_POLLER_HPP
