/**
 * @file ReadinessPoller.cpp
 * @brief Implementation of the bounded readiness poll.
 */

#include "src/readiness/inc/ReadinessPoller.hpp"

#include <thread>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace opssetup {

namespace readiness {

/* ----------------------------- PollPolicy Methods ----------------------------- */

std::size_t PollPolicy::maxProbes() const noexcept {
  const auto STEP = interval.count() > 0 ? interval.count() : 1;
  if (timeout.count() <= 0) {
    return 0;
  }
  return static_cast<std::size_t>(timeout.count() / STEP);
}

/* ----------------------------- PollResult Methods ----------------------------- */

bool PollResult::ok() const noexcept { return status == SetupStatus::OK; }

std::string PollResult::toString() const {
  if (ok()) {
    return fmt::format("ready after {} probe(s) in {} ms", probes, elapsed.count());
  }
  return fmt::format("{}: {} (probes={} elapsed={} ms)", opssetup::toString(status), message,
                     probes, elapsed.count());
}

/* ----------------------------- API ----------------------------- */

PollResult pollUntil(std::string_view name, const Predicate& predicate,
                     std::string_view errorMessage, const PollPolicy& policy) {
  using Clock = std::chrono::steady_clock;

  PollResult result{};
  const Clock::time_point START = Clock::now();
  const std::size_t MAX_PROBES = policy.maxProbes();
  const auto SLEEP =
      policy.interval.count() > 0 ? policy.interval : std::chrono::milliseconds{1};

  spdlog::debug("Waiting for {} (up to {} probes)", name, MAX_PROBES);

  for (std::size_t probe = 1; probe <= MAX_PROBES; ++probe) {
    result.probes = probe;
    if (predicate()) {
      result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - START);
      spdlog::debug("{} ready after {} probe(s)", name, probe);
      return result;
    }
    // Wall time is bounded too: a slow probe can end the poll before maxProbes.
    if (probe == MAX_PROBES || Clock::now() - START >= policy.timeout) {
      break;
    }
    std::this_thread::sleep_for(SLEEP);
  }

  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - START);
  result.status = SetupStatus::BOOT_TIMEOUT;
  result.message = fmt::format("{}: {} (waited {} ms)", name, errorMessage, result.elapsed.count());
  return result;
}

} // namespace readiness

} // namespace opssetup
