#ifndef OPSSETUP_HELPERS_LOG_HPP
#define OPSSETUP_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Process-wide logger setup.
 *
 * All diagnostics go through the spdlog default logger, which writes to
 * stderr so that stdout stays free for machine-readable summaries.
 */

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace opssetup {
namespace helpers {
namespace log {

/// Logger name used for the default logger.
inline constexpr const char* LOGGER_NAME = "ops-setup";

/**
 * @brief Install the stderr logger as spdlog default.
 * @param verbose Enables debug-level output.
 */
inline void configureLogging(bool verbose) {
  auto logger = spdlog::get(LOGGER_NAME);
  if (!logger) {
    logger = spdlog::stderr_color_mt(LOGGER_NAME);
  }
  logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(std::move(logger));
}

} // namespace log
} // namespace helpers
} // namespace opssetup

#endif // OPSSETUP_HELPERS_LOG_HPP
