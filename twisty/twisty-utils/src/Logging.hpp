#ifndef TWISTY_UTILS_LOGGING_HPP
#define TWISTY_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace twisty_utils
{

/**
 * Fetch a registered logger by name, or register a new colour console
 * logger under that name.
 *
 * If the logger cannot be created, the failure is written to std::cerr and
 * a logger that discards everything is returned, so callers always receive
 * a usable logger.
 *
 * @param name Logger name in the spdlog registry
 * @param level Level applied to the returned logger
 * @return Never null
 */
std::shared_ptr<spdlog::logger> getOrCreateLogger(
  const std::string& name,
  spdlog::level::level_enum level = spdlog::level::info);

/**
 * Logger that discards every message. Not registered.
 */
std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name);

}  // namespace twisty_utils

#endif  // TWISTY_UTILS_LOGGING_HPP
