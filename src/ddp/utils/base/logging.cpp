#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>

namespace ddp::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static bool apply_level_(spdlog::logger& logger, std::string_view level_name) {
  const auto level = spdlog::level::from_str(std::string{level_name});
  if (level == spdlog::level::off && level_name != std::string_view{"off"})
    return false;
  logger.set_level(level);
  return true;
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    instance = spdlog::stdout_color_mt("ddp");
    instance->set_pattern("[%Y-%m-%d %T] [%^%l%$] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif

    const char* env_variable = "LOG_LEVEL_OVERRIDE";
    const char* log_level = std::getenv(env_variable);
    if (log_level && !apply_level_(*instance, log_level)) {
      instance->error("failed to set log level from environment variable {}={}", env_variable,
                      log_level);
    }
  });

  assert(instance);
  return *instance;
}

/**
 * @ingroup logging
 * @brief Change the level of the debug logger at runtime.
 */
bool set_log_level(std::string_view level_name) {
  return apply_level_(debug_logger(), level_name);
}

} // namespace ddp::logging
