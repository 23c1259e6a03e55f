#pragma once
#include <steady/version.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <memory>
#include <string_view>

namespace steady {
namespace log {

inline constexpr const char* logger_name = "steady";

namespace detail {

// STEADY_LOGLEVEL=trace|debug|info|warn|error|critical|off, default warn.
inline spdlog::level::level_enum level_from_env() {
  const char* env = std::getenv("STEADY_LOGLEVEL");
  if (!env || !*env) return spdlog::level::warn;
  auto lvl = spdlog::level::from_str(env);
  // from_str() maps unknown names to off; only honour "off" when asked for
  if (lvl == spdlog::level::off && std::string_view(env) != "off") {
    return spdlog::level::warn;
  }
  return lvl;
}

inline std::shared_ptr<spdlog::logger> make_logger() {
  // The application may have registered its own "steady" logger (file sink etc.)
  if (auto existing = spdlog::get(logger_name)) return existing;
  auto lg = spdlog::stderr_color_mt(logger_name);
  lg->set_pattern("%^[%L %X.%e] [%n] %v%$");
  lg->set_level(level_from_env());
  lg->debug("steady {} logger ready", STEADY_VERSION_STRING);
  return lg;
}

} // namespace detail

// Library-wide logger. Created on first use.
inline spdlog::logger& logger() {
  static std::shared_ptr<spdlog::logger> instance = detail::make_logger();
  return *instance;
}

inline void set_level(spdlog::level::level_enum level) {
  logger().set_level(level);
}

} // namespace log
} // namespace steady
