#include <invoscan/core/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <mutex>
#include <string>

namespace invoscan::core {

namespace {

constexpr const char* kLoggerName = "invoscan";

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::once_flag once;
  std::call_once(once, []() {
    if (!spdlog::get(kLoggerName)) {
      auto lg = spdlog::stderr_color_mt(kLoggerName);
      lg->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    }
  });
  return spdlog::get(kLoggerName);
}

bool set_log_level(std::string_view level) {
  const spdlog::level::level_enum lvl = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to off; only accept "off" when asked for.
  if (lvl == spdlog::level::off && level != "off") return false;
  logger()->set_level(lvl);
  return true;
}

}  // namespace invoscan::core
