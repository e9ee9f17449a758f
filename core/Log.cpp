#include "core/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace tomexp {

namespace {

constexpr const char* kLoggerName = "tomexp";

} // namespace

std::shared_ptr<spdlog::logger> Log() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (!spdlog::get(kLoggerName)) {
      auto lg = spdlog::stderr_color_mt(kLoggerName);
      lg->set_level(spdlog::level::info);
    }
  });
  return spdlog::get(kLoggerName);
}

bool ConfigureLogging(const LogConfig& cfg, std::string& err) {
  const auto level = spdlog::level::from_str(cfg.level);
  // from_str maps anything unknown to "off"
  if (level == spdlog::level::off && cfg.level != "off") {
    err = "log.level: unknown level '" + cfg.level + "'";
    return false;
  }
  auto lg = Log();
  lg->set_level(level);
  if (!cfg.pattern.empty()) lg->set_pattern(cfg.pattern);
  return true;
}

} // namespace tomexp
