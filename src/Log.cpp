#include "Log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

void SetupLogging(spdlog::level::level_enum level) {
  auto logger = spdlog::stderr_color_mt("bluehood");
  logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
}

spdlog::level::level_enum ParseLogLevel(const std::string& s) {
  const auto level = spdlog::level::from_str(s);
  // from_str() answers "off" for anything it does not know
  if (level == spdlog::level::off && s != "off") return spdlog::level::info;
  return level;
}
