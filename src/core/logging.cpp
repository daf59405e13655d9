#include <tessera/core/logging.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <string>

namespace tessera::core {

namespace {

constexpr const char* kLoggerName = "tessera";

std::once_flag g_logger_once;

}  // namespace

std::shared_ptr<spdlog::logger> get_logger() {
  std::call_once(g_logger_once, [] {
    if (!spdlog::get(kLoggerName)) {
      auto logger = spdlog::stderr_color_mt(kLoggerName);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
      logger->set_level(spdlog::level::info);
    }
  });
  return spdlog::get(kLoggerName);
}

bool set_log_level(std::string_view level) {
  const auto parsed = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to off; only accept "off" when asked for.
  if (parsed == spdlog::level::off && level != "off") {
    return false;
  }
  get_logger()->set_level(parsed);
  return true;
}

}  // namespace tessera::core
