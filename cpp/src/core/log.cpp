#include "docmem/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace docmem::log {

std::shared_ptr<spdlog::logger> Logger() {
  static std::mutex init_mutex;
  std::lock_guard<std::mutex> lock(init_mutex);
  const std::string name(kLoggerName);
  if (auto existing = spdlog::get(name); existing != nullptr) {
    return existing;
  }
  auto logger = spdlog::stderr_color_mt(name);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
  return logger;
}

bool SetLevel(std::string_view level_name) {
  const auto level = spdlog::level::from_str(std::string(level_name));
  if (level == spdlog::level::off && level_name != "off") {
    return false;
  }
  Logger()->set_level(level);
  return true;
}

}  // namespace docmem::log
