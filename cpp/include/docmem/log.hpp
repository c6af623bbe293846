#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace docmem::log {

inline constexpr std::string_view kLoggerName = "docmem";

// Returns the "docmem" logger. If the host registered a logger under that name
// before first use, that one is reused; otherwise a stderr color logger is created.
std::shared_ptr<spdlog::logger> Logger();

// Accepts spdlog level names (trace, debug, info, warn, error, critical, off).
// Returns false and leaves the level unchanged for unknown names.
bool SetLevel(std::string_view level_name);

}  // namespace docmem::log
