#include "docmem/config.hpp"

#include "docmem/errors.hpp"

#include <spdlog/common.h>

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace docmem {
namespace {

std::optional<std::string> EnvValue(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  return std::string(raw);
}

template <typename T>
T ParseEnvNumber(const char* name, const std::string& text) {
  T value{};
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    throw ValidationError(std::string(name) + " is not a valid number: '" + text + "'");
  }
  return value;
}

float ParseEnvFloat(const char* name, const std::string& text) {
  char* end = nullptr;
  const float value = std::strtof(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    throw ValidationError(std::string(name) + " is not a valid number: '" + text + "'");
  }
  return value;
}

bool IsKnownLogLevel(std::string_view level) {
  return level == "off" || spdlog::level::from_str(std::string(level)) != spdlog::level::off;
}

}  // namespace

ManagerConfig LoadConfigFromEnv(ManagerConfig base) {
  if (auto value = EnvValue("DOCMEM_DATA_DIR")) {
    base.data_dir = *value;
  }
  if (auto value = EnvValue("DOCMEM_BACKEND")) {
    const auto kind = ParseBackendKind(*value);
    if (!kind.has_value()) {
      throw ValidationError("DOCMEM_BACKEND must be flat or document, got '" + *value + "'");
    }
    base.backend = *kind;
  }
  if (auto value = EnvValue("DOCMEM_CHUNK_SIZE")) {
    base.chunking.chunk_size = ParseEnvNumber<std::size_t>("DOCMEM_CHUNK_SIZE", *value);
  }
  if (auto value = EnvValue("DOCMEM_CHUNK_OVERLAP")) {
    base.chunking.chunk_overlap = ParseEnvNumber<std::size_t>("DOCMEM_CHUNK_OVERLAP", *value);
  }
  if (auto value = EnvValue("DOCMEM_TOP_K")) {
    base.default_top_k = ParseEnvNumber<int>("DOCMEM_TOP_K", *value);
  }
  if (auto value = EnvValue("DOCMEM_HEALTH_THRESHOLD")) {
    base.health_threshold = ParseEnvFloat("DOCMEM_HEALTH_THRESHOLD", *value);
  }
  if (auto value = EnvValue("DOCMEM_BACKUP_RETENTION")) {
    base.backup.retention_count = ParseEnvNumber<std::size_t>("DOCMEM_BACKUP_RETENTION", *value);
  }
  if (auto value = EnvValue("DOCMEM_LOG_LEVEL")) {
    if (!IsKnownLogLevel(*value)) {
      throw ValidationError("DOCMEM_LOG_LEVEL is not a log level: '" + *value + "'");
    }
    base.log_level = *value;
  }
  return base;
}

void ValidateConfig(const ManagerConfig& config) {
  if (config.data_dir.empty()) {
    throw ValidationError("data_dir must be set");
  }
  if (config.chunking.chunk_size == 0) {
    throw ValidationError("chunk_size must be positive");
  }
  if (config.chunking.chunk_overlap >= config.chunking.chunk_size) {
    throw ValidationError("chunk_overlap must be smaller than chunk_size");
  }
  if (config.backup.retention_count == 0) {
    throw ValidationError("backup retention_count must be positive");
  }
  if (config.backup.max_age.count() < 0) {
    throw ValidationError("backup max_age must not be negative");
  }
  if (config.default_top_k <= 0) {
    throw ValidationError("default_top_k must be positive");
  }
  if (config.health_top_k <= 0) {
    throw ValidationError("health_top_k must be positive");
  }
  if (!(config.health_threshold >= -1.0F && config.health_threshold <= 1.0F)) {
    throw ValidationError("health_threshold must lie in [-1, 1]");
  }
  if (config.embed_batch_size <= 0) {
    throw ValidationError("embed_batch_size must be positive");
  }
  if (config.embed_retry_backoff.count() < 0) {
    throw ValidationError("embed_retry_backoff must not be negative");
  }
  if (!IsKnownLogLevel(config.log_level)) {
    throw ValidationError("unknown log_level '" + config.log_level + "'");
  }
}

}  // namespace docmem
