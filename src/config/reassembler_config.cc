/**
 * @file reassembler_config.cc
 * @brief Validation, JSON conversion and file loading for ReassemblerConfig
 */

#include "reasm/config/reassembler_config.h"

#include <fstream>

#include "reasm/logging/logger_registry.h"

#define REASM_LOG_COMPONENT "Config.reassembler"
#include "reasm/logging/log_macros.h"

namespace reasm {
namespace config {

constexpr size_t ReassemblerConfig::kDefaultBufferSize;
constexpr size_t ReassemblerConfig::kMaxBufferSize;

void ReassemblerConfig::validate() const {
  if (buffer_size == 0) {
    throw ConfigValidationError("buffer_size",
                                "Buffer size must be greater than 0");
  }

  if (buffer_size > kMaxBufferSize) {
    throw ConfigValidationError(
        "buffer_size", "Buffer size cannot exceed " +
                           std::to_string(kMaxBufferSize) + " bytes");
  }

  if (log_level > logging::LogLevel::Off) {
    throw ConfigValidationError("log_level", "Unknown log level");
  }
}

nlohmann::json ReassemblerConfig::toJson() const {
  nlohmann::json j;
  j["buffer_size"] = buffer_size;
  j["lenient_keep_alive"] = lenient_keep_alive;
  j["log_level"] = logging::logLevelToString(log_level);
  return j;
}

ReassemblerConfig ReassemblerConfig::fromJson(const nlohmann::json& j) {
  ReassemblerConfig config;

  if (!j.is_object()) {
    throw ConfigValidationError("", "Configuration must be a JSON object");
  }

  if (j.contains("buffer_size") && !j["buffer_size"].is_null()) {
    const auto& value = j["buffer_size"];
    if (!value.is_number_unsigned()) {
      throw ConfigValidationError(
          "buffer_size", "Type error: expected a non-negative integer");
    }
    config.buffer_size = value.get<size_t>();
  }

  if (j.contains("lenient_keep_alive") && !j["lenient_keep_alive"].is_null()) {
    try {
      config.lenient_keep_alive = j["lenient_keep_alive"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
      throw ConfigValidationError("lenient_keep_alive",
                                  "Type error: " + std::string(e.what()));
    }
  }

  if (j.contains("log_level") && !j["log_level"].is_null()) {
    std::string level;
    try {
      level = j["log_level"].get<std::string>();
    } catch (const nlohmann::json::exception& e) {
      throw ConfigValidationError("log_level",
                                  "Type error: " + std::string(e.what()));
    }
    // stringToLogLevel falls back to Info for names it does not know
    config.log_level = logging::stringToLogLevel(level);
    if (config.log_level == logging::LogLevel::Info && level != "info" &&
        level != "INFO") {
      throw ConfigValidationError("log_level",
                                  "Unknown log level '" + level + "'");
    }
  }

  config.validate();
  return config;
}

ReassemblerConfig ReassemblerConfig::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigValidationError("", "Cannot open configuration file " + path);
  }

  nlohmann::json j;
  try {
    file >> j;
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigValidationError(
        "", "Invalid JSON in " + path + ": " + std::string(e.what()));
  }

  REASM_LOG(Debug, "Loaded configuration from {}", path);
  return fromJson(j);
}

void ReassemblerConfig::applyLogLevel() const {
  auto& registry = logging::LoggerRegistry::instance();
  registry.setComponentLevel(logging::Component::Http, log_level);
  registry.setComponentLevel(logging::Component::Reassembler, log_level);
  registry.setComponentLevel(logging::Component::Network, log_level);
  registry.setComponentLevel(logging::Component::Config, log_level);
}

}  // namespace config
}  // namespace reasm
