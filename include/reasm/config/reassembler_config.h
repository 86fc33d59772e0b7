/**
 * @file reassembler_config.h
 * @brief Construction parameters for the request and response reassemblers
 */

#pragma once

#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "reasm/logging/log_level.h"

namespace reasm {
namespace config {

/**
 * @brief Configuration validation error
 */
class ConfigValidationError : public std::runtime_error {
 public:
  ConfigValidationError(const std::string& field, const std::string& reason)
      : std::runtime_error(formatError(field, reason)),
        field_(field),
        reason_(reason) {}

  const std::string& field() const { return field_; }
  const std::string& reason() const { return reason_; }

 private:
  static std::string formatError(const std::string& field,
                                 const std::string& reason) {
    std::ostringstream oss;
    oss << "Configuration validation failed for field '" << field
        << "': " << reason;
    return oss.str();
  }

  std::string field_;
  std::string reason_;
};

/**
 * @brief Reassembler configuration
 *
 * Shared by both directions; buffer_size only matters on the response side,
 * which reads from its stream into a buffer of that size.
 */
struct ReassemblerConfig {
  static constexpr size_t kDefaultBufferSize = 2048;
  static constexpr size_t kMaxBufferSize = 16 * 1024 * 1024;

  /// Bytes requested from the stream per read
  size_t buffer_size = kDefaultBufferSize;

  /// Keep parsing after a message carrying "Connection: close"
  bool lenient_keep_alive = true;

  /// Level for the Http, Reassembler, Network and Config loggers
  logging::LogLevel log_level = logging::LogLevel::Info;

  /**
   * @brief Validate the configuration
   * @throws ConfigValidationError if validation fails
   */
  void validate() const;

  /**
   * @brief Convert to JSON
   */
  nlohmann::json toJson() const;

  /**
   * @brief Create from JSON, absent fields keep their defaults
   * @throws ConfigValidationError on a type error or an invalid value
   */
  static ReassemblerConfig fromJson(const nlohmann::json& j);

  /**
   * @brief Read and validate a JSON configuration file
   * @throws ConfigValidationError if the file cannot be read or parsed
   */
  static ReassemblerConfig loadFromFile(const std::string& path);

  /**
   * @brief Push log_level into the logger registry
   */
  void applyLogLevel() const;
};

}  // namespace config
}  // namespace reasm
