#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/logger.hpp>
#include <s2p/vision/detection_model.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

namespace s2p::app {

/// HTTP listener settings.
struct ServerConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{8000};
  std::uint32_t read_timeout_sec{5};
  std::uint32_t write_timeout_sec{5};
  std::size_t payload_max_bytes{16u * 1024u * 1024u};
  std::size_t threads{8};
};

/// Service configuration: listener, model, logging.
struct ServiceConfig {
  ServerConfig server;
  s2p::vision::ModelOptions model;
  s2p::core::LogOptions logging;
};

/// Default config when no file is provided (mock backend).
ServiceConfig default_config();

/// Load config from a simple key=value file (one per line, '#' comments).
/// Unknown keys are ignored; unreadable files and malformed values are InvalidConfig.
[[nodiscard]] std::expected<ServiceConfig, s2p::core::ServiceError>
load_config(const std::string& path);

/// Apply one key=value setting (used by the file loader and CLI overrides).
[[nodiscard]] std::expected<void, s2p::core::ServiceError>
apply_setting(ServiceConfig& config, const std::string& key, const std::string& value);

/// Cross-field checks: sizes, thresholds, model path for real backends.
[[nodiscard]] std::expected<void, s2p::core::ServiceError>
validate_config(const ServiceConfig& config);

}  // namespace s2p::app
