#pragma once

#include <s2p/core/error.hpp>
#include <spdlog/spdlog.h>
#include <expected>
#include <memory>
#include <string>

namespace s2p::core {

/// Sinks and level for the process logger.
struct LogOptions {
  std::string level{"info"};  // trace|debug|info|warn|error|critical|off
  std::string file;           // empty: console only
};

/// Process-wide logger; created on first use with a colored stdout sink.
std::shared_ptr<spdlog::logger> logger();

/// Replace the process logger according to options. Call once at startup,
/// before worker or server threads exist.
[[nodiscard]] std::expected<void, ServiceError> configure_logging(const LogOptions& options);

}  // namespace s2p::core
