#pragma once

#include <string_view>

namespace s2p::core {

/// Service error codes; used with std::expected for recoverable failures.
enum class ServiceError {
  None = 0,
  InvalidImage,
  DecodeFailed,
  UnsupportedEncoding,
  LoadFailed,
  NotLoaded,
  InferenceFailed,
  DeviceLost,  // fatal: the adapter can no longer run inference
  InvalidConfig,
};

/// Stable lowercase name for logs and JSON bodies.
[[nodiscard]] std::string_view to_string(ServiceError error) noexcept;

/// True when the error must take the process down instead of being recovered.
[[nodiscard]] constexpr bool is_fatal(ServiceError error) noexcept {
  return error == ServiceError::DeviceLost;
}

}  // namespace s2p::core
