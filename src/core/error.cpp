#include <s2p/core/error.hpp>

namespace s2p::core {

std::string_view to_string(ServiceError error) noexcept {
  switch (error) {
    case ServiceError::None:
      return "none";
    case ServiceError::InvalidImage:
      return "invalid_image";
    case ServiceError::DecodeFailed:
      return "decode_failed";
    case ServiceError::UnsupportedEncoding:
      return "unsupported_encoding";
    case ServiceError::LoadFailed:
      return "load_failed";
    case ServiceError::NotLoaded:
      return "not_loaded";
    case ServiceError::InferenceFailed:
      return "inference_failed";
    case ServiceError::DeviceLost:
      return "device_lost";
    case ServiceError::InvalidConfig:
      return "invalid_config";
  }
  return "unknown";
}

}  // namespace s2p::core
