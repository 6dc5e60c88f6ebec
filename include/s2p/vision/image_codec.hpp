#pragma once

#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace s2p::vision {

/// Encodings accepted on upload.
enum class ImageEncoding : std::uint8_t {
  Jpeg,
  Png,
  Bmp,
  Tiff,
};

[[nodiscard]] std::string_view to_string(ImageEncoding encoding) noexcept;

/// Identify the encoding from the payload signature; nullopt if unsupported.
[[nodiscard]] std::optional<ImageEncoding> sniff_encoding(std::span<const std::byte> bytes) noexcept;

/// Decode an uploaded payload into a BGR8 (or Grayscale8) Image.
/// UnsupportedEncoding if the signature is not JPEG/PNG/BMP/TIFF, DecodeFailed
/// if OpenCV cannot decode it.
[[nodiscard]] std::expected<s2p::core::Image, s2p::core::ServiceError>
decode_image(std::span<const std::byte> bytes);

/// Convenience overload for payloads held in a string (HTTP bodies).
[[nodiscard]] std::expected<s2p::core::Image, s2p::core::ServiceError>
decode_image(std::string_view bytes);

/// Load an image file into an Image (BGR8 or Grayscale8). InvalidConfig if the
/// file cannot be read.
[[nodiscard]] std::expected<s2p::core::Image, s2p::core::ServiceError>
load_image_file(const std::string& path);

/// Built-in warmup image: deterministic uniform noise, BGR8.
[[nodiscard]] s2p::core::Image make_warmup_image(std::uint32_t width, std::uint32_t height);

}  // namespace s2p::vision
