#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace s2p::core {

/// Memory: Image owns a single contiguous buffer (std::vector<std::byte>).
/// Ownership moves submitter -> mailbox -> worker; nobody keeps a view of a
/// submitted buffer. Sharing one Image across threads requires external
/// synchronization.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
  Float32Planar,  // HWC float, produced by preprocessing for the backend
};

/// Decoded bitmap: dimensions, format and owned pixel buffer.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True if the buffer holds at least min_bytes() for the declared geometry.
  [[nodiscard]] bool is_consistent() const noexcept;

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format) noexcept;

  [[nodiscard]] static std::uint32_t channels(PixelFormat format) noexcept;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace s2p::core
