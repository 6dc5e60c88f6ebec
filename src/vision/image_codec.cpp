#include <s2p/vision/image_codec.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <array>
#include <fstream>
#include <iterator>
#include <vector>

namespace s2p::vision {

namespace {

constexpr std::uint64_t kWarmupSeed = 0x5eed2b1dULL;

bool starts_with(std::span<const std::byte> bytes, std::initializer_list<unsigned char> magic) {
  if (bytes.size() < magic.size()) return false;
  std::size_t i = 0;
  for (unsigned char m : magic) {
    if (std::to_integer<unsigned char>(bytes[i++]) != m) return false;
  }
  return true;
}

s2p::core::PixelFormat format_of(const cv::Mat& mat) {
  return mat.channels() == 1 ? s2p::core::PixelFormat::Grayscale8
                             : s2p::core::PixelFormat::BGR8;
}

}  // namespace

std::string_view to_string(ImageEncoding encoding) noexcept {
  switch (encoding) {
    case ImageEncoding::Jpeg:
      return "jpeg";
    case ImageEncoding::Png:
      return "png";
    case ImageEncoding::Bmp:
      return "bmp";
    case ImageEncoding::Tiff:
      return "tiff";
  }
  return "unknown";
}

std::optional<ImageEncoding> sniff_encoding(std::span<const std::byte> bytes) noexcept {
  if (starts_with(bytes, {0xFF, 0xD8, 0xFF})) return ImageEncoding::Jpeg;
  if (starts_with(bytes, {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A})) return ImageEncoding::Png;
  if (starts_with(bytes, {0x42, 0x4D})) return ImageEncoding::Bmp;
  if (starts_with(bytes, {0x49, 0x49, 0x2A, 0x00})) return ImageEncoding::Tiff;
  if (starts_with(bytes, {0x4D, 0x4D, 0x00, 0x2A})) return ImageEncoding::Tiff;
  return std::nullopt;
}

std::expected<s2p::core::Image, s2p::core::ServiceError>
decode_image(std::span<const std::byte> bytes) {
  if (!sniff_encoding(bytes)) {
    return std::unexpected(s2p::core::ServiceError::UnsupportedEncoding);
  }

  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));
  cv::Mat mat;
  try {
    mat = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception&) {
    return std::unexpected(s2p::core::ServiceError::DecodeFailed);
  }
  if (mat.empty()) {
    return std::unexpected(s2p::core::ServiceError::DecodeFailed);
  }
  return detail::mat_to_image(mat, format_of(mat));
}

std::expected<s2p::core::Image, s2p::core::ServiceError>
decode_image(std::string_view bytes) {
  return decode_image(std::as_bytes(std::span<const char>(bytes.data(), bytes.size())));
}

std::expected<s2p::core::Image, s2p::core::ServiceError>
load_image_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return std::unexpected(s2p::core::ServiceError::InvalidConfig);
  }
  const std::string payload((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  return decode_image(std::string_view(payload));
}

s2p::core::Image make_warmup_image(std::uint32_t width, std::uint32_t height) {
  cv::Mat mat(static_cast<int>(height), static_cast<int>(width), CV_8UC3);
  cv::RNG rng(kWarmupSeed);
  rng.fill(mat, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
  return detail::mat_to_image(mat, s2p::core::PixelFormat::BGR8);
}

}  // namespace s2p::vision
