#include "image_cv_utils.hpp"
#include <s2p/core/image.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace s2p::vision::detail {

namespace sc = s2p::core;

std::optional<cv::Mat> image_to_mat(const sc::Image& image) {
  if (!image.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  const std::size_t step = image.size_bytes() / static_cast<std::size_t>(h);
  void* data = const_cast<std::byte*>(image.data().data());

  switch (image.format()) {
    case sc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case sc::PixelFormat::Float32Planar:
      return cv::Mat(h, w, CV_32FC3, data, step);
    case sc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

sc::Image mat_to_image(const cv::Mat& mat, sc::PixelFormat format) {
  if (mat.empty()) return sc::Image();

  const cv::Mat dense = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = dense.total() * dense.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), dense.ptr(), len);
  return sc::Image(static_cast<std::uint32_t>(dense.cols),
                   static_cast<std::uint32_t>(dense.rows), format, std::move(buffer));
}

}  // namespace s2p::vision::detail
