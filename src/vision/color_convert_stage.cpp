#include <s2p/vision/color_convert_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <vector>

namespace s2p::vision {

namespace {

using s2p::core::PixelFormat;

/// cv::cvtColor code for (from, to), or -1 when OpenCV has no direct conversion.
int conversion_code(PixelFormat from, PixelFormat to) {
  if (from == PixelFormat::BGR8 && to == PixelFormat::RGB8) return cv::COLOR_BGR2RGB;
  if (from == PixelFormat::RGB8 && to == PixelFormat::BGR8) return cv::COLOR_RGB2BGR;
  if (from == PixelFormat::BGRA8 && to == PixelFormat::RGB8) return cv::COLOR_BGRA2RGB;
  if (from == PixelFormat::RGBA8 && to == PixelFormat::RGB8) return cv::COLOR_RGBA2RGB;
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::RGB8) return cv::COLOR_GRAY2RGB;
  if (from == PixelFormat::Grayscale8 && to == PixelFormat::BGR8) return cv::COLOR_GRAY2BGR;
  if (from == PixelFormat::BGR8 && to == PixelFormat::Grayscale8) return cv::COLOR_BGR2GRAY;
  if (from == PixelFormat::RGB8 && to == PixelFormat::Grayscale8) return cv::COLOR_RGB2GRAY;
  return -1;
}

}  // namespace

ColorConvertStage::ColorConvertStage(PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<s2p::core::StageOutput, s2p::core::ServiceError>
ColorConvertStage::process(const s2p::core::Image& input) {
  using namespace s2p::core;

  if (input.format() == output_format_) {
    if (input.empty()) return std::unexpected(ServiceError::InvalidImage);
    return StageOutput{input};
  }

  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ServiceError::InvalidImage);
  }
  const int code = conversion_code(input.format(), output_format_);
  if (code < 0) {
    return std::unexpected(ServiceError::InvalidImage);
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return StageOutput{detail::mat_to_image(mat_out, output_format_)};
}

}  // namespace s2p::vision
