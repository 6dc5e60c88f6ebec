#include <s2p/vision/normalize_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace s2p::vision {

NormalizeStage::NormalizeStage(float mean, float scale) : mean_(mean), scale_(scale) {}

std::expected<s2p::core::StageOutput, s2p::core::ServiceError>
NormalizeStage::process(const s2p::core::Image& input) {
  using namespace s2p::core;

  if (Image::channels(input.format()) != 3 || input.format() == PixelFormat::Float32Planar) {
    return std::unexpected(ServiceError::InvalidImage);
  }
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(ServiceError::InvalidImage);
  }

  cv::Mat mat_float;
  mat_in->convertTo(mat_float, CV_32FC3, scale_, -mean_ * scale_);
  return StageOutput{detail::mat_to_image(mat_float, PixelFormat::Float32Planar)};
}

}  // namespace s2p::vision
