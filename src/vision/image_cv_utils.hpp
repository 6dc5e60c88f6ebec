#pragma once

#include <s2p/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace s2p::vision::detail {

/// Wrap an Image as a cv::Mat view (no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> image_to_mat(const s2p::core::Image& image);

/// Convert cv::Mat to Image (copy).
s2p::core::Image mat_to_image(const cv::Mat& mat, s2p::core::PixelFormat format);

}  // namespace s2p::vision::detail
