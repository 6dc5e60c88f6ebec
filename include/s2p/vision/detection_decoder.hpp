#pragma once

#include <s2p/core/detection.hpp>
#include <s2p/vision/inference_result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace s2p::vision {

/// Maps model class id to class name (index = class id).
using ClassNameMap = std::vector<std::string>;

/// Decodes InferenceResult -> DetectionList: confidence threshold, class names,
/// degenerate boxes dropped. Model output order is preserved.
class DetectionDecoder {
 public:
  DetectionDecoder(float confidence_threshold, ClassNameMap class_names);

  [[nodiscard]] s2p::core::DetectionList decode(const InferenceResult& result) const;

  /// Name for a class id; "class_<id>" when the id has no (non-empty) name.
  [[nodiscard]] std::string class_name(std::int64_t class_id) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept {
    return confidence_threshold_;
  }

  [[nodiscard]] const ClassNameMap& class_names() const noexcept { return class_names_; }

 private:
  float confidence_threshold_;
  ClassNameMap class_names_;
};

/// Scales boxes from a from_w x from_h image to a to_w x to_h image, clamps them
/// to the target image and removes boxes that become degenerate.
void rescale_detections(s2p::core::DetectionList& detections,
                        std::uint32_t from_w, std::uint32_t from_h,
                        std::uint32_t to_w, std::uint32_t to_h);

}  // namespace s2p::vision
