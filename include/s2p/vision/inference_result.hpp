#pragma once

#include <cstdint>
#include <vector>

namespace s2p::vision {

/// Raw backend output before name mapping and rescaling.
/// Boxes are [x1,y1,x2,y2] per detection, in model-input pixel coordinates.
struct InferenceResult {
  std::vector<float> boxes;
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};
};

}  // namespace s2p::vision
