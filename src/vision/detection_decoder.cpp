#include <s2p/vision/detection_decoder.hpp>
#include <algorithm>
#include <cstddef>

namespace s2p::vision {

DetectionDecoder::DetectionDecoder(float confidence_threshold, ClassNameMap class_names)
    : confidence_threshold_(confidence_threshold),
      class_names_(std::move(class_names)) {}

std::string DetectionDecoder::class_name(std::int64_t class_id) const {
  if (class_id >= 0 && static_cast<std::size_t>(class_id) < class_names_.size() &&
      !class_names_[static_cast<std::size_t>(class_id)].empty()) {
    return class_names_[static_cast<std::size_t>(class_id)];
  }
  return "class_" + std::to_string(class_id);
}

s2p::core::DetectionList DetectionDecoder::decode(const InferenceResult& result) const {
  s2p::core::DetectionList out;
  const std::size_t n = std::min({static_cast<std::size_t>(result.num_detections),
                                  result.scores.size(), result.boxes.size() / 4});

  for (std::size_t i = 0; i < n; ++i) {
    const float score = result.scores[i];
    if (score < confidence_threshold_) {
      continue;
    }

    s2p::core::Detection d;
    d.confidence = std::clamp(score, 0.f, 1.f);
    d.class_id = i < result.class_ids.size() ? result.class_ids[i] : -1;
    d.class_name = class_name(d.class_id);
    d.bbox = {result.boxes[i * 4 + 0], result.boxes[i * 4 + 1],
              result.boxes[i * 4 + 2], result.boxes[i * 4 + 3]};
    if (!d.bbox.valid()) {
      continue;
    }
    out.push_back(std::move(d));
  }
  return out;
}

void rescale_detections(s2p::core::DetectionList& detections,
                        std::uint32_t from_w, std::uint32_t from_h,
                        std::uint32_t to_w, std::uint32_t to_h) {
  if (from_w == 0 || from_h == 0) {
    detections.clear();
    return;
  }
  const float sx = static_cast<float>(to_w) / static_cast<float>(from_w);
  const float sy = static_cast<float>(to_h) / static_cast<float>(from_h);
  const float max_x = static_cast<float>(to_w);
  const float max_y = static_cast<float>(to_h);

  for (auto& d : detections) {
    d.bbox.x1 = std::clamp(d.bbox.x1 * sx, 0.f, max_x);
    d.bbox.y1 = std::clamp(d.bbox.y1 * sy, 0.f, max_y);
    d.bbox.x2 = std::clamp(d.bbox.x2 * sx, 0.f, max_x);
    d.bbox.y2 = std::clamp(d.bbox.y2 * sy, 0.f, max_y);
  }
  std::erase_if(detections, [](const s2p::core::Detection& d) { return !d.bbox.valid(); });
}

}  // namespace s2p::vision
