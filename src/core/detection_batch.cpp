#include <s2p/core/detection_batch.hpp>
#include <algorithm>

namespace s2p::core {

void sort_by_confidence(DetectionList& detections) {
  std::stable_sort(detections.begin(), detections.end(),
                   [](const Detection& a, const Detection& b) {
                     return a.confidence > b.confidence;
                   });
}

DetectionBatch make_batch(DetectionList detections, Clock::time_point timestamp) {
  sort_by_confidence(detections);
  return DetectionBatch{std::move(detections), timestamp};
}

double to_unix_seconds(Clock::time_point t) noexcept {
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
      t.time_since_epoch());
  return 1e-6 * static_cast<double>(us.count());
}

}  // namespace s2p::core
