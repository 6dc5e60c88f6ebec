#include <s2p/core/result_view.hpp>

namespace s2p::core {

ResultView view_of(const std::shared_ptr<const DetectionBatch>& batch) {
  if (!batch) {
    return NoResultYet{};
  }
  if (batch->detections.empty()) {
    return EmptyResult{batch->timestamp};
  }
  return Result{batch->timestamp, batch->detections};
}

}  // namespace s2p::core
