#pragma once

#include <s2p/core/detection_batch.hpp>
#include <memory>
#include <variant>

namespace s2p::core {

/// Nothing has been published yet.
struct NoResultYet {};

/// A batch was published but the model found nothing.
struct EmptyResult {
  Clock::time_point timestamp{};
};

/// A batch with at least one detection, sorted by confidence.
struct Result {
  Clock::time_point timestamp{};
  DetectionList detections;
};

/// What a reader of the result store can observe.
using ResultView = std::variant<NoResultYet, EmptyResult, Result>;

[[nodiscard]] ResultView view_of(const std::shared_ptr<const DetectionBatch>& batch);

}  // namespace s2p::core
