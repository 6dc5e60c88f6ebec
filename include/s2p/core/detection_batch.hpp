#pragma once

#include <s2p/core/detection.hpp>
#include <chrono>

namespace s2p::core {

using Clock = std::chrono::system_clock;

/// One completed inference: detections sorted by confidence (descending,
/// stable w.r.t. model output order) and the completion time.
/// Build through make_batch() so the ordering invariant always holds.
struct DetectionBatch {
  DetectionList detections;
  Clock::time_point timestamp{};
};

/// Stable sort by confidence, highest first.
void sort_by_confidence(DetectionList& detections);

[[nodiscard]] DetectionBatch make_batch(DetectionList detections,
                                        Clock::time_point timestamp = Clock::now());

/// Seconds since the Unix epoch, with sub-second precision.
[[nodiscard]] double to_unix_seconds(Clock::time_point t) noexcept;

}  // namespace s2p::core
