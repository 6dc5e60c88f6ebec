#pragma once

#include <s2p/core/detection.hpp>
#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace s2p::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages; passes the Image through until a stage returns
/// detections. Stages may hold backend state, so a Pipeline must not be run
/// from two threads at once.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run pipeline on one image; returns the detections or the first error.
  /// If timing_cb is non-null, it is called after each stage with (stage_index, duration_ms).
  [[nodiscard]] std::expected<DetectionList, ServiceError> run(
      const Image& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace s2p::core
