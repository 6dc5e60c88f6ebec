#include <s2p/core/pipeline.hpp>
#include <chrono>

namespace s2p::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<DetectionList, ServiceError> Pipeline::run(
    const Image& input,
    StageTimingCallback* timing_cb) {
  if (stages_.empty()) {
    return std::unexpected(ServiceError::InvalidConfig);
  }

  StageOutput current = input;
  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const Image* image = std::get_if<Image>(&current);
    if (!image) {
      break;
    }

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*image);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      (*timing_cb)(i, std::chrono::duration<double, std::milli>(stage_end - stage_start).count());
    }

    if (!result) {
      return std::unexpected(result.error());
    }
    current = std::move(*result);
  }

  if (auto* detections = std::get_if<DetectionList>(&current)) {
    return std::move(*detections);
  }
  // The last stage handed back an image: no detection stage configured.
  return std::unexpected(ServiceError::InvalidConfig);
}

}  // namespace s2p::core
