#include <s2p/app/pipeline_state.hpp>
#include <s2p/core/logger.hpp>
#include <chrono>

namespace s2p::app {

namespace sc = s2p::core;

PipelineState::PipelineState(Token, std::unique_ptr<s2p::vision::IDetectionModel> model)
    : model_(std::move(model)) {}

PipelineState::~PipelineState() {
  stop();
}

std::expected<std::unique_ptr<PipelineState>, sc::ServiceError>
PipelineState::create(std::unique_ptr<s2p::vision::IDetectionModel> model) {
  if (!model) {
    return std::unexpected(sc::ServiceError::InvalidConfig);
  }
  auto state = std::make_unique<PipelineState>(Token{}, std::move(model));

  const auto t0 = std::chrono::steady_clock::now();
  if (auto loaded = state->model_->load(); !loaded) {
    sc::logger()->critical("model load failed: {}", sc::to_string(loaded.error()));
    return std::unexpected(loaded.error());
  }
  const auto t1 = std::chrono::steady_clock::now();

  auto warm = state->run_warmup();
  if (!warm) {
    sc::logger()->critical("model warmup failed: {}", sc::to_string(warm.error()));
    return std::unexpected(warm.error());
  }
  const auto t2 = std::chrono::steady_clock::now();

  state->startup_detections_ = std::move(*warm);
  sc::logger()->info("model loaded in {:.1f} ms, warmup in {:.1f} ms ({} objects on warmup image)",
                     std::chrono::duration<double, std::milli>(t1 - t0).count(),
                     std::chrono::duration<double, std::milli>(t2 - t1).count(),
                     state->startup_detections_.size());
  return state;
}

void PipelineState::start_worker(FatalErrorCallback on_fatal) {
  if (worker_) return;
  worker_ = std::make_unique<InferenceWorker>(
      mailbox_, store_,
      [this](const sc::Image& image) { return run_inference(image); },
      std::move(on_fatal));
  worker_->start();
}

void PipelineState::stop() {
  if (worker_) {
    worker_->stop();
  } else {
    mailbox_.close();
  }
}

bool PipelineState::submit(sc::Image image) {
  const bool replaced = mailbox_.submit(std::move(image));
  if (replaced) {
    sc::logger()->debug("discarded pending image (replaced by a newer upload)");
  }
  return replaced;
}

std::shared_ptr<const sc::DetectionBatch> PipelineState::snapshot() const {
  return store_.snapshot();
}

std::expected<sc::DetectionList, sc::ServiceError> PipelineState::run_warmup() {
  std::lock_guard lock(model_mutex_);
  return model_->warmup();
}

std::expected<sc::DetectionList, sc::ServiceError>
PipelineState::run_inference(const sc::Image& image) {
  std::lock_guard lock(model_mutex_);
  return model_->infer(image);
}

}  // namespace s2p::app
