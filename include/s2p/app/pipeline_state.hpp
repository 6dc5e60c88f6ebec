#pragma once

#include <s2p/app/inference_worker.hpp>
#include <s2p/core/detection.hpp>
#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/ingestion_mailbox.hpp>
#include <s2p/core/result_store.hpp>
#include <s2p/vision/detection_model.hpp>
#include <expected>
#include <memory>
#include <mutex>

namespace s2p::app {

/// Process-wide pipeline: the model adapter, the ingestion mailbox, the result
/// store and the one inference worker. Built once at startup by create() and
/// handed by reference to every request handler.
///
/// Every adapter call, from the worker or from the warmup endpoint, goes
/// through one model mutex, so the adapter never runs two inferences at once.
class PipelineState {
  struct Token {
    explicit Token() = default;
  };

 public:
  /// Loads the model and runs the warmup inference. Any failure is a startup
  /// failure: the caller must not serve requests.
  [[nodiscard]] static std::expected<std::unique_ptr<PipelineState>, s2p::core::ServiceError>
  create(std::unique_ptr<s2p::vision::IDetectionModel> model);

  /// Use create(); the token keeps construction private to it.
  PipelineState(Token, std::unique_ptr<s2p::vision::IDetectionModel> model);
  ~PipelineState();

  PipelineState(const PipelineState&) = delete;
  PipelineState& operator=(const PipelineState&) = delete;

  /// Starts the inference worker. on_fatal fires from the worker thread.
  void start_worker(FatalErrorCallback on_fatal = {});

  /// Closes the mailbox, lets the in-flight inference finish, joins the worker.
  void stop();

  /// Hands an image to the worker, replacing any unclaimed one. Never blocks
  /// on inference. Returns true if a pending image was discarded.
  bool submit(s2p::core::Image image);

  /// Latest published batch, or nullptr before the first success.
  [[nodiscard]] std::shared_ptr<const s2p::core::DetectionBatch> snapshot() const;

  /// Detections for the fixed warmup image, recomputed on every call.
  [[nodiscard]] std::expected<s2p::core::DetectionList, s2p::core::ServiceError> run_warmup();

  /// Serialized adapter call used by the worker.
  [[nodiscard]] std::expected<s2p::core::DetectionList, s2p::core::ServiceError>
  run_inference(const s2p::core::Image& image);

  [[nodiscard]] s2p::core::IngestionMailbox& mailbox() noexcept { return mailbox_; }
  [[nodiscard]] const s2p::core::ResultStore& results() const noexcept { return store_; }
  [[nodiscard]] const InferenceWorker* worker() const noexcept { return worker_.get(); }

  /// Warmup detections computed by create().
  [[nodiscard]] const s2p::core::DetectionList& startup_detections() const noexcept {
    return startup_detections_;
  }

 private:
  std::unique_ptr<s2p::vision::IDetectionModel> model_;
  std::mutex model_mutex_;
  s2p::core::IngestionMailbox mailbox_;
  s2p::core::ResultStore store_;
  std::unique_ptr<InferenceWorker> worker_;
  s2p::core::DetectionList startup_detections_;
};

}  // namespace s2p::app
