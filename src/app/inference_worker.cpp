#include <s2p/app/inference_worker.hpp>
#include <s2p/core/detection_batch.hpp>
#include <s2p/core/logger.hpp>
#include <chrono>
#include <exception>

namespace s2p::app {

namespace sc = s2p::core;

InferenceWorker::InferenceWorker(sc::IngestionMailbox& mailbox,
                                 sc::ResultStore& store,
                                 InferFn infer,
                                 FatalErrorCallback on_fatal)
    : mailbox_(mailbox),
      store_(store),
      infer_(std::move(infer)),
      on_fatal_(std::move(on_fatal)) {}

InferenceWorker::~InferenceWorker() {
  stop();
}

void InferenceWorker::start() {
  if (thread_.joinable()) return;
  running_ = true;
  thread_ = std::thread(&InferenceWorker::run, this);
}

void InferenceWorker::stop() {
  mailbox_.close();
  if (thread_.joinable()) thread_.join();
  running_ = false;
}

void InferenceWorker::run() {
  sc::logger()->info("inference worker started");
  while (running_) {
    auto image = mailbox_.take_blocking();
    if (!image) break;  // mailbox closed
    process(*image);
  }
  running_ = false;
  sc::logger()->info("inference worker stopped after {} images ({} published, {} failed)",
                     claimed_.load(), published_.load(), failed_.load());
}

void InferenceWorker::process(const sc::Image& image) {
  const std::uint64_t seq = ++claimed_;
  const auto start = std::chrono::steady_clock::now();

  std::expected<sc::DetectionList, sc::ServiceError> detections =
      std::unexpected(sc::ServiceError::InferenceFailed);
  try {
    detections = infer_(image);
  } catch (const std::exception& e) {
    sc::logger()->error("image #{}: inference threw: {}", seq, e.what());
  }

  const double ms = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - start).count();

  if (!detections) {
    ++failed_;
    const sc::ServiceError error = detections.error();
    if (sc::is_fatal(error)) {
      sc::logger()->critical("image #{}: fatal inference error: {}", seq, sc::to_string(error));
      running_ = false;
      if (on_fatal_) on_fatal_(error);
      return;
    }
    sc::logger()->warn("image #{} ({}x{}): inference failed after {:.1f} ms: {}; keeping previous result",
                       seq, image.width(), image.height(), ms, sc::to_string(error));
    return;
  }

  const std::size_t count = detections->size();
  store_.publish(sc::make_batch(std::move(*detections)));
  ++published_;
  sc::logger()->debug("image #{} ({}x{}): {} objects in {:.1f} ms", seq, image.width(),
                      image.height(), count, ms);
}

}  // namespace s2p::app
