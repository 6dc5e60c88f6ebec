#pragma once

#include <s2p/core/detection.hpp>
#include <s2p/core/error.hpp>
#include <s2p/core/image.hpp>
#include <s2p/core/ingestion_mailbox.hpp>
#include <s2p/core/result_store.hpp>
#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <thread>

namespace s2p::app {

/// Runs one inference; the worker never calls it from two threads at once.
using InferFn = std::function<std::expected<s2p::core::DetectionList, s2p::core::ServiceError>(
    const s2p::core::Image&)>;

/// Invoked once, from the worker thread, when inference reports a fatal error.
using FatalErrorCallback = std::function<void(s2p::core::ServiceError)>;

/// The single consumer of the IngestionMailbox and sole writer of the ResultStore.
///
/// Loop: take_blocking() -> infer -> make_batch (sorted, timestamped) -> publish.
/// A failed inference is logged and not published, so readers keep the
/// previous batch. A fatal error (is_fatal()) stops the loop and fires the
/// fatal callback. The loop ends when the mailbox is closed.
class InferenceWorker {
 public:
  InferenceWorker(s2p::core::IngestionMailbox& mailbox,
                  s2p::core::ResultStore& store,
                  InferFn infer,
                  FatalErrorCallback on_fatal = {});

  /// Closes the mailbox and joins the thread.
  ~InferenceWorker();

  InferenceWorker(const InferenceWorker&) = delete;
  InferenceWorker& operator=(const InferenceWorker&) = delete;

  /// Spawns the worker thread. No-op if already started.
  void start();

  /// Closes the mailbox, waits for the in-flight inference, joins.
  void stop();

  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  [[nodiscard]] std::uint64_t claimed_count() const noexcept { return claimed_.load(); }
  [[nodiscard]] std::uint64_t published_count() const noexcept { return published_.load(); }
  [[nodiscard]] std::uint64_t failed_count() const noexcept { return failed_.load(); }

 private:
  void run();
  void process(const s2p::core::Image& image);

  s2p::core::IngestionMailbox& mailbox_;
  s2p::core::ResultStore& store_;
  InferFn infer_;
  FatalErrorCallback on_fatal_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> claimed_{0};
  std::atomic<std::uint64_t> published_{0};
  std::atomic<std::uint64_t> failed_{0};
};

}  // namespace s2p::app
