#pragma once

#include <s2p/core/image.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

namespace s2p::core {

/// Capacity-1 handoff cell between request handlers and the inference worker.
///
/// submit() stores the image as the pending item and overwrites any image the
/// worker has not claimed yet; it never blocks beyond the slot lock and never
/// grows. take_blocking() is for the single worker only: it suspends until an
/// image is pending and moves it out. An image already taken is owned by the
/// worker and is unaffected by later submissions.
class IngestionMailbox {
 public:
  IngestionMailbox() = default;

  IngestionMailbox(const IngestionMailbox&) = delete;
  IngestionMailbox& operator=(const IngestionMailbox&) = delete;

  /// Returns true if a pending, unclaimed image was discarded.
  bool submit(Image image);

  /// Blocks until an image is pending; std::nullopt only after close().
  [[nodiscard]] std::optional<Image> take_blocking();

  /// Wakes the waiting worker; pending images are dropped and later
  /// submissions are ignored.
  void close();

  [[nodiscard]] bool has_pending() const;
  [[nodiscard]] bool closed() const;

  [[nodiscard]] std::uint64_t submitted_count() const;
  [[nodiscard]] std::uint64_t discarded_count() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<Image> pending_;
  bool closed_{false};
  std::uint64_t submitted_{0};
  std::uint64_t discarded_{0};
};

}  // namespace s2p::core
