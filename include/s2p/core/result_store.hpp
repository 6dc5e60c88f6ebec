#pragma once

#include <s2p/core/detection_batch.hpp>
#include <cstdint>
#include <memory>
#include <mutex>

namespace s2p::core {

/// Holds the most recently published DetectionBatch.
///
/// Batches are immutable once published; publish() swaps a shared pointer
/// under the lock, so a concurrent snapshot() sees either the old or the new
/// batch in full. Both critical sections are O(1).
class ResultStore {
 public:
  ResultStore() = default;

  ResultStore(const ResultStore&) = delete;
  ResultStore& operator=(const ResultStore&) = delete;

  void publish(DetectionBatch batch);

  /// Latest batch, or nullptr before the first publish.
  [[nodiscard]] std::shared_ptr<const DetectionBatch> snapshot() const;

  /// Number of publishes so far; 0 means nothing published yet.
  [[nodiscard]] std::uint64_t version() const;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const DetectionBatch> latest_;
  std::uint64_t version_{0};
};

}  // namespace s2p::core
