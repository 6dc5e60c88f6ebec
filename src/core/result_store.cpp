#include <s2p/core/result_store.hpp>
#include <utility>

namespace s2p::core {

void ResultStore::publish(DetectionBatch batch) {
  auto next = std::make_shared<const DetectionBatch>(std::move(batch));
  std::shared_ptr<const DetectionBatch> previous;
  {
    std::lock_guard lock(mutex_);
    previous = std::exchange(latest_, std::move(next));
    ++version_;
  }
  // previous is released outside the lock
}

std::shared_ptr<const DetectionBatch> ResultStore::snapshot() const {
  std::lock_guard lock(mutex_);
  return latest_;
}

std::uint64_t ResultStore::version() const {
  std::lock_guard lock(mutex_);
  return version_;
}

}  // namespace s2p::core
