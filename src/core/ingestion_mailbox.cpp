#include <s2p/core/ingestion_mailbox.hpp>
#include <utility>

namespace s2p::core {

bool IngestionMailbox::submit(Image image) {
  bool replaced = false;
  {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    replaced = pending_.has_value();
    pending_ = std::move(image);
    ++submitted_;
    if (replaced) ++discarded_;
  }
  cv_.notify_one();
  return replaced;
}

std::optional<Image> IngestionMailbox::take_blocking() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this]() { return closed_ || pending_.has_value(); });
  if (closed_) return std::nullopt;
  return std::exchange(pending_, std::nullopt);
}

void IngestionMailbox::close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    pending_.reset();
  }
  cv_.notify_all();
}

bool IngestionMailbox::has_pending() const {
  std::lock_guard lock(mutex_);
  return pending_.has_value();
}

bool IngestionMailbox::closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

std::uint64_t IngestionMailbox::submitted_count() const {
  std::lock_guard lock(mutex_);
  return submitted_;
}

std::uint64_t IngestionMailbox::discarded_count() const {
  std::lock_guard lock(mutex_);
  return discarded_;
}

}  // namespace s2p::core
