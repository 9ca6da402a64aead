#include "fulfillment_queue.hpp"

namespace keyshop::fulfillment {

bool FulfillmentQueue::Enqueue(const keyshop::ledger::v1::OrderMetadata& order) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(order);
  }
  cv_.notify_one();
  return true;
}

std::optional<keyshop::ledger::v1::OrderMetadata> FulfillmentQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto order = std::move(queue_.front());
  queue_.pop();
  return order;
}

void FulfillmentQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t FulfillmentQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace keyshop::fulfillment
