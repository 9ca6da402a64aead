#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "keyshop/ledger/v1.hpp"

namespace keyshop::fulfillment {

/*
  Thread-safe blocking queue of completed orders waiting for fulfillment.
*/
class FulfillmentQueue {
 public:
  // false after Shutdown
  bool Enqueue(const keyshop::ledger::v1::OrderMetadata& order);

  // blocking wait; nullopt once shut down and drained
  std::optional<keyshop::ledger::v1::OrderMetadata> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::queue<keyshop::ledger::v1::OrderMetadata> queue_;
  bool                                           shutdown_ = false;
};

} // namespace keyshop::fulfillment
