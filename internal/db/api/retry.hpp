#pragma once

#include <chrono>
#include <thread>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace keyshop::db {

/*
  Bounded retry for whole transactions.

  Only transient faults (lock contention, serialization conflicts) are
  retried; the callable must open and commit its own transaction so every
  attempt starts from a fresh snapshot.
*/
struct RetryPolicy {
  int                       attempts   = 5;
  std::chrono::milliseconds base_delay = std::chrono::milliseconds(50);
};

template <typename Fn>
auto RunWithRetry(const RetryPolicy& policy, const char* operation, Fn&& fn) -> decltype(fn()) {
  const int attempts = policy.attempts > 0 ? policy.attempts : 1;
  for (int attempt = 0;; ++attempt) {
    try {
      return fn();
    } catch (const DatabaseError& e) {
      if (!e.retryable() || attempt + 1 >= attempts) {
        throw;
      }
      KEYSHOP_LOG_WARN("transaction retry", {observability::StringField("operation", operation),
                                              observability::IntField("attempt", attempt + 1),
                                              observability::StringField("error", e.what())});
      std::this_thread::sleep_for(policy.base_delay * (1 << attempt));
    }
  }
}

} // namespace keyshop::db
