#pragma once

#include <cstdint>
#include <string>

namespace keyshop::db::model {

enum class IntentStatus { Pending, Paid };

inline const char* ToString(IntentStatus s) {
  return s == IntentStatus::Paid ? "paid" : "pending";
}

struct PendingTransactionRecord {
  std::string  payment_id;
  int64_t      owner_id     = 0;
  int64_t      amount_minor = 0;
  std::string  currency;
  std::string  metadata_json;
  IntentStatus status        = IntentStatus::Pending;
  int64_t      created_at_ms = 0;
  int64_t      updated_at_ms = 0;
};

} // namespace keyshop::db::model
