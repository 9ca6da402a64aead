#pragma once

#include <cstdint>
#include <string>

namespace keyshop::db::model {

struct ProcessedPaymentRecord {
  std::string payment_id;
  int64_t     claimed_at_ms = 0;
};

} // namespace keyshop::db::model
