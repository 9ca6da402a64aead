#pragma once

#include <cstdint>
#include <string>

namespace keyshop::db::model {

struct CommissionRecord {
  std::string instance_id;
  std::string payment_id;
  int64_t     owner_id         = 0;
  int64_t     amount_minor     = 0;
  double      percent          = 0.0;
  int64_t     commission_minor = 0;
  std::string payment_method;
  int64_t     created_at_ms = 0;
};

} // namespace keyshop::db::model
