#pragma once

#include <cstdint>
#include <string>

namespace keyshop::db::model {

struct PaymentLogRecord {
  int64_t     log_id   = 0;
  int64_t     owner_id = 0;
  std::string payment_id;
  std::string payment_method;
  int64_t     amount_minor = 0;
  std::string currency;
  std::string action;
  std::string status;
  std::string metadata_json;
  int64_t     created_at_ms = 0;
};

} // namespace keyshop::db::model
