#pragma once

#include <cstdint>
#include <string>

namespace keyshop::db::model {

struct FulfillmentOutcomeRecord {
  std::string payment_id;
  std::string step;
  // position within the run; reports list steps in this order
  int32_t     sequence = 0;
  // ok | skipped | failed
  std::string status;
  std::string detail;
  int64_t     recorded_at_ms = 0;
};

} // namespace keyshop::db::model
