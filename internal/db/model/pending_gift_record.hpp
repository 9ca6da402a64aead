#pragma once

#include <cstdint>
#include <string>

namespace keyshop::db::model {

struct PendingGiftRecord {
  std::string payment_id;
  int64_t     payer_id = 0;
  // full OrderMetadata JSON, kept so the gift can be provisioned later
  std::string metadata_json;
  int64_t     created_at_ms = 0;
};

} // namespace keyshop::db::model
