#pragma once

#include <cstdint>
#include <optional>

namespace keyshop::db::model {

struct AccountRecord {
  int64_t                owner_id      = 0;
  int64_t                balance_minor = 0;
  std::optional<int64_t> referrer_id;
  int64_t                referral_balance_minor = 0;
  int64_t                referral_total_minor   = 0;
  int64_t                created_at_ms          = 0;
};

} // namespace keyshop::db::model
