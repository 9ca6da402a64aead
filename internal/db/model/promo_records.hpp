#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace keyshop::db::model {

struct PromoCodeRecord {
  std::string            code;
  int64_t                discount_minor   = 0;
  double                 discount_percent = 0.0;
  // 0 = unlimited
  int64_t                usage_limit_total     = 0;
  int64_t                usage_limit_per_owner = 0;
  int64_t                used_total            = 0;
  std::optional<int64_t> valid_until_ms;
  bool                   is_active = true;
};

struct PromoUsageRecord {
  int64_t     usage_id = 0;
  std::string code;
  int64_t     owner_id      = 0;
  int64_t     applied_minor = 0;
  std::string order_id;
  int64_t     used_at_ms = 0;
};

} // namespace keyshop::db::model
