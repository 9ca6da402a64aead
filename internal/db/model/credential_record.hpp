#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace keyshop::db::model {

struct CredentialRecord {
  int64_t                credential_id = 0;
  int64_t                owner_id      = 0;
  std::string            provider_host;
  std::string            remote_uuid;
  std::string            unique_identity;
  int64_t                expires_at_ms = 0;
  std::optional<int64_t> missing_since_ms;
  // JSON: {"kind","plan_id","plan_name","days","label"}
  std::string            origin_json;
  int64_t                created_at_ms = 0;
  int64_t                updated_at_ms = 0;
};

} // namespace keyshop::db::model
