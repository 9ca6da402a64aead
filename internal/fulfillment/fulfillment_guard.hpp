#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/util/time.hpp"

namespace keyshop::fulfillment {

/*
  Append-only set of payment ids whose fulfillment has started.

  Independent of the pending ledger: balance payments and rebuilt orders
  never had a ledger row but are still fulfilled at most once.
*/
class FulfillmentGuard {
 public:
  FulfillmentGuard(std::shared_ptr<db::Repository> repository, db::RetryPolicy retry = {}, util::NowFn now = util::SystemNow());

  // true exactly once per payment id
  bool Claim(const std::string& payment_id);

  // Claim inside the caller's transaction; it only sticks if that commits.
  bool ClaimWithin(db::Transaction& tx, const std::string& payment_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  db::RetryPolicy                 retry_;
  util::NowFn                     now_;
};

} // namespace keyshop::fulfillment
