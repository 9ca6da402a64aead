#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/util/time.hpp"
#include "keyshop/ledger/v1.hpp"

namespace keyshop::ledger {

/*
  Flips a pending intent to paid exactly once.

  Read, conditional update and commit happen in one exclusive transaction.
  Of any number of concurrent callers for the same id exactly one gets the
  metadata back; the rest get nullopt. A storage fault leaves the row
  untouched and propagates as db::DatabaseError once retries run out.
*/
class CompletionCoordinator {
 public:
  CompletionCoordinator(std::shared_ptr<db::Repository> repository, db::RetryPolicy retry = {}, util::NowFn now = util::SystemNow());

  std::optional<keyshop::ledger::v1::OrderMetadata> CompleteIfPending(const std::string& payment_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  db::RetryPolicy                 retry_;
  util::NowFn                     now_;
};

} // namespace keyshop::ledger
