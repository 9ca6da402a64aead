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
  Durable record of payment intents.

  A row is created before the payer is redirected to a provider and may be
  refreshed while it is pending. Only the CompletionCoordinator moves it to
  paid; nothing ever moves it back.
*/
class PendingLedger {
 public:
  PendingLedger(std::shared_ptr<db::Repository> repository, db::RetryPolicy retry = {}, util::NowFn now = util::SystemNow());

  // Returns false on invalid metadata, on an already-paid row and on storage
  // failure. Callers treat false as non-fatal.
  bool CreateOrRefreshIntent(const keyshop::ledger::v1::OrderMetadata& metadata);

  // Metadata of a pending row. Paid and unknown ids return nullopt.
  std::optional<keyshop::ledger::v1::OrderMetadata> PeekMetadata(const std::string& payment_id);

  keyshop::ledger::v1::IntentStatus GetStatus(const std::string& payment_id);

  std::optional<keyshop::ledger::v1::OrderMetadata> MostRecentPendingFor(int64_t owner_id);

  // Raw row, any status. Used by payment intake for the amount check.
  std::optional<db::model::PendingTransactionRecord> Find(const std::string& payment_id);

 private:
  std::shared_ptr<db::Repository> repository_;
  db::RetryPolicy                 retry_;
  util::NowFn                     now_;
};

} // namespace keyshop::ledger
