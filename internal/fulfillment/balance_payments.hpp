#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/fulfillment/fulfillment_guard.hpp"
#include "internal/fulfillment/orchestrator.hpp"
#include "internal/fulfillment/settings.hpp"
#include "keyshop/ledger/v1.hpp"

namespace keyshop::fulfillment {

/*
  Orders paid from the payer's stored balance.

  There is no provider and no ledger row: the claim and the debit commit
  in one transaction, then the orchestrator runs the claimed order. With
  insufficient funds nothing commits and the payment id stays unclaimed.
*/
class BalancePayments {
 public:
  BalancePayments(std::shared_ptr<db::Repository> repository, std::shared_ptr<FulfillmentGuard> guard,
                  std::shared_ptr<FulfillmentOrchestrator> orchestrator, std::shared_ptr<SettingsProvider> settings, db::RetryPolicy retry = {});

  keyshop::ledger::v1::FulfillmentReport Pay(keyshop::ledger::v1::OrderMetadata metadata);

 private:
  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<FulfillmentGuard>        guard_;
  std::shared_ptr<FulfillmentOrchestrator> orchestrator_;
  std::shared_ptr<SettingsProvider>        settings_;
  db::RetryPolicy                          retry_;
};

} // namespace keyshop::fulfillment
