#pragma once

#include <memory>

namespace keyshop::db { class Repository; }
namespace keyshop::ledger {
class PendingLedger;
class CompletionCoordinator;
} // namespace keyshop::ledger
namespace keyshop::fulfillment {
class FulfillmentGuard;
class FulfillmentOrchestrator;
class BalancePayments;
} // namespace keyshop::fulfillment
namespace keyshop::payments { class PaymentIntake; }
namespace keyshop::reconcile { class Reconciler; }

namespace keyshop::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<keyshop::db::Repository>                       repository;
  std::shared_ptr<keyshop::ledger::PendingLedger>                ledger;
  std::shared_ptr<keyshop::ledger::CompletionCoordinator>        coordinator;
  std::shared_ptr<keyshop::fulfillment::FulfillmentGuard>        guard;
  std::shared_ptr<keyshop::fulfillment::FulfillmentOrchestrator> orchestrator;
  std::shared_ptr<keyshop::fulfillment::BalancePayments>         balance_payments;
  std::shared_ptr<keyshop::payments::PaymentIntake>              intake;
  std::shared_ptr<keyshop::reconcile::Reconciler>                reconciler;
};

} // namespace keyshop::service
