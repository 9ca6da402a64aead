#pragma once

#include <memory>
#include <string>

#include "internal/fulfillment/fulfillment_queue.hpp"
#include "internal/fulfillment/orchestrator.hpp"
#include "internal/ledger/completion_coordinator.hpp"
#include "internal/ledger/pending_ledger.hpp"
#include "internal/payments/payment_verifier.hpp"
#include "keyshop/ledger/v1.hpp"

namespace keyshop::payments {

struct IntakeResult {
  keyshop::ledger::v1::IntakeOutcome outcome = keyshop::ledger::v1::INTAKE_OUTCOME_UNSPECIFIED;
  std::string                        payment_id;
};

/*
  Entry point for verified provider notifications.

    verify -> amount check against the pending intent -> CompleteIfPending
           -> enqueue for fulfillment

  Only the first delivery for a payment id is enqueued; later deliveries
  report DUPLICATE_OR_UNKNOWN. Storage faults propagate so the provider
  redelivers. When the queue no longer accepts work the order runs inline.
*/
class PaymentIntake {
 public:
  PaymentIntake(std::shared_ptr<VerifierRegistry> verifiers, std::shared_ptr<ledger::PendingLedger> ledger,
                std::shared_ptr<ledger::CompletionCoordinator> coordinator, std::shared_ptr<fulfillment::FulfillmentQueue> queue,
                std::shared_ptr<fulfillment::FulfillmentOrchestrator> orchestrator);

  // Throws util::Rejected when verification fails.
  IntakeResult Submit(const RawNotification& notification);

  IntakeResult Accept(const std::string& provider, const VerifiedPayment& payment);

 private:
  std::shared_ptr<VerifierRegistry>                     verifiers_;
  std::shared_ptr<ledger::PendingLedger>                ledger_;
  std::shared_ptr<ledger::CompletionCoordinator>        coordinator_;
  std::shared_ptr<fulfillment::FulfillmentQueue>        queue_;
  std::shared_ptr<fulfillment::FulfillmentOrchestrator> orchestrator_;
};

} // namespace keyshop::payments
