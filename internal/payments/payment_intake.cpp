#include "payment_intake.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/money.hpp"

namespace keyshop::payments {

namespace v1 = keyshop::ledger::v1;

PaymentIntake::PaymentIntake(std::shared_ptr<VerifierRegistry> verifiers, std::shared_ptr<ledger::PendingLedger> ledger,
                             std::shared_ptr<ledger::CompletionCoordinator> coordinator, std::shared_ptr<fulfillment::FulfillmentQueue> queue,
                             std::shared_ptr<fulfillment::FulfillmentOrchestrator> orchestrator)
    : verifiers_(std::move(verifiers)),
      ledger_(std::move(ledger)),
      coordinator_(std::move(coordinator)),
      queue_(std::move(queue)),
      orchestrator_(std::move(orchestrator)) {
}

IntakeResult PaymentIntake::Submit(const RawNotification& notification) {
  return Accept(notification.provider, verifiers_->Verify(notification));
}

IntakeResult PaymentIntake::Accept(const std::string& provider, const VerifiedPayment& payment) {
  IntakeResult result;
  result.payment_id = payment.internal_payment_id;

  if (auto pending = ledger_->Find(payment.internal_payment_id);
      pending && pending->status == db::model::IntentStatus::Pending &&
      (pending->amount_minor != payment.amount_minor || pending->currency != payment.currency)) {
    KEYSHOP_LOG_WARN("payment amount mismatch", {observability::StringField("payment_id", payment.internal_payment_id),
                                                  observability::StringField("provider", provider),
                                                  observability::StringField("expected", util::FormatMinorUnits(pending->amount_minor) + " " + pending->currency),
                                                  observability::StringField("received", util::FormatMinorUnits(payment.amount_minor) + " " + payment.currency)});
    result.outcome = v1::INTAKE_OUTCOME_AMOUNT_MISMATCH;
    return result;
  }

  auto metadata = coordinator_->CompleteIfPending(payment.internal_payment_id);
  if (!metadata) {
    KEYSHOP_LOG_INFO("notification for a paid or unknown intent", {observability::StringField("payment_id", payment.internal_payment_id),
                                                                     observability::StringField("provider", provider)});
    result.outcome = v1::INTAKE_OUTCOME_DUPLICATE_OR_UNKNOWN;
    return result;
  }

  if (metadata->payment_method().empty()) metadata->set_payment_method(provider);

  KEYSHOP_LOG_INFO("payment accepted", {observability::StringField("payment_id", payment.internal_payment_id),
                                        observability::StringField("provider", provider),
                                        observability::StringField("provider_payment_id", payment.provider_payment_id)});

  if (!queue_ || !queue_->Enqueue(*metadata)) {
    orchestrator_->Run(*metadata);
  }
  result.outcome = v1::INTAKE_OUTCOME_ACCEPTED;
  return result;
}

} // namespace keyshop::payments
