#include "balance_payments.hpp"

#include "internal/ledger/order_metadata.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace keyshop::fulfillment {

namespace v1 = keyshop::ledger::v1;

namespace {

enum class Debit { Done, Duplicate, InsufficientFunds };

v1::FulfillmentReport ReportOf(const std::string& payment_id, v1::FulfillmentResult result, const std::string& error_code = {}) {
  v1::FulfillmentReport report;
  report.set_payment_id(payment_id);
  report.set_result(result);
  report.set_error_code(error_code);
  return report;
}

} // namespace

BalancePayments::BalancePayments(std::shared_ptr<db::Repository> repository, std::shared_ptr<FulfillmentGuard> guard,
                                 std::shared_ptr<FulfillmentOrchestrator> orchestrator, std::shared_ptr<SettingsProvider> settings, db::RetryPolicy retry)
    : repository_(std::move(repository)),
      guard_(std::move(guard)),
      orchestrator_(std::move(orchestrator)),
      settings_(std::move(settings)),
      retry_(retry) {
}

v1::FulfillmentReport BalancePayments::Pay(v1::OrderMetadata metadata) {
  ledger::ValidateMetadata(metadata);
  if (metadata.has_top_up()) throw util::InvalidArgument("a top-up cannot be paid from the balance");

  const auto settings = settings_->Snapshot();
  if (metadata.payment_method().empty()) {
    if (settings.balance_methods.empty()) throw util::InvalidArgument("no balance payment method configured");
    metadata.set_payment_method(settings.balance_methods.front());
  } else if (!settings.IsBalanceMethod(metadata.payment_method())) {
    throw util::InvalidArgument("not a balance payment method: " + metadata.payment_method());
  }

  const int64_t amount = ledger::AmountMinor(metadata);

  const Debit debit = db::RunWithRetry(retry_, "PayFromBalance", [&] {
    auto tx = repository_->Begin();
    if (!guard_->ClaimWithin(*tx, metadata.payment_id())) {
      tx->Rollback();
      return Debit::Duplicate;
    }

    auto debited = repository_->AdjustBalance(*tx, metadata.owner_id(), -amount);
    if (!debited) {
      tx->Rollback();
      if (debited.code == db::ErrorCode::Conflict) return Debit::InsufficientFunds;
      throw db::DatabaseError(debited.code, "balance debit: " + debited.message);
    }
    tx->Commit();
    return Debit::Done;
  });

  switch (debit) {
    case Debit::Duplicate:
      KEYSHOP_LOG_INFO("balance payment already claimed", {observability::StringField("payment_id", metadata.payment_id())});
      return ReportOf(metadata.payment_id(), v1::FULFILLMENT_RESULT_DUPLICATE);
    case Debit::InsufficientFunds:
      KEYSHOP_LOG_INFO("insufficient balance", {observability::StringField("payment_id", metadata.payment_id()),
                                                 observability::IntField("owner_id", metadata.owner_id()),
                                                 observability::IntField("amount_minor", amount)});
      return ReportOf(metadata.payment_id(), v1::FULFILLMENT_RESULT_INSUFFICIENT_FUNDS, "insufficient_funds");
    case Debit::Done:
      break;
  }

  return orchestrator_->ExecuteClaimed(metadata);
}

} // namespace keyshop::fulfillment
