#include "fulfillment_guard.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace keyshop::fulfillment {

FulfillmentGuard::FulfillmentGuard(std::shared_ptr<db::Repository> repository, db::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)), retry_(retry), now_(std::move(now)) {
}

bool FulfillmentGuard::Claim(const std::string& payment_id) {
  const bool claimed = db::RunWithRetry(retry_, "Claim", [&] {
    auto tx = repository_->Begin();
    if (!ClaimWithin(*tx, payment_id)) {
      tx->Rollback();
      return false;
    }
    tx->Commit();
    return true;
  });

  if (!claimed) {
    KEYSHOP_LOG_INFO("payment already claimed", {observability::StringField("payment_id", payment_id)});
  }
  return claimed;
}

bool FulfillmentGuard::ClaimWithin(db::Transaction& tx, const std::string& payment_id) {
  if (payment_id.empty()) throw util::InvalidArgument("payment_id is required");

  db::model::ProcessedPaymentRecord record;
  record.payment_id    = payment_id;
  record.claimed_at_ms = util::ToUnixMillis(now_());

  auto result = repository_->InsertProcessedPayment(tx, record);
  if (result) return true;
  if (result.code == db::ErrorCode::AlreadyExists) return false;
  throw db::DatabaseError(result.code, "claim failed: " + result.message);
}

} // namespace keyshop::fulfillment
