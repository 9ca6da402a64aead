#include "completion_coordinator.hpp"

#include "internal/ledger/order_metadata.hpp"
#include "internal/observability/logging.hpp"

namespace keyshop::ledger {

using keyshop::ledger::v1::OrderMetadata;

CompletionCoordinator::CompletionCoordinator(std::shared_ptr<db::Repository> repository, db::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)), retry_(retry), now_(std::move(now)) {
}

std::optional<OrderMetadata> CompletionCoordinator::CompleteIfPending(const std::string& payment_id) {
  if (payment_id.empty()) return std::nullopt;

  auto completed = db::RunWithRetry(retry_, "CompleteIfPending", [&]() -> std::optional<OrderMetadata> {
    auto tx  = repository_->Begin();
    auto row = repository_->GetPendingTransaction(*tx, payment_id);
    if (!row || row->status != db::model::IntentStatus::Pending) {
      tx->Rollback();
      return std::nullopt;
    }

    // captured before the update; later refreshes are rejected once paid
    auto metadata = DecodeMetadata(row->metadata_json);
    metadata.set_payment_id(payment_id);

    auto result = repository_->MarkPaid(*tx, payment_id, util::ToUnixMillis(now_()));
    if (!result) {
      tx->Rollback();
      return std::nullopt;
    }

    tx->Commit();
    return metadata;
  });

  if (completed) {
    KEYSHOP_LOG_INFO("intent completed", {observability::StringField("payment_id", payment_id),
                                          observability::IntField("owner_id", completed->owner_id())});
  }
  return completed;
}

} // namespace keyshop::ledger
