#include "pending_ledger.hpp"

#include "internal/ledger/order_metadata.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace keyshop::ledger {

using keyshop::ledger::v1::IntentStatus;
using keyshop::ledger::v1::OrderMetadata;

namespace {

OrderMetadata MetadataOf(const db::model::PendingTransactionRecord& row) {
  auto metadata = DecodeMetadata(row.metadata_json);
  metadata.set_payment_id(row.payment_id);
  return metadata;
}

} // namespace

PendingLedger::PendingLedger(std::shared_ptr<db::Repository> repository, db::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)), retry_(retry), now_(std::move(now)) {
}

bool PendingLedger::CreateOrRefreshIntent(const OrderMetadata& metadata) {
  db::model::PendingTransactionRecord row;
  try {
    ValidateMetadata(metadata);
    row.payment_id    = metadata.payment_id();
    row.owner_id      = metadata.owner_id();
    row.amount_minor  = AmountMinor(metadata);
    row.currency      = metadata.currency();
    row.metadata_json = EncodeMetadata(metadata);
  } catch (const util::InvalidArgument& e) {
    KEYSHOP_LOG_WARN("intent rejected",
                     {observability::StringField("payment_id", metadata.payment_id()), observability::StringField("error", e.what())});
    return false;
  }
  row.updated_at_ms = util::ToUnixMillis(now_());

  try {
    return db::RunWithRetry(retry_, "CreateOrRefreshIntent", [&] {
      auto tx     = repository_->Begin();
      auto result = repository_->UpsertPendingIntent(*tx, row);
      if (!result) {
        tx->Rollback();
        KEYSHOP_LOG_INFO("intent not refreshed",
                         {observability::StringField("payment_id", row.payment_id), observability::StringField("reason", result.message)});
        return false;
      }
      tx->Commit();
      return true;
    });
  } catch (const db::DatabaseError& e) {
    KEYSHOP_LOG_ERROR("intent write failed",
                      {observability::StringField("payment_id", row.payment_id), observability::StringField("error", e.what())});
    return false;
  }
}

std::optional<OrderMetadata> PendingLedger::PeekMetadata(const std::string& payment_id) {
  auto row = Find(payment_id);
  if (!row || row->status != db::model::IntentStatus::Pending) return std::nullopt;
  return MetadataOf(*row);
}

IntentStatus PendingLedger::GetStatus(const std::string& payment_id) {
  auto row = Find(payment_id);
  if (!row) return v1::INTENT_STATUS_NOT_FOUND;
  return row->status == db::model::IntentStatus::Paid ? v1::INTENT_STATUS_PAID : v1::INTENT_STATUS_PENDING;
}

std::optional<OrderMetadata> PendingLedger::MostRecentPendingFor(int64_t owner_id) {
  auto row = db::RunWithRetry(retry_, "MostRecentPendingFor", [&] {
    auto tx     = repository_->Begin();
    auto latest = repository_->LatestPendingForOwner(*tx, owner_id);
    tx->Commit();
    return latest;
  });
  if (!row) return std::nullopt;
  return MetadataOf(*row);
}

std::optional<db::model::PendingTransactionRecord> PendingLedger::Find(const std::string& payment_id) {
  if (payment_id.empty()) return std::nullopt;
  return db::RunWithRetry(retry_, "GetPendingTransaction", [&] {
    auto tx  = repository_->Begin();
    auto row = repository_->GetPendingTransaction(*tx, payment_id);
    tx->Commit();
    return row;
  });
}

} // namespace keyshop::ledger
