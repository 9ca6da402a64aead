#include "sql_repository.hpp"

#include "internal/db/sql/sql_queries.hpp"

namespace keyshop::db::sql {

namespace {

model::PendingTransactionRecord ReadPending(const Row& row) {
  model::PendingTransactionRecord r;
  r.payment_id    = row.GetText(0);
  r.owner_id      = row.GetInt64(1);
  r.amount_minor  = row.GetInt64(2);
  r.currency      = row.GetText(3);
  r.metadata_json = row.GetText(4);
  r.status        = row.GetText(5) == "paid" ? model::IntentStatus::Paid : model::IntentStatus::Pending;
  r.created_at_ms = row.GetInt64(6);
  r.updated_at_ms = row.GetInt64(7);
  return r;
}

model::CredentialRecord ReadCredential(const Row& row) {
  model::CredentialRecord r;
  r.credential_id    = row.GetInt64(0);
  r.owner_id         = row.GetInt64(1);
  r.provider_host    = row.GetText(2);
  r.remote_uuid      = row.GetText(3);
  r.unique_identity  = row.GetText(4);
  r.expires_at_ms    = row.GetInt64(5);
  r.missing_since_ms = row.GetOptionalInt64(6);
  r.origin_json      = row.GetText(7);
  r.created_at_ms    = row.GetInt64(8);
  r.updated_at_ms    = row.GetInt64(9);
  return r;
}

template <typename T, typename Mapper>
std::optional<T> QueryOne(SqlTransaction& tx, const char* sql, const Params& params, Mapper map) {
  std::optional<T> out;
  tx.Query(sql, params, [&](const Row& row) {
    if (!out) out = map(row);
  });
  return out;
}

template <typename T, typename Mapper>
std::vector<T> QueryAll(SqlTransaction& tx, const char* sql, const Params& params, Mapper map) {
  std::vector<T> out;
  tx.Query(sql, params, [&](const Row& row) { out.push_back(map(row)); });
  return out;
}

} // namespace

SqlTransaction& SqlRepository::TX(Transaction& t) {
  return static_cast<SqlTransaction&>(t);
}

// ------------------------------------------------------------------
// Pending ledger
// ------------------------------------------------------------------

Result SqlRepository::UpsertPendingIntent(Transaction& t, const model::PendingTransactionRecord& r) {
  const auto rows = TX(t).Execute(UPSERT_PENDING_INTENT,
                                  {r.payment_id, r.owner_id, r.amount_minor, r.currency, r.metadata_json, r.updated_at_ms});
  if (rows == 0) return Result::Err(ErrorCode::Conflict, "payment intent already paid");
  return Result::Ok();
}

std::optional<model::PendingTransactionRecord> SqlRepository::GetPendingTransaction(Transaction& t, const std::string& payment_id) {
  return QueryOne<model::PendingTransactionRecord>(TX(t), SELECT_PENDING, {payment_id}, ReadPending);
}

Result SqlRepository::MarkPaid(Transaction& t, const std::string& payment_id, int64_t now_ms) {
  const auto rows = TX(t).Execute(MARK_PAID, {payment_id, now_ms});
  if (rows != 1) return Result::Err(ErrorCode::Conflict, "payment intent is not pending");
  return Result::Ok();
}

std::optional<model::PendingTransactionRecord> SqlRepository::LatestPendingForOwner(Transaction& t, int64_t owner_id) {
  return QueryOne<model::PendingTransactionRecord>(TX(t), SELECT_LATEST_PENDING_FOR_OWNER, {owner_id}, ReadPending);
}

std::vector<model::PendingTransactionRecord> SqlRepository::ListPaidWithoutClaim(Transaction& t, int64_t paid_before_ms) {
  return QueryAll<model::PendingTransactionRecord>(TX(t), SELECT_PAID_WITHOUT_CLAIM, {paid_before_ms}, ReadPending);
}

// ------------------------------------------------------------------
// Fulfillment guard
// ------------------------------------------------------------------

Result SqlRepository::InsertProcessedPayment(Transaction& t, const model::ProcessedPaymentRecord& r) {
  const auto rows = TX(t).Execute(INSERT_PROCESSED_PAYMENT, {r.payment_id, r.claimed_at_ms});
  if (rows == 0) return Result::Err(ErrorCode::AlreadyExists, "payment already claimed");
  return Result::Ok();
}

std::vector<model::ProcessedPaymentRecord> SqlRepository::ListClaimsWithoutResult(Transaction& t, int64_t claimed_before_ms) {
  return QueryAll<model::ProcessedPaymentRecord>(TX(t), SELECT_CLAIMS_WITHOUT_RESULT, {claimed_before_ms}, [](const Row& row) {
    model::ProcessedPaymentRecord r;
    r.payment_id    = row.GetText(0);
    r.claimed_at_ms = row.GetInt64(1);
    return r;
  });
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result SqlRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  auto id = QueryOne<int64_t>(TX(t), INSERT_CREDENTIAL,
                              {r.owner_id, r.provider_host, r.remote_uuid, r.unique_identity, r.expires_at_ms,
                               OptionalParam(r.missing_since_ms), r.origin_json, r.created_at_ms, r.updated_at_ms},
                              [](const Row& row) { return row.GetInt64(0); });
  if (!id) return Result::Err(ErrorCode::ConstraintViolation, "identity already in use: " + r.unique_identity);
  r.credential_id = *id;
  return Result::Ok();
}

std::optional<model::CredentialRecord> SqlRepository::GetCredential(Transaction& t, int64_t credential_id) {
  return QueryOne<model::CredentialRecord>(TX(t), SELECT_CREDENTIAL, {credential_id}, ReadCredential);
}

std::optional<model::CredentialRecord> SqlRepository::GetCredentialByIdentity(Transaction& t, const std::string& identity) {
  return QueryOne<model::CredentialRecord>(TX(t), SELECT_CREDENTIAL_BY_IDENTITY, {identity}, ReadCredential);
}

std::vector<model::CredentialRecord> SqlRepository::ListCredentialsForOwner(Transaction& t, int64_t owner_id) {
  return QueryAll<model::CredentialRecord>(TX(t), SELECT_CREDENTIALS_FOR_OWNER, {owner_id}, ReadCredential);
}

std::vector<model::CredentialRecord> SqlRepository::ListCredentials(Transaction& t) {
  return QueryAll<model::CredentialRecord>(TX(t), SELECT_ALL_CREDENTIALS, {}, ReadCredential);
}

Result SqlRepository::UpdateCredential(Transaction& t, const model::CredentialRecord& r) {
  int64_t rows = 0;
  try {
    rows = TX(t).Execute(UPDATE_CREDENTIAL, {r.credential_id, r.owner_id, r.provider_host, r.remote_uuid, r.unique_identity,
                                             r.expires_at_ms, r.origin_json, r.updated_at_ms});
  } catch (const DatabaseError& e) {
    if (e.code() != ErrorCode::ConstraintViolation) throw;
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (rows == 0) return Result::Err(ErrorCode::NotFound, "credential not found");
  return Result::Ok();
}

Result SqlRepository::SetCredentialMissingSince(Transaction& t, int64_t credential_id, std::optional<int64_t> missing_since_ms) {
  const auto rows = TX(t).Execute(SET_CREDENTIAL_MISSING_SINCE, {credential_id, OptionalParam(missing_since_ms)});
  if (rows == 0) return Result::Err(ErrorCode::NotFound, "credential not found");
  return Result::Ok();
}

Result SqlRepository::DeleteCredential(Transaction& t, int64_t credential_id) {
  const auto rows = TX(t).Execute(DELETE_CREDENTIAL, {credential_id});
  if (rows == 0) return Result::Err(ErrorCode::NotFound, "credential not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

std::optional<model::AccountRecord> SqlRepository::GetAccount(Transaction& t, int64_t owner_id) {
  return QueryOne<model::AccountRecord>(TX(t), SELECT_ACCOUNT, {owner_id}, [](const Row& row) {
    model::AccountRecord r;
    r.owner_id               = row.GetInt64(0);
    r.balance_minor          = row.GetInt64(1);
    r.referrer_id            = row.GetOptionalInt64(2);
    r.referral_balance_minor = row.GetInt64(3);
    r.referral_total_minor   = row.GetInt64(4);
    r.created_at_ms          = row.GetInt64(5);
    return r;
  });
}

Result SqlRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  TX(t).Execute(UPSERT_ACCOUNT, {r.owner_id, r.balance_minor, OptionalParam(r.referrer_id), r.referral_balance_minor,
                                 r.referral_total_minor, r.created_at_ms});
  return Result::Ok();
}

Result SqlRepository::AdjustBalance(Transaction& t, int64_t owner_id, int64_t delta_minor) {
  auto& tx = TX(t);
  if (delta_minor >= 0) {
    tx.Execute(ENSURE_ACCOUNT, {owner_id, int64_t{0}});
  }
  const auto rows = tx.Execute(ADJUST_BALANCE, {owner_id, delta_minor});
  if (rows == 0) return Result::Err(ErrorCode::Conflict, "insufficient balance");
  return Result::Ok();
}

Result SqlRepository::AdjustReferralBalance(Transaction& t, int64_t owner_id, int64_t delta_minor) {
  const auto rows = TX(t).Execute(ADJUST_REFERRAL_BALANCE, {owner_id, delta_minor});
  if (rows == 0) return Result::Err(ErrorCode::NotFound, "account not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payment log
// ------------------------------------------------------------------

Result SqlRepository::InsertPaymentLog(Transaction& t, model::PaymentLogRecord& r) {
  auto id = QueryOne<int64_t>(TX(t), INSERT_PAYMENT_LOG,
                              {r.owner_id, r.payment_id, r.payment_method, r.amount_minor, r.currency, r.action, r.status,
                               r.metadata_json, r.created_at_ms},
                              [](const Row& row) { return row.GetInt64(0); });
  if (!id) return Result::Err(ErrorCode::InternalError, "payment log insert returned no id");
  r.log_id = *id;
  return Result::Ok();
}

std::vector<model::PaymentLogRecord> SqlRepository::ListPaymentLogForOwner(Transaction& t, int64_t owner_id) {
  return QueryAll<model::PaymentLogRecord>(TX(t), SELECT_PAYMENT_LOG_FOR_OWNER, {owner_id}, [](const Row& row) {
    model::PaymentLogRecord r;
    r.log_id         = row.GetInt64(0);
    r.owner_id       = row.GetInt64(1);
    r.payment_id     = row.GetText(2);
    r.payment_method = row.GetText(3);
    r.amount_minor   = row.GetInt64(4);
    r.currency       = row.GetText(5);
    r.action         = row.GetText(6);
    r.status         = row.GetText(7);
    r.metadata_json  = row.GetText(8);
    r.created_at_ms  = row.GetInt64(9);
    return r;
  });
}

// ------------------------------------------------------------------
// Promo codes
// ------------------------------------------------------------------

std::optional<model::PromoCodeRecord> SqlRepository::GetPromoCode(Transaction& t, const std::string& code) {
  return QueryOne<model::PromoCodeRecord>(TX(t), SELECT_PROMO_CODE, {code}, [](const Row& row) {
    model::PromoCodeRecord r;
    r.code                  = row.GetText(0);
    r.discount_minor        = row.GetInt64(1);
    r.discount_percent      = row.GetDouble(2);
    r.usage_limit_total     = row.GetInt64(3);
    r.usage_limit_per_owner = row.GetInt64(4);
    r.used_total            = row.GetInt64(5);
    r.valid_until_ms        = row.GetOptionalInt64(6);
    r.is_active             = row.GetBool(7);
    return r;
  });
}

Result SqlRepository::UpsertPromoCode(Transaction& t, const model::PromoCodeRecord& r) {
  TX(t).Execute(UPSERT_PROMO_CODE, {r.code, r.discount_minor, r.discount_percent, r.usage_limit_total, r.usage_limit_per_owner,
                                    r.used_total, OptionalParam(r.valid_until_ms), int64_t{r.is_active ? 1 : 0}});
  return Result::Ok();
}

Result SqlRepository::InsertPromoUsage(Transaction& t, model::PromoUsageRecord& r) {
  auto id = QueryOne<int64_t>(TX(t), INSERT_PROMO_USAGE, {r.code, r.owner_id, r.applied_minor, r.order_id, r.used_at_ms},
                              [](const Row& row) { return row.GetInt64(0); });
  if (!id) return Result::Err(ErrorCode::AlreadyExists, "order already redeemed a promo code");
  r.usage_id = *id;
  return Result::Ok();
}

int64_t SqlRepository::CountPromoUsagesByOwner(Transaction& t, const std::string& code, int64_t owner_id) {
  auto count = QueryOne<int64_t>(TX(t), COUNT_PROMO_USAGES_BY_OWNER, {code, owner_id}, [](const Row& row) { return row.GetInt64(0); });
  return count.value_or(0);
}

Result SqlRepository::IncrementPromoUsage(Transaction& t, const std::string& code) {
  const auto rows = TX(t).Execute(INCREMENT_PROMO_USAGE, {code});
  if (rows == 0) return Result::Err(ErrorCode::NotFound, "promo code not found");
  return Result::Ok();
}

Result SqlRepository::SetPromoActive(Transaction& t, const std::string& code, bool active) {
  const auto rows = TX(t).Execute(SET_PROMO_ACTIVE, {code, int64_t{active ? 1 : 0}});
  if (rows == 0) return Result::Err(ErrorCode::NotFound, "promo code not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Partner commissions
// ------------------------------------------------------------------

Result SqlRepository::InsertCommission(Transaction& t, const model::CommissionRecord& r) {
  const auto rows = TX(t).Execute(INSERT_COMMISSION, {r.instance_id, r.payment_id, r.owner_id, r.amount_minor, r.percent,
                                                      r.commission_minor, r.payment_method, r.created_at_ms});
  if (rows == 0) return Result::Err(ErrorCode::AlreadyExists, "commission already accrued");
  return Result::Ok();
}

std::vector<model::CommissionRecord> SqlRepository::ListCommissions(Transaction& t, const std::string& instance_id) {
  return QueryAll<model::CommissionRecord>(TX(t), SELECT_COMMISSIONS, {instance_id}, [](const Row& row) {
    model::CommissionRecord r;
    r.instance_id      = row.GetText(0);
    r.payment_id       = row.GetText(1);
    r.owner_id         = row.GetInt64(2);
    r.amount_minor     = row.GetInt64(3);
    r.percent          = row.GetDouble(4);
    r.commission_minor = row.GetInt64(5);
    r.payment_method   = row.GetText(6);
    r.created_at_ms    = row.GetInt64(7);
    return r;
  });
}

// ------------------------------------------------------------------
// Pending gifts
// ------------------------------------------------------------------

Result SqlRepository::InsertPendingGift(Transaction& t, const model::PendingGiftRecord& r) {
  const auto rows = TX(t).Execute(INSERT_PENDING_GIFT, {r.payment_id, r.payer_id, r.metadata_json, r.created_at_ms});
  if (rows == 0) return Result::Err(ErrorCode::AlreadyExists, "pending gift already recorded");
  return Result::Ok();
}

std::optional<model::PendingGiftRecord> SqlRepository::GetPendingGift(Transaction& t, const std::string& payment_id) {
  return QueryOne<model::PendingGiftRecord>(TX(t), SELECT_PENDING_GIFT, {payment_id}, [](const Row& row) {
    model::PendingGiftRecord r;
    r.payment_id    = row.GetText(0);
    r.payer_id      = row.GetInt64(1);
    r.metadata_json = row.GetText(2);
    r.created_at_ms = row.GetInt64(3);
    return r;
  });
}

Result SqlRepository::DeletePendingGift(Transaction& t, const std::string& payment_id) {
  const auto rows = TX(t).Execute(DELETE_PENDING_GIFT, {payment_id});
  if (rows == 0) return Result::Err(ErrorCode::NotFound, "pending gift not found");
  return Result::Ok();
}

// ------------------------------------------------------------------
// Fulfillment outcomes
// ------------------------------------------------------------------

Result SqlRepository::UpsertFulfillmentOutcome(Transaction& t, const model::FulfillmentOutcomeRecord& r) {
  TX(t).Execute(UPSERT_FULFILLMENT_OUTCOME,
                {r.payment_id, r.step, int64_t{r.sequence}, r.status, r.detail, r.recorded_at_ms});
  return Result::Ok();
}

std::vector<model::FulfillmentOutcomeRecord> SqlRepository::ListFulfillmentOutcomes(Transaction& t, const std::string& payment_id) {
  return QueryAll<model::FulfillmentOutcomeRecord>(TX(t), SELECT_FULFILLMENT_OUTCOMES, {payment_id}, [](const Row& row) {
    model::FulfillmentOutcomeRecord r;
    r.payment_id     = row.GetText(0);
    r.step           = row.GetText(1);
    r.sequence       = static_cast<int32_t>(row.GetInt64(2));
    r.status         = row.GetText(3);
    r.detail         = row.GetText(4);
    r.recorded_at_ms = row.GetInt64(5);
    return r;
  });
}

} // namespace keyshop::db::sql
