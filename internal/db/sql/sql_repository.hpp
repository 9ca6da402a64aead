#pragma once

#include "internal/db/api/repository.hpp"
#include "internal/db/sql/sql_transaction.hpp"

namespace keyshop::db::sql {

/*
  Repository over canonical SQL.

  Backends derive from it and only supply Begin(), returning their
  SqlTransaction. All row mapping and outcome translation lives here so
  SQLite and Postgres cannot drift apart.
*/
class SqlRepository : public db::Repository {
public:
  Result UpsertPendingIntent(Transaction&, const model::PendingTransactionRecord&) override;
  std::optional<model::PendingTransactionRecord> GetPendingTransaction(Transaction&, const std::string&) override;
  Result MarkPaid(Transaction&, const std::string&, int64_t) override;
  std::optional<model::PendingTransactionRecord> LatestPendingForOwner(Transaction&, int64_t) override;
  std::vector<model::PendingTransactionRecord> ListPaidWithoutClaim(Transaction&, int64_t) override;

  Result InsertProcessedPayment(Transaction&, const model::ProcessedPaymentRecord&) override;
  std::vector<model::ProcessedPaymentRecord> ListClaimsWithoutResult(Transaction&, int64_t) override;

  Result InsertCredential(Transaction&, model::CredentialRecord&) override;
  std::optional<model::CredentialRecord> GetCredential(Transaction&, int64_t) override;
  std::optional<model::CredentialRecord> GetCredentialByIdentity(Transaction&, const std::string&) override;
  std::vector<model::CredentialRecord> ListCredentialsForOwner(Transaction&, int64_t) override;
  std::vector<model::CredentialRecord> ListCredentials(Transaction&) override;
  Result UpdateCredential(Transaction&, const model::CredentialRecord&) override;
  Result SetCredentialMissingSince(Transaction&, int64_t, std::optional<int64_t>) override;
  Result DeleteCredential(Transaction&, int64_t) override;

  std::optional<model::AccountRecord> GetAccount(Transaction&, int64_t) override;
  Result UpsertAccount(Transaction&, const model::AccountRecord&) override;
  Result AdjustBalance(Transaction&, int64_t, int64_t) override;
  Result AdjustReferralBalance(Transaction&, int64_t, int64_t) override;

  Result InsertPaymentLog(Transaction&, model::PaymentLogRecord&) override;
  std::vector<model::PaymentLogRecord> ListPaymentLogForOwner(Transaction&, int64_t) override;

  std::optional<model::PromoCodeRecord> GetPromoCode(Transaction&, const std::string&) override;
  Result UpsertPromoCode(Transaction&, const model::PromoCodeRecord&) override;
  Result InsertPromoUsage(Transaction&, model::PromoUsageRecord&) override;
  int64_t CountPromoUsagesByOwner(Transaction&, const std::string&, int64_t) override;
  Result IncrementPromoUsage(Transaction&, const std::string&) override;
  Result SetPromoActive(Transaction&, const std::string&, bool) override;

  Result InsertCommission(Transaction&, const model::CommissionRecord&) override;
  std::vector<model::CommissionRecord> ListCommissions(Transaction&, const std::string&) override;

  Result InsertPendingGift(Transaction&, const model::PendingGiftRecord&) override;
  std::optional<model::PendingGiftRecord> GetPendingGift(Transaction&, const std::string&) override;
  Result DeletePendingGift(Transaction&, const std::string&) override;

  Result UpsertFulfillmentOutcome(Transaction&, const model::FulfillmentOutcomeRecord&) override;
  std::vector<model::FulfillmentOutcomeRecord> ListFulfillmentOutcomes(Transaction&, const std::string&) override;

protected:
  static SqlTransaction& TX(Transaction& t);
};

}
