#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace keyshop::db::memory {

class MemoryTransaction;

/*
  In-process backend. Used when no database is configured and by tests.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

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

private:
  friend class MemoryTransaction;

  using PairKey = std::pair<std::string, std::string>;

  struct State {
    std::unordered_map<std::string, model::PendingTransactionRecord> pending;
    std::unordered_map<std::string, model::ProcessedPaymentRecord> processed;

    std::map<int64_t, model::CredentialRecord> credentials;
    int64_t next_credential_id = 1;

    std::unordered_map<int64_t, model::AccountRecord> accounts;

    std::vector<model::PaymentLogRecord> payment_log;
    int64_t next_log_id = 1;

    std::unordered_map<std::string, model::PromoCodeRecord> promo_codes;
    std::vector<model::PromoUsageRecord> promo_usages;
    int64_t next_usage_id = 1;

    std::map<PairKey, model::CommissionRecord> commissions;
    std::unordered_map<std::string, model::PendingGiftRecord> pending_gifts;
    std::map<std::pair<std::string, int32_t>, model::FulfillmentOutcomeRecord> outcomes;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
