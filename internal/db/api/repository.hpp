#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/commission_record.hpp"
#include "internal/db/model/credential_record.hpp"
#include "internal/db/model/fulfillment_outcome_record.hpp"
#include "internal/db/model/payment_log_record.hpp"
#include "internal/db/model/pending_gift_record.hpp"
#include "internal/db/model/pending_transaction_record.hpp"
#include "internal/db/model/processed_payment_record.hpp"
#include "internal/db/model/promo_records.hpp"

namespace keyshop::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Expected business outcomes (row already paid, id already claimed,
    insufficient funds) come back as a non-OK Result
  - Storage faults are thrown as DatabaseError

  The DB is the source of truth for:
    payment intents
    fulfillment claims
    credentials
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Pending ledger
  // ---------------------------------------------------------------------

  // Inserts, or refreshes amount/currency/metadata/updated_at of a row that
  // is still pending. Conflict when the row is already paid.
  virtual Result UpsertPendingIntent(Transaction&, const model::PendingTransactionRecord&) = 0;

  virtual std::optional<model::PendingTransactionRecord> GetPendingTransaction(Transaction&, const std::string& payment_id) = 0;

  // pending -> paid. Conflict when zero rows matched status='pending'.
  virtual Result MarkPaid(Transaction&, const std::string& payment_id, int64_t now_ms) = 0;

  // Latest pending row by updated_at, then created_at.
  virtual std::optional<model::PendingTransactionRecord> LatestPendingForOwner(Transaction&, int64_t owner_id) = 0;

  // Rows paid before the cutoff that have no processed_payments claim,
  // oldest first.
  virtual std::vector<model::PendingTransactionRecord> ListPaidWithoutClaim(Transaction&, int64_t paid_before_ms) = 0;

  // ---------------------------------------------------------------------
  // Fulfillment guard
  // ---------------------------------------------------------------------

  // AlreadyExists when the id was claimed before.
  virtual Result InsertProcessedPayment(Transaction&, const model::ProcessedPaymentRecord&) = 0;

  // Claims older than the cutoff that have no terminal "result" outcome.
  virtual std::vector<model::ProcessedPaymentRecord> ListClaimsWithoutResult(Transaction&, int64_t claimed_before_ms) = 0;

  // ---------------------------------------------------------------------
  // Credentials
  // ---------------------------------------------------------------------

  // Assigns credential_id. ConstraintViolation on a duplicate identity.
  virtual Result InsertCredential(Transaction&, model::CredentialRecord&) = 0;

  virtual std::optional<model::CredentialRecord> GetCredential(Transaction&, int64_t credential_id) = 0;

  virtual std::optional<model::CredentialRecord> GetCredentialByIdentity(Transaction&, const std::string& identity) = 0;

  virtual std::vector<model::CredentialRecord> ListCredentialsForOwner(Transaction&, int64_t owner_id) = 0;

  virtual std::vector<model::CredentialRecord> ListCredentials(Transaction&) = 0;

  // Rewrites everything except missing_since_ms and created_at_ms.
  virtual Result UpdateCredential(Transaction&, const model::CredentialRecord&) = 0;

  virtual Result SetCredentialMissingSince(Transaction&, int64_t credential_id, std::optional<int64_t> missing_since_ms) = 0;

  virtual Result DeleteCredential(Transaction&, int64_t credential_id) = 0;

  // ---------------------------------------------------------------------
  // Accounts
  // ---------------------------------------------------------------------

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, int64_t owner_id) = 0;

  virtual Result UpsertAccount(Transaction&, const model::AccountRecord&) = 0;

  // Credits create the account on demand. Conflict when a debit would take
  // the balance below zero (or the account does not exist).
  virtual Result AdjustBalance(Transaction&, int64_t owner_id, int64_t delta_minor) = 0;

  // Adds to referral balance and lifetime referral total. NotFound without an account.
  virtual Result AdjustReferralBalance(Transaction&, int64_t owner_id, int64_t delta_minor) = 0;

  // ---------------------------------------------------------------------
  // Payment log
  // ---------------------------------------------------------------------

  virtual Result InsertPaymentLog(Transaction&, model::PaymentLogRecord&) = 0;

  virtual std::vector<model::PaymentLogRecord> ListPaymentLogForOwner(Transaction&, int64_t owner_id) = 0;

  // ---------------------------------------------------------------------
  // Promo codes
  // ---------------------------------------------------------------------

  virtual std::optional<model::PromoCodeRecord> GetPromoCode(Transaction&, const std::string& code) = 0;

  virtual Result UpsertPromoCode(Transaction&, const model::PromoCodeRecord&) = 0;

  // AlreadyExists when the order already redeemed a code.
  virtual Result InsertPromoUsage(Transaction&, model::PromoUsageRecord&) = 0;

  virtual int64_t CountPromoUsagesByOwner(Transaction&, const std::string& code, int64_t owner_id) = 0;

  virtual Result IncrementPromoUsage(Transaction&, const std::string& code) = 0;

  virtual Result SetPromoActive(Transaction&, const std::string& code, bool active) = 0;

  // ---------------------------------------------------------------------
  // Partner commissions
  // ---------------------------------------------------------------------

  // AlreadyExists for a repeated (instance_id, payment_id).
  virtual Result InsertCommission(Transaction&, const model::CommissionRecord&) = 0;

  virtual std::vector<model::CommissionRecord> ListCommissions(Transaction&, const std::string& instance_id) = 0;

  // ---------------------------------------------------------------------
  // Pending gifts
  // ---------------------------------------------------------------------

  virtual Result InsertPendingGift(Transaction&, const model::PendingGiftRecord&) = 0;

  virtual std::optional<model::PendingGiftRecord> GetPendingGift(Transaction&, const std::string& payment_id) = 0;

  virtual Result DeletePendingGift(Transaction&, const std::string& payment_id) = 0;

  // ---------------------------------------------------------------------
  // Fulfillment outcomes
  // ---------------------------------------------------------------------

  // Keyed by (payment_id, sequence), so a step that ran twice keeps both
  // rows. Writing the same sequence again replaces that row.
  virtual Result UpsertFulfillmentOutcome(Transaction&, const model::FulfillmentOutcomeRecord&) = 0;

  virtual std::vector<model::FulfillmentOutcomeRecord> ListFulfillmentOutcomes(Transaction&, const std::string& payment_id) = 0;
};

} // namespace keyshop::db
