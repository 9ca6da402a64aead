#include "memory_repository.hpp"

#include <algorithm>
#include <limits>

#include "memory_tx.hpp"

namespace keyshop::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Pending ledger
// ------------------------------------------------------------------

Result MemoryRepository::UpsertPendingIntent(Transaction& t, const model::PendingTransactionRecord& r) {
  const auto& view = TX(t).View();
  auto        it   = view.pending.find(r.payment_id);
  if (it == view.pending.end()) {
    auto row          = r;
    row.status        = model::IntentStatus::Pending;
    row.created_at_ms = r.updated_at_ms;
    TX(t).Mutable().pending.emplace(r.payment_id, std::move(row));
    return Result::Ok();
  }
  if (it->second.status != model::IntentStatus::Pending) {
    return Result::Err(ErrorCode::Conflict, "payment intent already paid");
  }

  auto& row         = TX(t).Mutable().pending[r.payment_id];
  row.amount_minor  = r.amount_minor;
  row.currency      = r.currency;
  row.metadata_json = r.metadata_json;
  row.updated_at_ms = r.updated_at_ms;
  return Result::Ok();
}

std::optional<model::PendingTransactionRecord> MemoryRepository::GetPendingTransaction(Transaction& t, const std::string& payment_id) {
  const auto& s  = TX(t).View();
  auto        it = s.pending.find(payment_id);
  if (it == s.pending.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::MarkPaid(Transaction& t, const std::string& payment_id, int64_t now_ms) {
  const auto& view = TX(t).View();
  auto        it   = view.pending.find(payment_id);
  if (it == view.pending.end() || it->second.status != model::IntentStatus::Pending) {
    return Result::Err(ErrorCode::Conflict, "payment intent is not pending");
  }
  auto& row         = TX(t).Mutable().pending[payment_id];
  row.status        = model::IntentStatus::Paid;
  row.updated_at_ms = now_ms;
  return Result::Ok();
}

std::optional<model::PendingTransactionRecord> MemoryRepository::LatestPendingForOwner(Transaction& t, int64_t owner_id) {
  const model::PendingTransactionRecord* best = nullptr;
  for (const auto& [_, row] : TX(t).View().pending) {
    if (row.owner_id != owner_id || row.status != model::IntentStatus::Pending) continue;
    if (!best || row.updated_at_ms > best->updated_at_ms ||
        (row.updated_at_ms == best->updated_at_ms && row.created_at_ms > best->created_at_ms)) {
      best = &row;
    }
  }
  if (!best) return std::nullopt;
  return *best;
}

std::vector<model::PendingTransactionRecord> MemoryRepository::ListPaidWithoutClaim(Transaction& t, int64_t paid_before_ms) {
  const auto&                                  s = TX(t).View();
  std::vector<model::PendingTransactionRecord> out;
  for (const auto& [id, row] : s.pending) {
    if (row.status != model::IntentStatus::Paid || row.updated_at_ms >= paid_before_ms) continue;
    if (s.processed.contains(id)) continue;
    out.push_back(row);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.updated_at_ms < b.updated_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Fulfillment guard
// ------------------------------------------------------------------

Result MemoryRepository::InsertProcessedPayment(Transaction& t, const model::ProcessedPaymentRecord& r) {
  if (TX(t).View().processed.contains(r.payment_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "payment already claimed");
  }
  TX(t).Mutable().processed.emplace(r.payment_id, r);
  return Result::Ok();
}

std::vector<model::ProcessedPaymentRecord> MemoryRepository::ListClaimsWithoutResult(Transaction& t, int64_t claimed_before_ms) {
  const auto&                                s = TX(t).View();
  std::vector<model::ProcessedPaymentRecord> out;
  for (const auto& [id, claim] : s.processed) {
    if (claim.claimed_at_ms >= claimed_before_ms) continue;
    bool has_result = false;
    for (auto it = s.outcomes.lower_bound({id, std::numeric_limits<int32_t>::min()}); it != s.outcomes.end() && it->first.first == id; ++it) {
      if (it->second.step == "result") {
        has_result = true;
        break;
      }
    }
    if (!has_result) out.push_back(claim);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.claimed_at_ms < b.claimed_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Credentials
// ------------------------------------------------------------------

Result MemoryRepository::InsertCredential(Transaction& t, model::CredentialRecord& r) {
  for (const auto& [_, existing] : TX(t).View().credentials) {
    if (existing.unique_identity == r.unique_identity) {
      return Result::Err(ErrorCode::ConstraintViolation, "identity already in use: " + r.unique_identity);
    }
  }
  auto& s         = TX(t).Mutable();
  r.credential_id = s.next_credential_id++;
  s.credentials.emplace(r.credential_id, r);
  return Result::Ok();
}

std::optional<model::CredentialRecord> MemoryRepository::GetCredential(Transaction& t, int64_t credential_id) {
  const auto& s  = TX(t).View();
  auto        it = s.credentials.find(credential_id);
  if (it == s.credentials.end()) return std::nullopt;
  return it->second;
}

std::optional<model::CredentialRecord> MemoryRepository::GetCredentialByIdentity(Transaction& t, const std::string& identity) {
  for (const auto& [_, c] : TX(t).View().credentials) {
    if (c.unique_identity == identity) return c;
  }
  return std::nullopt;
}

std::vector<model::CredentialRecord> MemoryRepository::ListCredentialsForOwner(Transaction& t, int64_t owner_id) {
  std::vector<model::CredentialRecord> out;
  for (const auto& [_, c] : TX(t).View().credentials) {
    if (c.owner_id == owner_id) out.push_back(c);
  }
  return out;
}

std::vector<model::CredentialRecord> MemoryRepository::ListCredentials(Transaction& t) {
  std::vector<model::CredentialRecord> out;
  for (const auto& [_, c] : TX(t).View().credentials) {
    out.push_back(c);
  }
  return out;
}

Result MemoryRepository::UpdateCredential(Transaction& t, const model::CredentialRecord& r) {
  const auto& view = TX(t).View();
  if (!view.credentials.contains(r.credential_id)) return Result::Err(ErrorCode::NotFound, "credential not found");
  for (const auto& [id, c] : view.credentials) {
    if (id != r.credential_id && c.unique_identity == r.unique_identity) {
      return Result::Err(ErrorCode::ConstraintViolation, "identity already in use: " + r.unique_identity);
    }
  }

  auto& row           = TX(t).Mutable().credentials[r.credential_id];
  row.owner_id        = r.owner_id;
  row.provider_host   = r.provider_host;
  row.remote_uuid     = r.remote_uuid;
  row.unique_identity = r.unique_identity;
  row.expires_at_ms   = r.expires_at_ms;
  row.origin_json     = r.origin_json;
  row.updated_at_ms   = r.updated_at_ms;
  return Result::Ok();
}

Result MemoryRepository::SetCredentialMissingSince(Transaction& t, int64_t credential_id, std::optional<int64_t> missing_since_ms) {
  if (!TX(t).View().credentials.contains(credential_id)) return Result::Err(ErrorCode::NotFound, "credential not found");
  TX(t).Mutable().credentials[credential_id].missing_since_ms = missing_since_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteCredential(Transaction& t, int64_t credential_id) {
  if (!TX(t).View().credentials.contains(credential_id)) return Result::Err(ErrorCode::NotFound, "credential not found");
  TX(t).Mutable().credentials.erase(credential_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, int64_t owner_id) {
  const auto& s  = TX(t).View();
  auto        it = s.accounts.find(owner_id);
  if (it == s.accounts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto& accounts = TX(t).Mutable().accounts;
  auto  it       = accounts.find(r.owner_id);
  if (it == accounts.end()) {
    accounts.emplace(r.owner_id, r);
    return Result::Ok();
  }
  const auto created_at = it->second.created_at_ms;
  it->second            = r;
  it->second.created_at_ms = created_at;
  return Result::Ok();
}

Result MemoryRepository::AdjustBalance(Transaction& t, int64_t owner_id, int64_t delta_minor) {
  const auto& view = TX(t).View();
  auto        it   = view.accounts.find(owner_id);
  if (it == view.accounts.end()) {
    if (delta_minor < 0) return Result::Err(ErrorCode::Conflict, "insufficient balance");
    model::AccountRecord account;
    account.owner_id      = owner_id;
    account.balance_minor = delta_minor;
    TX(t).Mutable().accounts.emplace(owner_id, account);
    return Result::Ok();
  }
  if (it->second.balance_minor + delta_minor < 0) return Result::Err(ErrorCode::Conflict, "insufficient balance");
  TX(t).Mutable().accounts[owner_id].balance_minor += delta_minor;
  return Result::Ok();
}

Result MemoryRepository::AdjustReferralBalance(Transaction& t, int64_t owner_id, int64_t delta_minor) {
  if (!TX(t).View().accounts.contains(owner_id)) return Result::Err(ErrorCode::NotFound, "account not found");
  auto& account = TX(t).Mutable().accounts[owner_id];
  account.referral_balance_minor += delta_minor;
  account.referral_total_minor += delta_minor;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Payment log
// ------------------------------------------------------------------

Result MemoryRepository::InsertPaymentLog(Transaction& t, model::PaymentLogRecord& r) {
  auto& s  = TX(t).Mutable();
  r.log_id = s.next_log_id++;
  s.payment_log.push_back(r);
  return Result::Ok();
}

std::vector<model::PaymentLogRecord> MemoryRepository::ListPaymentLogForOwner(Transaction& t, int64_t owner_id) {
  std::vector<model::PaymentLogRecord> out;
  for (const auto& entry : TX(t).View().payment_log) {
    if (entry.owner_id == owner_id) out.push_back(entry);
  }
  return out;
}

// ------------------------------------------------------------------
// Promo codes
// ------------------------------------------------------------------

std::optional<model::PromoCodeRecord> MemoryRepository::GetPromoCode(Transaction& t, const std::string& code) {
  const auto& s  = TX(t).View();
  auto        it = s.promo_codes.find(code);
  if (it == s.promo_codes.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertPromoCode(Transaction& t, const model::PromoCodeRecord& r) {
  TX(t).Mutable().promo_codes[r.code] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertPromoUsage(Transaction& t, model::PromoUsageRecord& r) {
  for (const auto& usage : TX(t).View().promo_usages) {
    if (usage.order_id == r.order_id) return Result::Err(ErrorCode::AlreadyExists, "order already redeemed a promo code");
  }
  auto& s    = TX(t).Mutable();
  r.usage_id = s.next_usage_id++;
  s.promo_usages.push_back(r);
  return Result::Ok();
}

int64_t MemoryRepository::CountPromoUsagesByOwner(Transaction& t, const std::string& code, int64_t owner_id) {
  const auto& usages = TX(t).View().promo_usages;
  return std::count_if(usages.begin(), usages.end(),
                       [&](const auto& u) { return u.code == code && u.owner_id == owner_id; });
}

Result MemoryRepository::IncrementPromoUsage(Transaction& t, const std::string& code) {
  if (!TX(t).View().promo_codes.contains(code)) return Result::Err(ErrorCode::NotFound, "promo code not found");
  TX(t).Mutable().promo_codes[code].used_total++;
  return Result::Ok();
}

Result MemoryRepository::SetPromoActive(Transaction& t, const std::string& code, bool active) {
  if (!TX(t).View().promo_codes.contains(code)) return Result::Err(ErrorCode::NotFound, "promo code not found");
  TX(t).Mutable().promo_codes[code].is_active = active;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Partner commissions
// ------------------------------------------------------------------

Result MemoryRepository::InsertCommission(Transaction& t, const model::CommissionRecord& r) {
  PairKey key{r.instance_id, r.payment_id};
  if (TX(t).View().commissions.contains(key)) return Result::Err(ErrorCode::AlreadyExists, "commission already accrued");
  TX(t).Mutable().commissions.emplace(std::move(key), r);
  return Result::Ok();
}

std::vector<model::CommissionRecord> MemoryRepository::ListCommissions(Transaction& t, const std::string& instance_id) {
  std::vector<model::CommissionRecord> out;
  for (const auto& [key, c] : TX(t).View().commissions) {
    if (key.first == instance_id) out.push_back(c);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.created_at_ms < b.created_at_ms; });
  return out;
}

// ------------------------------------------------------------------
// Pending gifts
// ------------------------------------------------------------------

Result MemoryRepository::InsertPendingGift(Transaction& t, const model::PendingGiftRecord& r) {
  if (TX(t).View().pending_gifts.contains(r.payment_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "pending gift already recorded");
  }
  TX(t).Mutable().pending_gifts.emplace(r.payment_id, r);
  return Result::Ok();
}

std::optional<model::PendingGiftRecord> MemoryRepository::GetPendingGift(Transaction& t, const std::string& payment_id) {
  const auto& s  = TX(t).View();
  auto        it = s.pending_gifts.find(payment_id);
  if (it == s.pending_gifts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeletePendingGift(Transaction& t, const std::string& payment_id) {
  if (!TX(t).View().pending_gifts.contains(payment_id)) return Result::Err(ErrorCode::NotFound, "pending gift not found");
  TX(t).Mutable().pending_gifts.erase(payment_id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Fulfillment outcomes
// ------------------------------------------------------------------

Result MemoryRepository::UpsertFulfillmentOutcome(Transaction& t, const model::FulfillmentOutcomeRecord& r) {
  TX(t).Mutable().outcomes[{r.payment_id, r.sequence}] = r;
  return Result::Ok();
}

std::vector<model::FulfillmentOutcomeRecord> MemoryRepository::ListFulfillmentOutcomes(Transaction& t, const std::string& payment_id) {
  const auto&                                  outcomes = TX(t).View().outcomes;
  std::vector<model::FulfillmentOutcomeRecord> out;
  for (auto it = outcomes.lower_bound({payment_id, std::numeric_limits<int32_t>::min()}); it != outcomes.end() && it->first.first == payment_id;
       ++it) {
    out.push_back(it->second);
  }
  return out;
}

} // namespace keyshop::db::memory
