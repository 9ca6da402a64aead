#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/fulfillment/fulfillment_guard.hpp"
#include "internal/fulfillment/settings.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/provisioning/provisioning_client.hpp"
#include "internal/util/time.hpp"
#include "keyshop/ledger/v1.hpp"

namespace keyshop::fulfillment {

/*
  Runs the side effects of one paid order.

  The whole sequence is gated by a single FulfillmentGuard claim:

    1. claim (duplicate -> no-op)
    2. primary action: top-up credit, or provision/extend/gift a credential
    3. referral reward
    4. promo code redemption
    5. partner commission
    6. notifications

  A provisioning failure stops after step 2 with a refund (balance
  payments) or a refund promise (real money), and nothing else that moves
  money runs. Steps 3-6 are best-effort; each one is recorded with its own
  outcome and the aggregate is persisted as the fulfillment report.

  No transaction is held across a provisioning or notification call.
*/
class FulfillmentOrchestrator {
 public:
  FulfillmentOrchestrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<FulfillmentGuard> guard,
                          std::shared_ptr<provisioning::ProvisioningClient> provisioning, std::shared_ptr<notify::NotificationSink> notifications,
                          std::shared_ptr<SettingsProvider> settings, db::RetryPolicy retry = {}, util::NowFn now = util::SystemNow());

  // Validates, claims and executes. A repeated payment id returns a
  // DUPLICATE report and touches nothing.
  keyshop::ledger::v1::FulfillmentReport Run(const keyshop::ledger::v1::OrderMetadata& metadata);

  // Executes an order whose claim the caller already holds.
  keyshop::ledger::v1::FulfillmentReport ExecuteClaimed(const keyshop::ledger::v1::OrderMetadata& metadata);

  // Provisions a gift that was paid for without a recipient.
  // Throws util::NotFound when no such gift is waiting.
  keyshop::ledger::v1::FulfillmentReport CompleteGift(const std::string& payment_id, const std::string& recipient_handle, int64_t recipient_owner_id);

  // Persisted report. Throws util::NotFound when nothing was recorded.
  keyshop::ledger::v1::FulfillmentReport GetReport(const std::string& payment_id);

  // Insert-if-absent keyed by (instance_id, payment_id). Returns false when
  // the commission was already accrued.
  bool AccrueCommission(const std::string& instance_id, const std::string& payment_id, int64_t owner_id, int64_t amount_minor, double percent,
                        const std::string& payment_method);

 private:
  struct Execution;

  void TopUp(Execution& run);
  void ProvisionNew(Execution& run);
  void Extend(Execution& run);
  void Gift(Execution& run);
  void ProvisionGift(Execution& run, const std::string& recipient_handle, int64_t recipient_owner_id);

  // Writes the credential row and payment log after a successful provision.
  void StoreCredential(Execution& run, const provisioning::ProvisionedCredential& credential, const std::string& host, const std::string& identity,
                       int64_t owner_id, const std::string& kind, int64_t existing_id);

  void FailProvisioning(Execution& run, const std::string& code, const std::string& detail);

  void PayReferral(Execution& run);
  void RedeemPromo(Execution& run);
  void Commission(Execution& run);
  void NotifySuccess(Execution& run);
  void DeletePendingMessage(Execution& run);

  void Persist(Execution& run);

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<FulfillmentGuard>                 guard_;
  std::shared_ptr<provisioning::ProvisioningClient> provisioning_;
  std::shared_ptr<notify::NotificationSink>         notifications_;
  std::shared_ptr<SettingsProvider>                 settings_;
  db::RetryPolicy                                   retry_;
  util::NowFn                                       now_;
};

// Day count of a plan; an explicit day count wins over months.
int64_t ResolveDays(const keyshop::ledger::v1::PlanSelection& plan, uint32_t days_per_month);

// "u42-a1b2c3d4@keyshop.local"
std::string DeriveIdentity(int64_t owner_id, const std::string& payment_id, const std::string& domain);

// "@Alice" -> "alice-gift-a1b2c3d4@keyshop.local"
std::string DeriveGiftIdentity(const std::string& recipient_handle, const std::string& payment_id, const std::string& domain);

} // namespace keyshop::fulfillment
