#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/ledger/completion_coordinator.hpp"
#include "internal/ledger/pending_ledger.hpp"
#include "internal/reconcile/reconciler.hpp"
#include "test_support.hpp"

namespace {

using keyshop::db::memory::MemoryRepository;
using keyshop::db::model::CredentialRecord;
using keyshop::provisioning::Presence;
using keyshop::reconcile::Reconciler;
using keyshop::reconcile::ReconcilerOptions;
using keyshop::reconcile::StalledPayment;
using namespace keyshop::testing;

namespace v1 = keyshop::ledger::v1;

int64_t InsertCredential(MemoryRepository& repo, int64_t owner_id, const std::string& identity, int64_t now_ms) {
  auto             tx = repo.Begin();
  CredentialRecord record;
  record.owner_id        = owner_id;
  record.provider_host   = "de-1";
  record.remote_uuid     = "uuid-" + identity;
  record.unique_identity = identity;
  record.expires_at_ms   = now_ms + 30 * kDayMs;
  record.created_at_ms   = now_ms;
  record.updated_at_ms   = now_ms;
  assert(repo.InsertCredential(*tx, record));
  tx->Commit();
  return record.credential_id;
}

std::optional<CredentialRecord> Load(MemoryRepository& repo, int64_t credential_id) {
  auto tx  = repo.Begin();
  auto row = repo.GetCredential(*tx, credential_id);
  tx->Commit();
  return row;
}

std::shared_ptr<Reconciler> MakeReconciler(FulfillmentHarness& h, std::shared_ptr<keyshop::provisioning::ProvisioningClient> panel = nullptr) {
  ReconcilerOptions options;
  options.grace_window        = std::chrono::hours(24);
  options.max_concurrency     = 4;
  options.stalled_claim_after = std::chrono::minutes(15);
  return std::make_shared<Reconciler>(h.repository, panel ? panel : h.provisioning, h.notifications, options, FastRetry(), h.clock.Fn());
}

// Stands in for an extension that lands between the two existence checks.
class RacingPanel final : public keyshop::provisioning::ProvisioningClient {
 public:
  explicit RacingPanel(std::function<void()> on_confirm) : on_confirm_(std::move(on_confirm)) {
  }

  keyshop::provisioning::ProvisionResult CreateOrExtend(const keyshop::provisioning::ProvisionRequest&) override {
    return {};
  }

  Presence Exists(const std::string&, const std::string&, const std::string&) override {
    if (++calls_ == 2) on_confirm_();
    return Presence::Absent;
  }

  bool Delete(const std::string&, const std::string&) override {
    return true;
  }

 private:
  std::function<void()> on_confirm_;
  int                   calls_ = 0;
};

void TestReappearanceWithinGraceClearsMark() {
  FulfillmentHarness h;
  auto               reconciler = MakeReconciler(h);
  const int64_t      t0         = h.clock.Ms();
  const int64_t      id         = InsertCredential(*h.repository, 42, "c1@keyshop.local", t0);

  h.provisioning->SetPresence("c1@keyshop.local", Presence::Absent);
  auto first = reconciler->ReconcileOwner(42);
  assert(first.checked() == 1);
  assert(first.marked_missing() == 1);
  assert(Load(*h.repository, id)->missing_since_ms == t0);

  h.clock.Advance(std::chrono::hours(1));
  h.provisioning->SetPresence("c1@keyshop.local", Presence::Present);
  auto second = reconciler->ReconcileOwner(42);
  assert(second.cleared() == 1);
  assert(second.present() == 1);

  auto row = Load(*h.repository, id);
  assert(row.has_value());
  assert(!row->missing_since_ms.has_value());
}

void TestContinuousAbsenceDeletesAfterGrace() {
  FulfillmentHarness h;
  auto               reconciler = MakeReconciler(h);
  const int64_t      t0         = h.clock.Ms();
  const int64_t      id         = InsertCredential(*h.repository, 42, "c1@keyshop.local", t0);
  h.provisioning->SetPresence("c1@keyshop.local", Presence::Absent);

  assert(reconciler->ReconcileOwner(42).marked_missing() == 1);

  h.clock.Advance(std::chrono::hours(23));
  auto within = reconciler->ReconcileOwner(42);
  assert(within.deleted() == 0);
  assert(within.marked_missing() == 0);
  assert(Load(*h.repository, id)->missing_since_ms == t0);

  h.clock.Advance(std::chrono::hours(1));
  assert(reconciler->ReconcileOwner(42).deleted() == 0);

  h.clock.Advance(std::chrono::hours(1));
  auto past = reconciler->ReconcileAll();
  assert(past.deleted() == 1);
  assert(!Load(*h.repository, id).has_value());
  assert(h.notifications->Operators().back().find("removed 1") != std::string::npos);
}

void TestUnknownNeverAdvancesTowardDeletion() {
  FulfillmentHarness h;
  auto               reconciler = MakeReconciler(h);
  const int64_t      t0         = h.clock.Ms();
  const int64_t      fresh      = InsertCredential(*h.repository, 42, "fresh@keyshop.local", t0);
  const int64_t      marked     = InsertCredential(*h.repository, 42, "marked@keyshop.local", t0);

  h.provisioning->SetPresence("marked@keyshop.local", Presence::Absent);
  assert(reconciler->ReconcileOwner(42).marked_missing() == 1);

  h.provisioning->SetPresence("fresh@keyshop.local", Presence::Unknown);
  h.provisioning->SetPresence("marked@keyshop.local", Presence::Unknown);
  h.clock.Advance(std::chrono::hours(72));

  auto report = reconciler->ReconcileOwner(42);
  assert(report.unknown() == 2);
  assert(report.deleted() == 0);
  assert(!Load(*h.repository, fresh)->missing_since_ms.has_value());
  assert(Load(*h.repository, marked)->missing_since_ms == t0);
}

void TestDeleteNeedsSecondAbsentAnswer() {
  FulfillmentHarness h;
  auto               reconciler = MakeReconciler(h);
  const int64_t      t0         = h.clock.Ms();
  const int64_t      flicker    = InsertCredential(*h.repository, 42, "flicker@keyshop.local", t0);
  const int64_t      vague      = InsertCredential(*h.repository, 42, "vague@keyshop.local", t0);

  h.provisioning->SetPresence("flicker@keyshop.local", Presence::Absent);
  h.provisioning->SetPresence("vague@keyshop.local", Presence::Absent);
  assert(reconciler->ReconcileOwner(42).marked_missing() == 2);

  h.clock.Advance(std::chrono::hours(25));
  h.provisioning->ScriptPresence("flicker@keyshop.local", {Presence::Absent, Presence::Present});
  h.provisioning->ScriptPresence("vague@keyshop.local", {Presence::Absent, Presence::Unknown});

  auto report = reconciler->ReconcileOwner(42);
  assert(report.deleted() == 0);
  assert(report.cleared() == 1);
  assert(report.unknown() == 1);
  assert(!Load(*h.repository, flicker)->missing_since_ms.has_value());
  assert(Load(*h.repository, vague)->missing_since_ms == t0);
}

void TestConcurrentExtensionPreventsDelete() {
  FulfillmentHarness h;
  const int64_t      t0 = h.clock.Ms();
  const int64_t      id = InsertCredential(*h.repository, 42, "busy@keyshop.local", t0);

  h.provisioning->SetPresence("busy@keyshop.local", Presence::Absent);
  assert(MakeReconciler(h)->ReconcileOwner(42).marked_missing() == 1);
  h.clock.Advance(std::chrono::hours(25));

  auto panel = std::make_shared<RacingPanel>([&] {
    auto tx  = h.repository->Begin();
    auto row = h.repository->GetCredential(*tx, id);
    row->expires_at_ms += 30 * kDayMs;
    row->updated_at_ms = h.clock.Ms();
    assert(h.repository->UpdateCredential(*tx, *row));
    assert(h.repository->SetCredentialMissingSince(*tx, id, std::nullopt));
    tx->Commit();
  });

  auto report = MakeReconciler(h, panel)->ReconcileOwner(42);
  assert(report.deleted() == 0);
  assert(Load(*h.repository, id).has_value());
}

void TestSweepFansOutOverAllCredentials() {
  FulfillmentHarness h;
  auto               reconciler = MakeReconciler(h);
  for (int i = 0; i < 20; ++i) {
    const auto identity = "k" + std::to_string(i) + "@keyshop.local";
    InsertCredential(*h.repository, 100 + i % 3, identity, h.clock.Ms());
    if (i % 2 == 0) h.provisioning->SetPresence(identity, Presence::Absent);
  }

  auto report = reconciler->ReconcileAll();
  assert(report.checked() == 20);
  assert(report.marked_missing() == 10);
  assert(report.present() == 10);
  assert(h.provisioning->ExistsCalls() == 20);
}

void TestStalledClaimsAreReported() {
  FulfillmentHarness h;
  auto               reconciler = MakeReconciler(h);

  assert(h.orchestrator->Run(NewKeyOrder("finished", 42)).result() == v1::FULFILLMENT_RESULT_FULFILLED);
  assert(h.guard->Claim("stuck"));

  assert(reconciler->AuditStalledPayments().empty());

  h.clock.Advance(std::chrono::minutes(20));
  auto stalled = reconciler->AuditStalledPayments();
  assert(stalled.size() == 1);
  assert(stalled[0].payment_id == "stuck");
  assert(stalled[0].kind == StalledPayment::Kind::Unfinished);
  assert(h.notifications->Operators().back().find("stuck") != std::string::npos);

  auto report = reconciler->ReconcileAll();
  assert(report.stalled_claims() == 1);
  assert(report.unclaimed_payments() == 0);
  assert(report.checked() == 1);
}

// Paid on the ledger, then the process died before fulfillment claimed it.
void TestPaidButNeverClaimedIsReported() {
  FulfillmentHarness h;
  auto               reconciler  = MakeReconciler(h);
  auto               ledger      = std::make_shared<keyshop::ledger::PendingLedger>(h.repository, FastRetry(), h.clock.Fn());
  auto               coordinator = std::make_shared<keyshop::ledger::CompletionCoordinator>(h.repository, FastRetry(), h.clock.Fn());

  assert(ledger->CreateOrRefreshIntent(NewKeyOrder("p9", 42)));
  assert(coordinator->CompleteIfPending("p9").has_value());
  assert(!coordinator->CompleteIfPending("p9").has_value());

  assert(reconciler->AuditStalledPayments().empty());

  h.clock.Advance(std::chrono::hours(2));
  auto stalled = reconciler->AuditStalledPayments();
  assert(stalled.size() == 1);
  assert(stalled[0].payment_id == "p9");
  assert(stalled[0].kind == StalledPayment::Kind::Unclaimed);
  assert(h.notifications->Operators().size() == 1);
  assert(h.notifications->Operators().back().find("p9") != std::string::npos);

  // recovering by hand clears it
  assert(h.orchestrator->Run(NewKeyOrder("p9", 42)).result() == v1::FULFILLMENT_RESULT_FULFILLED);
  assert(reconciler->AuditStalledPayments().empty());
}

void TestStalledPaymentsAlertOnce() {
  FulfillmentHarness h;
  auto               reconciler = MakeReconciler(h);

  assert(h.guard->Claim("stuck-1"));
  h.clock.Advance(std::chrono::minutes(20));

  assert(reconciler->ReconcileAll().stalled_claims() == 1);
  assert(h.notifications->Operators().size() == 1);

  assert(reconciler->ReconcileAll().stalled_claims() == 1);
  assert(reconciler->AuditStalledPayments().size() == 1);
  assert(h.notifications->Operators().size() == 1);

  assert(h.guard->Claim("stuck-2"));
  h.clock.Advance(std::chrono::minutes(20));
  assert(reconciler->ReconcileAll().stalled_claims() == 2);
  assert(h.notifications->Operators().size() == 2);
  assert(h.notifications->Operators().back().find("stuck-2") != std::string::npos);
  assert(h.notifications->Operators().back().find("stuck-1") == std::string::npos);
}

void TestOptionsFromConfig() {
  keyshop::runtime::config::ReconciliationConfig config;
  auto                                           defaults = keyshop::reconcile::OptionsFromConfig(config);
  assert(defaults.grace_window == std::chrono::hours(24));
  assert(defaults.max_concurrency == 8);

  config.set_grace_window_sec(3600);
  config.set_max_concurrency(2);
  config.set_stalled_claim_after_sec(60);
  auto options = keyshop::reconcile::OptionsFromConfig(config);
  assert(options.grace_window == std::chrono::hours(1));
  assert(options.max_concurrency == 2);
  assert(options.stalled_claim_after == std::chrono::minutes(1));
}

} // namespace

int main() {
  TestReappearanceWithinGraceClearsMark();
  TestContinuousAbsenceDeletesAfterGrace();
  TestUnknownNeverAdvancesTowardDeletion();
  TestDeleteNeedsSecondAbsentAnswer();
  TestConcurrentExtensionPreventsDelete();
  TestSweepFansOutOverAllCredentials();
  TestStalledClaimsAreReported();
  TestPaidButNeverClaimedIsReported();
  TestStalledPaymentsAlertOnce();
  TestOptionsFromConfig();

  std::cout << "keyshop_unit_reconciler: pass\n";
  return 0;
}
