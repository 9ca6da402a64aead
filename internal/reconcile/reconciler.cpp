#include "reconciler.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace keyshop::reconcile {

using hysteresis::Decision;

namespace v1 = keyshop::ledger::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

void RecordOutcomes(const v1::ReconcileReport& report) {
  auto& metrics = observability::Metrics::Instance();
  metrics.RecordReconcileOutcome("present", report.present());
  metrics.RecordReconcileOutcome("cleared", report.cleared());
  metrics.RecordReconcileOutcome("marked_missing", report.marked_missing());
  metrics.RecordReconcileOutcome("deleted", report.deleted());
  metrics.RecordReconcileOutcome("unknown", report.unknown());
}

} // namespace

ReconcilerOptions OptionsFromConfig(const keyshop::runtime::config::ReconciliationConfig& config) {
  ReconcilerOptions options;
  if (config.grace_window_sec() > 0) options.grace_window = std::chrono::seconds(config.grace_window_sec());
  if (config.max_concurrency() > 0) options.max_concurrency = config.max_concurrency();
  if (config.stalled_claim_after_sec() > 0) options.stalled_claim_after = std::chrono::seconds(config.stalled_claim_after_sec());
  return options;
}

Reconciler::Reconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<provisioning::ProvisioningClient> provisioning,
                       std::shared_ptr<notify::NotificationSink> notifications, ReconcilerOptions options, db::RetryPolicy retry, util::NowFn now)
    : repository_(std::move(repository)),
      provisioning_(std::move(provisioning)),
      notifications_(std::move(notifications)),
      options_(options),
      retry_(retry),
      now_(std::move(now)) {
}

v1::ReconcileReport Reconciler::ReconcileOwner(int64_t owner_id) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       credentials = db::RunWithRetry(retry_, "ListCredentialsForOwner", [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListCredentialsForOwner(*tx, owner_id);
    tx->Commit();
    return rows;
  });

  auto report = Sweep(credentials);
  RecordOutcomes(report);
  observability::Metrics::Instance().ObserveSweepDurationMs("owner", ElapsedMs(started_at));
  KEYSHOP_LOG_INFO("owner reconciled", {observability::IntField("owner_id", owner_id), observability::IntField("checked", report.checked()),
                                        observability::IntField("deleted", report.deleted())});
  return report;
}

v1::ReconcileReport Reconciler::ReconcileAll() {
  const auto started_at = std::chrono::steady_clock::now();
  auto       credentials = db::RunWithRetry(retry_, "ListCredentials", [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListCredentials(*tx);
    tx->Commit();
    return rows;
  });

  auto report = Sweep(credentials);
  for (const auto& payment : AuditStalledPayments()) {
    if (payment.kind == StalledPayment::Kind::Unclaimed) {
      report.set_unclaimed_payments(report.unclaimed_payments() + 1);
    } else {
      report.set_stalled_claims(report.stalled_claims() + 1);
    }
  }
  RecordOutcomes(report);
  observability::Metrics::Instance().ObserveSweepDurationMs("all", ElapsedMs(started_at));

  KEYSHOP_LOG_INFO("reconciliation sweep finished",
                   {observability::IntField("checked", report.checked()), observability::IntField("present", report.present()),
                    observability::IntField("marked_missing", report.marked_missing()), observability::IntField("cleared", report.cleared()),
                    observability::IntField("deleted", report.deleted()), observability::IntField("unknown", report.unknown()),
                    observability::IntField("stalled_claims", report.stalled_claims()),
                    observability::IntField("unclaimed_payments", report.unclaimed_payments())});
  if (report.deleted() > 0) {
    notifications_->NotifyOperators("Reconciliation removed " + std::to_string(report.deleted()) +
                                    " credential(s) missing from the panel past the grace window.");
  }
  return report;
}

std::vector<StalledPayment> Reconciler::AuditStalledPayments() {
  const int64_t cutoff = util::ToUnixMillis(now_()) - options_.stalled_claim_after.count();

  auto stalled = db::RunWithRetry(retry_, "AuditStalledPayments", [&] {
    std::vector<StalledPayment> rows;
    auto                        tx = repository_->Begin();
    for (const auto& intent : repository_->ListPaidWithoutClaim(*tx, cutoff)) {
      rows.push_back({intent.payment_id, StalledPayment::Kind::Unclaimed, intent.updated_at_ms});
    }
    for (const auto& claim : repository_->ListClaimsWithoutResult(*tx, cutoff)) {
      rows.push_back({claim.payment_id, StalledPayment::Kind::Unfinished, claim.claimed_at_ms});
    }
    tx->Commit();
    return rows;
  });

  std::vector<const StalledPayment*> fresh;
  {
    std::lock_guard       lock(alerted_mutex_);
    std::set<std::string> still_stalled;
    for (const auto& payment : stalled) {
      still_stalled.insert(payment.payment_id);
      if (!alerted_.contains(payment.payment_id)) fresh.push_back(&payment);
    }
    // ids that recovered may alert again if they stall later
    alerted_ = std::move(still_stalled);
  }

  const auto unclaimed = static_cast<std::uint64_t>(
      std::count_if(stalled.begin(), stalled.end(), [](const StalledPayment& p) { return p.kind == StalledPayment::Kind::Unclaimed; }));
  observability::Metrics::Instance().SetStalledPayments("unclaimed", unclaimed);
  observability::Metrics::Instance().SetStalledPayments("unfinished", stalled.size() - unclaimed);

  for (const auto& payment : stalled) {
    KEYSHOP_LOG_WARN("stalled payment", {observability::StringField("payment_id", payment.payment_id),
                                         observability::StringField("kind", payment.kind == StalledPayment::Kind::Unclaimed ? "unclaimed" : "unfinished"),
                                         observability::IntField("since_ms", payment.since_ms)});
  }
  if (fresh.empty()) return stalled;

  std::string message = "Paid orders without a fulfillment result (manual check needed):";
  for (const auto* payment : fresh) {
    message += "\n" + payment->payment_id + (payment->kind == StalledPayment::Kind::Unclaimed ? " paid " : " claimed ") +
               util::FormatIso8601(payment->since_ms) + (payment->kind == StalledPayment::Kind::Unclaimed ? ", never fulfilled" : "");
  }
  notifications_->NotifyOperators(message);
  return stalled;
}

v1::ReconcileReport Reconciler::Sweep(const std::vector<db::model::CredentialRecord>& credentials) {
  v1::ReconcileReport report;
  std::mutex          report_mutex;
  std::atomic<size_t> next{0};

  auto work = [&] {
    for (size_t i = next++; i < credentials.size(); i = next++) {
      Outcome outcome;
      try {
        outcome = Check(credentials[i]);
      } catch (const std::exception& e) {
        KEYSHOP_LOG_ERROR("credential check failed", {observability::IntField("credential_id", credentials[i].credential_id),
                                                       observability::StringField("error", e.what())});
        outcome = Outcome::Unknown;
      }

      std::lock_guard lock(report_mutex);
      report.set_checked(report.checked() + 1);
      switch (outcome) {
        case Outcome::Present:
          report.set_present(report.present() + 1);
          break;
        case Outcome::Cleared:
          report.set_present(report.present() + 1);
          report.set_cleared(report.cleared() + 1);
          break;
        case Outcome::MarkedMissing:
          report.set_marked_missing(report.marked_missing() + 1);
          break;
        case Outcome::AbsentWithinGrace:
          break;
        case Outcome::Deleted:
          report.set_deleted(report.deleted() + 1);
          break;
        case Outcome::Unknown:
          report.set_unknown(report.unknown() + 1);
          break;
      }
    }
  };

  const size_t fan_out = std::min<size_t>(std::max(1u, options_.max_concurrency), credentials.size());
  if (fan_out <= 1) {
    work();
    return report;
  }

  std::vector<std::thread> threads;
  threads.reserve(fan_out);
  for (size_t i = 0; i < fan_out; ++i) threads.emplace_back(work);
  for (auto& thread : threads) thread.join();
  return report;
}

Reconciler::Outcome Reconciler::Check(const db::model::CredentialRecord& credential) {
  const auto presence = provisioning_->Exists(credential.unique_identity, credential.remote_uuid, credential.provider_host);
  const auto now_ms   = util::ToUnixMillis(now_());
  const auto decision = hysteresis::Decide(presence, credential.missing_since_ms, now_ms, options_.grace_window.count());

  switch (decision) {
    case Decision::Keep:
      if (presence == provisioning::Presence::Present) return Outcome::Present;
      if (presence == provisioning::Presence::Absent) return Outcome::AbsentWithinGrace;
      return Outcome::Unknown;

    case Decision::ClearMissing:
      return ClearMissing(credential.credential_id) ? Outcome::Cleared : Outcome::Present;

    case Decision::MarkMissing:
      return MarkMissing(credential.credential_id, now_ms) ? Outcome::MarkedMissing : Outcome::AbsentWithinGrace;

    case Decision::DeleteCandidate: {
      // a second answer guards against a panel listing that flickers
      const auto confirm = provisioning_->Exists(credential.unique_identity, credential.remote_uuid, credential.provider_host);
      if (confirm == provisioning::Presence::Present) {
        return ClearMissing(credential.credential_id) ? Outcome::Cleared : Outcome::Present;
      }
      if (confirm == provisioning::Presence::Unknown) return Outcome::Unknown;
      return DeleteIfUnchanged(credential) ? Outcome::Deleted : Outcome::AbsentWithinGrace;
    }
  }
  return Outcome::Unknown;
}

bool Reconciler::ClearMissing(int64_t credential_id) {
  return db::RunWithRetry(retry_, "ClearMissing", [&] {
    auto tx  = repository_->Begin();
    auto row = repository_->GetCredential(*tx, credential_id);
    if (!row || !row->missing_since_ms) {
      tx->Rollback();
      return false;
    }
    auto result = repository_->SetCredentialMissingSince(*tx, credential_id, std::nullopt);
    if (!result) throw db::DatabaseError(result.code, "clear missing_since: " + result.message);
    tx->Commit();
    return true;
  });
}

bool Reconciler::MarkMissing(int64_t credential_id, int64_t now_ms) {
  const bool marked = db::RunWithRetry(retry_, "MarkMissing", [&] {
    auto tx  = repository_->Begin();
    auto row = repository_->GetCredential(*tx, credential_id);
    if (!row || row->missing_since_ms) {
      tx->Rollback();
      return false;
    }
    auto result = repository_->SetCredentialMissingSince(*tx, credential_id, now_ms);
    if (!result) throw db::DatabaseError(result.code, "set missing_since: " + result.message);
    tx->Commit();
    return true;
  });

  if (marked) KEYSHOP_LOG_INFO("credential missing remotely", {observability::IntField("credential_id", credential_id)});
  return marked;
}

bool Reconciler::DeleteIfUnchanged(const db::model::CredentialRecord& observed) {
  const bool deleted = db::RunWithRetry(retry_, "DeleteCredential", [&] {
    auto tx  = repository_->Begin();
    auto row = repository_->GetCredential(*tx, observed.credential_id);

    // an extension in the meantime rewrites updated_at and clears missing_since
    if (!row || row->missing_since_ms != observed.missing_since_ms || row->updated_at_ms != observed.updated_at_ms) {
      tx->Rollback();
      return false;
    }
    auto result = repository_->DeleteCredential(*tx, observed.credential_id);
    if (!result) throw db::DatabaseError(result.code, "delete credential: " + result.message);
    tx->Commit();
    return true;
  });

  if (deleted) {
    KEYSHOP_LOG_WARN("credential deleted after grace window",
                     {observability::IntField("credential_id", observed.credential_id), observability::IntField("owner_id", observed.owner_id),
                      observability::StringField("identity", observed.unique_identity), observability::StringField("host", observed.provider_host)});
  }
  return deleted;
}

} // namespace keyshop::reconcile
