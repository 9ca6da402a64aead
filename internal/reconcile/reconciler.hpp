#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/notify/notification_sink.hpp"
#include "internal/provisioning/provisioning_client.hpp"
#include "internal/reconcile/hysteresis.hpp"
#include "internal/util/time.hpp"
#include "keyshop/ledger/v1.hpp"

namespace keyshop::reconcile {

struct ReconcilerOptions {
  std::chrono::milliseconds grace_window{std::chrono::hours(24)};
  unsigned                  max_concurrency = 8;
  // paid intents or claims this old without a terminal outcome are stalled
  std::chrono::milliseconds stalled_claim_after{std::chrono::minutes(15)};
};

struct StalledPayment {
  enum class Kind {
    Unclaimed,  // ledger row paid, fulfillment never claimed it
    Unfinished, // claimed, no terminal result recorded
  };

  std::string payment_id;
  Kind        kind     = Kind::Unfinished;
  int64_t     since_ms = 0;
};

ReconcilerOptions OptionsFromConfig(const keyshop::runtime::config::ReconciliationConfig& config);

/*
  Compares local credentials with the provisioning panel.

  Remote checks run outside any transaction with bounded fan-out. Each
  decision is applied in its own short transaction that re-reads the row
  and only touches missing_since_ms, except for the final delete which
  requires a second "absent" answer and an unchanged row.
*/
class Reconciler {
 public:
  Reconciler(std::shared_ptr<db::Repository> repository, std::shared_ptr<provisioning::ProvisioningClient> provisioning,
             std::shared_ptr<notify::NotificationSink> notifications, ReconcilerOptions options = {}, db::RetryPolicy retry = {},
             util::NowFn now = util::SystemNow());

  keyshop::ledger::v1::ReconcileReport ReconcileOwner(int64_t owner_id);

  // Every credential, followed by the stalled-payment audit.
  keyshop::ledger::v1::ReconcileReport ReconcileAll();

  // Paid intents that were never claimed and claims without a terminal
  // fulfillment outcome. Operators hear about each payment id once, the
  // first time it shows up here; the returned list is always complete.
  std::vector<StalledPayment> AuditStalledPayments();

 private:
  enum class Outcome { Present, Cleared, MarkedMissing, AbsentWithinGrace, Deleted, Unknown };

  keyshop::ledger::v1::ReconcileReport Sweep(const std::vector<db::model::CredentialRecord>& credentials);

  Outcome Check(const db::model::CredentialRecord& credential);

  bool ClearMissing(int64_t credential_id);
  bool MarkMissing(int64_t credential_id, int64_t now_ms);
  bool DeleteIfUnchanged(const db::model::CredentialRecord& observed);

  std::shared_ptr<db::Repository>                   repository_;
  std::shared_ptr<provisioning::ProvisioningClient> provisioning_;
  std::shared_ptr<notify::NotificationSink>         notifications_;
  ReconcilerOptions                                 options_;
  db::RetryPolicy                                   retry_;
  util::NowFn                                       now_;

  std::mutex            alerted_mutex_;
  std::set<std::string> alerted_;
};

} // namespace keyshop::reconcile
